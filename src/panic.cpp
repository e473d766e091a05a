/*
 * Panic Handling
 *
 * Copyright (C) 2022 Julian Stecklina, Cyberus Technology GmbH.
 *
 * This file is part of Deadstop.
 *
 * Deadstop is free software: you can redistribute it and/or modify it
 * under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * Deadstop is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License version 2 for more details.
 */

#include "panic.hpp"
#include "assert.hpp"
#include "console_buffer.hpp"
#include "fault_state.hpp"

// Nothing on this path allocates memory or takes locks. It may run with a broken heap, with interrupts
// disabled or while the faulting code holds arbitrary locks.
void panic(Fault_record const& record)
{
    Fault_state::enter();
    panic_handler(record);
}

void panic(Source_location const& location, char const* format, ...)
{
    va_list ap;

    va_start(ap, format);
    vpanic(location, format, ap);
    va_end(ap);
}

void vpanic(Source_location const& location, char const* format, va_list args)
{
    if (not CFG_PANIC_MESSAGES) {
        panic(Fault_record{location});
    }

    char message[CFG_PANIC_MESSAGE_SIZE];
    Console_buffer buffer{message, sizeof(message)};

    panic(Fault_record{buffer.vrender(format, args), location});
}

void panic_index(size_t len, size_t index, Source_location const& location)
{
    panic(location, "index out of bounds: the len is %lu but the index is %lu", static_cast<unsigned long>(len),
          static_cast<unsigned long>(index));
}

void panic_capacity(size_t capacity, Source_location const& location)
{
    panic(location, "capacity overflow: the capacity is %lu", static_cast<unsigned long>(capacity));
}

void unreachable(Source_location const& location)
{
    panic(Fault_record{"internal error: entered unreachable code", location});
}
