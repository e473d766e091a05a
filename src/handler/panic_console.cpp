/*
 * Panic Handler: Console Message
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

#include "atomic.hpp"
#include "console.hpp"
#include "panic.hpp"
#include "platform.hpp"

namespace
{

// Set by the first fault that reaches this handler.
bool reported;

// How long to wait for another CPU to finish printing.
constexpr unsigned CONSOLE_IDLE_ATTEMPTS{1U << 20};

void report(Fault_record const& record)
{
    if (record.has_message() and record.has_location()) {
        Source_location const& loc{record.location()};
        Console::print("panicked at '%s', %s:%u:%u", record.message(), loc.file_name(), loc.line(),
                       loc.column());
    } else if (record.has_message()) {
        Console::print("panicked at '%s'", record.message());
    } else if (record.has_location()) {
        Source_location const& loc{record.location()};
        Console::print("panicked at %s:%u:%u", loc.file_name(), loc.line(), loc.column());
    } else {
        Console::print("panicked");
    }
}

} // namespace

// Print the fault on all consoles and halt.
//
// Only the first fault is reported. Any later fault, from another CPU or from the console code itself while it
// reports the first one, halts without touching the consoles. A first fault raised while the faulting CPU
// prints finds the consoles busy and halts silently as well, because waiting for the console lock would never
// end.
void panic_handler(Fault_record const& record)
{
    if (not Atomic::exchange(reported, true) and Console::wait_until_idle(CONSOLE_IDLE_ATTEMPTS)) {
        report(record);
    }

    halt();
}
