/*
 * Standard I/O
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
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

#pragma once

#include "console.hpp"
#include "string.hpp"

// Emit a log message to all configured consoles.
//
// The first parameter is one of the TRACE_ values defined below. Messages will only be printed, if the trace
// value is included in trace_mask.
//
// Do not trace from the panic path. A fault raised while the console lock is held would deadlock.
#define trace(T, format, ...)                                                                                \
    do {                                                                                                     \
        if (EXPECT_FALSE((trace_mask & (T)) == (T))) {                                                       \
            Console::print("[%s:%d] " format, FILENAME, __LINE__, ##__VA_ARGS__);                            \
        }                                                                                                    \
    } while (0)

// Possible trace events.
enum
{
    TRACE_CONSOLE = 1UL << 0,
    TRACE_EXAMPLE = 1UL << 1,
    TRACE_ERROR = 1UL << 31,
};

// Enabled trace events.
constexpr unsigned trace_mask =
#ifdef DEBUG
    TRACE_CONSOLE |
#endif
    TRACE_EXAMPLE | TRACE_ERROR;
