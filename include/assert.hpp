/*
 * Assertions
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

#include "panic.hpp"

// Assertions are always compiled unless they are marked as slow. Slow assertions will not be included in
// release builds for performance reasons.
//
// We don't reuse the name assert, because hosted builds pull in the libc macro of that name through
// standard headers.
#define verify(X)                                                                                            \
    do {                                                                                                     \
        if (EXPECT_FALSE(!(X))) {                                                                            \
            panic(Fault_record{"assertion failed: " #X, Source_location::current()});                       \
        }                                                                                                    \
    } while (0)

#ifdef NDEBUG
#define verify_slow(X)                                                                                       \
    do {                                                                                                     \
    } while (0)
#else
#define verify_slow(X) verify(X)
#endif

// Mark code that must never execute.
[[noreturn]] COLD void unreachable(Source_location const& location = Source_location::current());
