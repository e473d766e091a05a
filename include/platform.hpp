/*
 * Platform Control
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
 *
 * Copyright (C) 2024 Cyberus Technology GmbH.
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

#include "compiler.hpp"

// The terminal actions available to fault handlers.
//
// In freestanding builds these act on the CPU and the chipset directly. In hosted builds they act on the
// calling thread or process instead. See platform.cpp for the details of each environment.

// Stop the current thread of execution forever.
//
// On bare metal, this disables interrupts and halts the CPU. On a host, the calling thread sleeps forever.
[[noreturn]] COLD void halt();

// Execute the trap instruction.
[[noreturn]] inline void trap() { __builtin_trap(); }

// Reset the whole system.
//
// On bare metal, this tries the reset control register and the keyboard controller and halts if neither
// works. On a host, the process exits immediately with CFG_RESET_EXIT_STATUS.
[[noreturn]] COLD void reset_system();

// Tell the CPU that we are in a busy loop and that it can chill out.
//
// This function is not called pause, because this clashes with a function in unistd.h.
inline void relax() { __builtin_ia32_pause(); }
