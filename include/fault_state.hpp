/*
 * Fault State
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

#include "atomic.hpp"

// The global fault state of the program.
//
// The program starts out Normal and becomes Faulted when the first fault is dispatched. There is no way back.
// A handler that resets the system starts a fresh program in the Normal state.
//
// The state is global and not per CPU or thread. Concurrent faults all count towards the same state and each
// of them is dispatched to the panic handler.
class Fault_state
{
private:
    static unsigned faults;

public:
    // Record a new fault. Returns the number of faults that were dispatched before this one.
    static unsigned enter() { return Atomic::fetch_add(faults, 1U); }

    static bool faulted() { return count() != 0; }

    // The number of faults dispatched so far.
    static unsigned count() { return Atomic::load(faults); }
};
