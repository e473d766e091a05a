/*
 * Panic Handler: Silent Halt
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

#include "panic.hpp"
#include "platform.hpp"

// The smallest possible handler: stop and say nothing. The record stays in registers or on the stack for a
// debugger to find.
void panic_handler(Fault_record const& record)
{
    asm volatile("" : : "r"(&record) : "memory");

    halt();
}
