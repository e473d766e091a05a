/*
 * Throwing Panic Handler for Unit Tests
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

#include "fault_capture.hpp"

#include <panic.hpp>

// The message text may live in the stack frame of the fault site, which is gone once the exception unwinds.
// Copy everything before throwing.
void panic_handler(Fault_record const& record)
{
    Caught_fault fault;

    if (record.has_message()) {
        fault.has_message = true;
        fault.message = record.message();
    }

    if (record.has_location()) {
        fault.has_location = true;
        fault.file = record.location().file_name();
        fault.line = record.location().line();
        fault.column = record.location().column();
    }

    throw fault;
}
