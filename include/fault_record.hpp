/*
 * Fault Records
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

#include "config.hpp"
#include "source_location.hpp"

// The description of a fault as seen at the fault site.
//
// A Fault_record is created exactly once per fault, by the code that detected it, and handed to the panic
// handler by const reference. It has no setters and cannot be assigned to, so the handler sees exactly what
// the fault site supplied.
//
// Both attributes are optional. The fault site may not have a message, and minimal-footprint builds drop
// messages (CFG_PANIC_MESSAGES) or locations (CFG_PANIC_LOCATIONS) entirely. The record does not own the
// message text. The text lives in the stack frame of the fault site or in read-only data and stays valid,
// because the handler never returns.
class Fault_record
{
private:
    char const* message_{nullptr};
    Source_location location_;

public:
    constexpr Fault_record(char const* message, Source_location const& location)
        : message_(CFG_PANIC_MESSAGES ? message : nullptr),
          location_(CFG_PANIC_LOCATIONS ? location : Source_location{})
    {
    }

    constexpr explicit Fault_record(Source_location const& location) : Fault_record(nullptr, location) {}

    // A fault without location information.
    constexpr explicit Fault_record(char const* message) : Fault_record(message, Source_location{}) {}

    // Copying is allowed so that test handlers can keep a snapshot. Nothing can change a record after
    // construction.
    Fault_record(Fault_record const&) = default;
    Fault_record& operator=(Fault_record const&) = delete;
    Fault_record& operator=(Fault_record&&) = delete;

    constexpr bool has_message() const { return message_ != nullptr; }
    constexpr bool has_location() const { return location_.is_known(); }

    // The fault message. Only valid if has_message() is true.
    constexpr char const* message() const { return message_; }

    // Where the fault was raised. Only valid if has_location() is true.
    constexpr Source_location const& location() const { return location_; }
};
