/*
 * Fault Capture for Unit Tests
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

#include <catch2/catch.hpp>
#include <string>

// A snapshot of the Fault_record that reached the panic handler.
//
// The unit tests bind a panic handler that throws this snapshot. The handler still never returns to the fault
// site, but the test can catch the exception and inspect what the fault site supplied.
struct Caught_fault {
    bool has_message{false};
    std::string message;

    bool has_location{false};
    std::string file;
    unsigned line{0};
    unsigned column{0};
};

// Run the given function and return the fault it raised. Fails the test if no fault was raised.
template <typename F> Caught_fault catch_fault(F&& f)
{
    try {
        f();
    } catch (Caught_fault const& fault) {
        return fault;
    }

    FAIL("No fault was raised");
    return {};
}
