/*
 * Bounds-checked Array
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

#include "panic.hpp"
#include "types.hpp"

// A fixed-size array that panics on out-of-bounds accesses.
//
// This is an aggregate, so it can be initialized like a plain array:
//
// Checked_array<int, 3> const values{{1, 2, 3}};
//
// Use at() for element access. The panic reports the location of the at() call.
template <typename T, size_t N> struct Checked_array {
    static_assert(N > 0, "Checked_array cannot be empty");

    T elements[N];

    constexpr size_t size() const { return N; }

    T& at(size_t i, Source_location const& location = Source_location::current())
    {
        if (EXPECT_FALSE(i >= N)) {
            panic_index(N, i, location);
        }

        return elements[i];
    }

    T const& at(size_t i, Source_location const& location = Source_location::current()) const
    {
        if (EXPECT_FALSE(i >= N)) {
            panic_index(N, i, location);
        }

        return elements[i];
    }

    T* begin() { return &elements[0]; }
    T const* begin() const { return &elements[0]; }

    T* end() { return &elements[N]; }
    T const* end() const { return &elements[N]; }
};
