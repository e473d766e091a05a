/*
 * Checked Arithmetic
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
#include "util.hpp"

// Integer arithmetic that panics instead of wrapping around or invoking undefined behavior.
//
// Both operands have to be of the same type. Mixing types would silently promote and hide the overflow we
// are trying to catch.

template <typename T> T checked_add(T a, T b, Source_location const& location = Source_location::current())
{
    T result;

    if (EXPECT_FALSE(__builtin_add_overflow(a, b, &result))) {
        panic(Fault_record{"attempt to add with overflow", location});
    }

    return result;
}

template <typename T> T checked_sub(T a, T b, Source_location const& location = Source_location::current())
{
    T result;

    if (EXPECT_FALSE(__builtin_sub_overflow(a, b, &result))) {
        panic(Fault_record{"attempt to subtract with overflow", location});
    }

    return result;
}

template <typename T> T checked_mul(T a, T b, Source_location const& location = Source_location::current())
{
    T result;

    if (EXPECT_FALSE(__builtin_mul_overflow(a, b, &result))) {
        panic(Fault_record{"attempt to multiply with overflow", location});
    }

    return result;
}

// Dividing the smallest signed value by -1 overflows, because the result is one larger than the largest
// value. This is exactly the case where negating the dividend overflows.
template <typename T> bool division_overflows(T a, T b)
{
    T negated;

    return is_signed<T>::value and b == static_cast<T>(-1) and __builtin_sub_overflow(T{0}, a, &negated);
}

template <typename T> T checked_div(T a, T b, Source_location const& location = Source_location::current())
{
    if (EXPECT_FALSE(b == 0)) {
        panic(Fault_record{"attempt to divide by zero", location});
    }

    if (EXPECT_FALSE(division_overflows(a, b))) {
        panic(Fault_record{"attempt to divide with overflow", location});
    }

    return a / b;
}

template <typename T> T checked_rem(T a, T b, Source_location const& location = Source_location::current())
{
    if (EXPECT_FALSE(b == 0)) {
        panic(Fault_record{"attempt to calculate the remainder with a divisor of zero", location});
    }

    if (EXPECT_FALSE(division_overflows(a, b))) {
        panic(Fault_record{"attempt to calculate the remainder with overflow", location});
    }

    return a % b;
}
