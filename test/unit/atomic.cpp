/*
 * Atomic Tests
 *
 * Copyright (C) 2019 Julian Stecklina, Cyberus Technology GmbH.
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

#include <catch2/catch.hpp>

#include "atomic.hpp"

TEST_CASE("Atomic read-modify-write operations return the old value")
{
    const unsigned old_value{128};
    unsigned value_to_modify{old_value};

    SECTION("fetch_add")
    {
        CHECK(Atomic::fetch_add(value_to_modify, 1U) == old_value);
        CHECK(Atomic::load(value_to_modify) == old_value + 1);
    };

    SECTION("exchange")
    {
        CHECK(Atomic::exchange(value_to_modify, 7U) == old_value);
        CHECK(Atomic::load(value_to_modify) == 7U);
    };
}

TEST_CASE("Exchanging a flag lets exactly one caller win")
{
    bool flag{false};

    CHECK_FALSE(Atomic::exchange(flag, true));
    CHECK(Atomic::exchange(flag, true));
}
