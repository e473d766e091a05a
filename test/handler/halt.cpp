/*
 * Halt Panic Handler Tests
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

#include "child_process.hpp"

#include <assert.hpp>
#include <checked_array.hpp>
#include <checked_math.hpp>
#include <fault_state.hpp>
#include <panic.hpp>

// This binary is linked against the halt panic handler.

using namespace std::chrono_literals;

TEST_CASE("A fault halts silently", "[handler][halt]")
{
    Child_process child{[] {
        PANIC("nobody will read this");
        mark_reached();
    }};

    CHECK(not child.wait_for_exit(300ms));
    child.kill();

    CHECK(child.output().empty());
}

TEST_CASE("Faults raised by checks halt", "[handler][halt]")
{
    SECTION("out-of-bounds index")
    {
        Checked_array<int, 3> const values{{0, 1, 2}};
        size_t volatile const index{4};

        Child_process child{[&] {
            static_cast<void>(values.at(index));
            mark_reached();
        }};

        CHECK(not child.wait_for_exit(300ms));
        child.kill();

        CHECK(child.output().empty());
    }

    SECTION("assertion")
    {
        Child_process child{[] {
            int volatile const zero{0};
            verify(zero == 1);
            mark_reached();
        }};

        CHECK(not child.wait_for_exit(300ms));
        child.kill();

        CHECK(child.output().empty());
    }

    SECTION("overflow")
    {
        Child_process child{[] {
            unsigned volatile const big{~0U};
            static_cast<void>(checked_add(big, 1U));
            mark_reached();
        }};

        CHECK(not child.wait_for_exit(300ms));
        child.kill();

        CHECK(child.output().empty());
    }
}

TEST_CASE("Signals don't wake a halted program", "[handler][halt]")
{
    Child_process child{[] {
        signal(SIGUSR1, [](int) {});
        unreachable();
    }};

    REQUIRE(not child.wait_for_exit(100ms));

    child.send_signal(SIGUSR1);
    CHECK(not child.wait_for_exit(200ms));
    child.kill();

    CHECK(child.output().empty());
}
