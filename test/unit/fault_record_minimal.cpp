/*
 * Fault Record Tests for Minimal-footprint Builds
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

// This file is built into its own test binary with messages and locations disabled.

#include <fault_record.hpp>

#include <catch2/catch.hpp>

static_assert(CFG_PANIC_MESSAGES == 0 and CFG_PANIC_LOCATIONS == 0, "Built with the wrong configuration");

TEST_CASE("Minimal builds drop fault messages", "[fault_record][footprint]")
{
    Fault_record const record{"this text is discarded", Source_location::current()};

    CHECK(not record.has_message());
}

TEST_CASE("Minimal builds drop fault locations", "[fault_record][footprint]")
{
    Fault_record const record{Source_location::current()};

    CHECK(not record.has_location());
}
