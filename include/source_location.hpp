/*
 * Source Locations
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

#include "compiler.hpp"

// A position in the source code.
//
// This is a freestanding replacement for std::source_location. Functions that can raise a fault take a
// Source_location parameter that defaults to Source_location::current(). The builtins in the default
// arguments are evaluated at the call site, so the fault names the caller instead of the library function:
//
// int& at(size_t i, Source_location const& location = Source_location::current());
//
// GCC has no builtin for the column in C++17. Its locations carry column 0, which means the column is unknown.
class Source_location
{
private:
    char const* file_{nullptr};
    unsigned line_{0};
    unsigned column_{0};

public:
    // An unknown location. See Fault_record::has_location().
    constexpr Source_location() = default;

    constexpr Source_location(char const* file, unsigned line, unsigned column)
        : file_(file), line_(line), column_(column)
    {
    }

    static constexpr Source_location current(char const* file = __builtin_FILE(),
                                             unsigned line = __builtin_LINE(),
                                             unsigned column = CALLER_COLUMN)
    {
        return {file, line, column};
    }

    constexpr bool is_known() const { return file_ != nullptr; }

    constexpr char const* file_name() const { return file_; }
    constexpr unsigned line() const { return line_; }
    constexpr unsigned column() const { return column_; }
};
