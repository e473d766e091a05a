/*
 * Example: Out-of-Bounds Index
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

#include "checked_array.hpp"
#include "stdio.hpp"

// Reads one element past the end of a three element array. With the console handler bound, this prints
//
//   panicked at 'index out of bounds: the len is 3 but the index is 4', .../main.cpp:<line>:<column>
//
// and halts. With the halt handler, it halts silently.
int main()
{
    Checked_array<int, 3> const values{{0, 1, 2}};

    trace(TRACE_EXAMPLE, "Reading element %lu of %lu", values.size() + 1, values.size());

    return values.at(values.size() + 1);
}
