/*
 * Link Test Program
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

#include "panic.hpp"

// The build of this program only succeeds if exactly one panic handler with the right signature is linked
// in. It is never run.
int main(int argc, char**)
{
    if (argc > 1) {
        PANIC("unexpected arguments: %d", argc - 1);
    }

    return 0;
}
