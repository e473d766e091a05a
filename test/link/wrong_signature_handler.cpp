/*
 * Link Test: Handler With the Wrong Signature
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

#include "platform.hpp"

// Looks like a panic handler, but takes a string instead of a fault record. Linking this must not satisfy
// the dispatch point.
[[noreturn]] void panic_handler(char const*);

void panic_handler(char const*) { halt(); }
