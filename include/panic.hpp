/*
 * Panic Handling
 *
 * Copyright (C) 2022 Julian Stecklina, Cyberus Technology GmbH.
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
#include "fault_record.hpp"
#include "types.hpp"

#include <stdarg.h>

// The panic handler of the program.
//
// This library only declares this function. Exactly one handler unit in the final link has to define it
// (see src/handler/). Linking no handler fails with an undefined reference and linking two fails with a
// multiple definition error. The function has C++ linkage on purpose: the mangled name includes the
// parameter type, so a function with the same name but a different signature does not count as a handler.
//
// The handler is called in whatever context the fault happened in. It must not allocate memory and must
// not return.
[[noreturn]] void panic_handler(Fault_record const& record);

// An unrecoverable error has occurred and execution cannot continue.
//
// Marks the program as faulted and transfers control to the panic handler. This is the only path into the
// handler.
[[noreturn]] COLD void panic(Fault_record const& record);

// Format a message and panic with it.
//
// The message is rendered into a stack buffer of CFG_PANIC_MESSAGE_SIZE bytes and truncated if it doesn't
// fit. The format string supports the same conversions as Console::print.
[[noreturn]] COLD FORMAT(2, 3) void panic(Source_location const& location, char const* format, ...);
[[noreturn]] COLD void vpanic(Source_location const& location, char const* format, va_list args);

// Panic with a formatted message at the current source location.
#define PANIC(format, ...) panic(Source_location::current(), format, ##__VA_ARGS__)

// Panics raised by the checked containers and arithmetic helpers. They live out of line to keep the
// message formatting out of the inlined fast paths.
[[noreturn]] COLD void panic_index(size_t len, size_t index, Source_location const& location);
[[noreturn]] COLD void panic_capacity(size_t capacity, Source_location const& location);
