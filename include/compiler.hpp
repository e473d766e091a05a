/*
 * Compiler Macros
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
 *
 * Copyright (C) 2012-2013 Udo Steinberg, Intel Corporation.
 *
 * Copyright (C) 2018 Stefan Hertrampf, Cyberus Technology GmbH.
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

#define STRING(x...) #x
#define EXPAND(x) STRING(x)

#if defined(__GNUC__)

#if defined(__clang__)

#define COMPILER_STRING "clang " __clang_version__
#define COMPILER_VERSION (__clang_major__ * 100 + __clang_minor__ * 10 + __clang_patchlevel__)

// Source_location needs __builtin_COLUMN.
#if (COMPILER_VERSION < 900)
#error "Please upgrade clang to a supported version"
#endif

#else // GCC

#define COMPILER_STRING "gcc " __VERSION__

#if defined(__GNUC_PATCHLEVEL__)
#define COMPILER_VERSION (__GNUC__ * 100 + __GNUC_MINOR__ * 10 + __GNUC_PATCHLEVEL__)
#else
#define COMPILER_VERSION (__GNUC__ * 100 + __GNUC_MINOR__ * 10)
#endif

#if (COMPILER_VERSION < 800)
#error "Please upgrade GCC to a supported version"
#endif

#endif

// The column of the caller, for use in default arguments.
#if defined(__clang__)
#define CALLER_COLUMN __builtin_COLUMN()
#else
#define CALLER_COLUMN 0U
#endif

#define COLD __attribute__((cold))
#define UNREACHED __builtin_unreachable()

#define ALWAYS_INLINE __attribute__((always_inline))
#define FORMAT(X, Y) __attribute__((format(printf, (X), (Y))))

#define INIT_PRIORITY(X) __attribute__((init_priority((X))))
#define NOINLINE __attribute__((noinline))
#define NONNULL __attribute__((nonnull))
#define USED __attribute__((used))

#define EXPECT_FALSE(X) __builtin_expect(!!(X), 0)
#define EXPECT_TRUE(X) __builtin_expect(!!(X), 1)

#else
#error "Unknown compiler"
#endif
