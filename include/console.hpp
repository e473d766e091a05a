/*
 * Generic Console
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

#include "compiler.hpp"
#include "spinlock.hpp"
#include "types.hpp"

#include <stdarg.h>

// A character output device.
//
// Enabled consoles form a list. Console::print writes a line to every console on the list. Concrete consoles
// only implement putc.
//
// The formatter understands a printf subset: %c %s %d %u %x %p, the l length modifier, field width, zero
// padding, precision for strings and the alternate form (#) for hexadecimal numbers. Console::print does not
// allocate memory and is safe to call from fault handlers.
class Console
{
private:
    enum
    {
        MODE_FLAGS = 0,
        MODE_WIDTH = 1,
        MODE_PRECS = 2,
    };

    enum
    {
        FLAG_SIGNED = 1U << 0,
        FLAG_ALT_FORM = 1U << 1,
        FLAG_ZERO_PAD = 1U << 2,
    };

    static Console* list;
    static Spinlock lock;

    Console* next{nullptr};

    void print_num(uint64 val, unsigned base, unsigned width, unsigned flags);
    void print_str(char const* s, unsigned width, unsigned precs);

    // Render a line including the trailing newline.
    void vprintf(char const* format, va_list args);

protected:
    virtual void putc(int c) = 0;

    // Render the format string without a trailing newline.
    void vformat(char const* format, va_list args);

    // Add this console to the list of consoles that receive print output.
    void enable();

public:
    // Print a line on all enabled consoles.
    FORMAT(1, 2) static void print(char const* format, ...);
    static void vprint(char const* format, va_list ap);

    // Wait for the consoles to become idle. Returns false if they are still busy after the given number of
    // attempts. A fault raised while printing leaves the consoles busy for good.
    static bool wait_until_idle(unsigned attempts);
};
