/*
 * Buffer Console
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

#include "console_buffer.hpp"

// This console is used while a panic message is formatted. It must not raise faults itself, so a buffer
// without room for the terminator is treated as full instead of failing an assertion.
Console_buffer::Console_buffer(char* buffer_, size_t capacity_) : buffer(buffer_), capacity(capacity_)
{
    if (capacity > 0) {
        buffer[0] = '\0';
    }
}

void Console_buffer::putc(int c)
{
    if (EXPECT_FALSE(used + 1 >= capacity)) {
        truncated_ = true;
        return;
    }

    buffer[used++] = static_cast<char>(c);
    buffer[used] = '\0';
}

char const* Console_buffer::render(char const* format, ...)
{
    va_list ap;

    va_start(ap, format);
    char const* const result{vrender(format, ap)};
    va_end(ap);

    return result;
}

char const* Console_buffer::vrender(char const* format, va_list args)
{
    vformat(format, args);

    return buffer;
}
