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

#pragma once

#include "console.hpp"

// A console that renders into a caller-provided character buffer.
//
// This console is never enabled. It exists to reuse the console formatter for strings, e.g. for panic
// messages. Output that does not fit is dropped and the buffer always stays NUL terminated.
class Console_buffer : public Console
{
private:
    char* buffer;
    size_t capacity;
    size_t used{0};
    bool truncated_{false};

    void putc(int c) override;

public:
    // The buffer must have room for at least the terminating NUL character.
    Console_buffer(char* buffer_, size_t capacity_);

    // Append formatted text and return the start of the buffer.
    FORMAT(2, 3) char const* render(char const* format, ...);
    char const* vrender(char const* format, va_list args);

    size_t length() const { return used; }

    // Whether any output was dropped because the buffer was full.
    bool truncated() const { return truncated_; }
};
