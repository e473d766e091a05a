/*
 * Standard Error Console
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

#include "console_stderr.hpp"

#include <errno.h>
#include <unistd.h>

// Enable the console before any other static constructor can print.
Console_stderr Console_stderr::con INIT_PRIORITY(101);

Console_stderr::Console_stderr() { enable(); }

void Console_stderr::putc(int c)
{
    line[used++] = static_cast<char>(c);

    if (c == '\n' or used == sizeof(line)) {
        flush();
    }
}

void Console_stderr::flush()
{
    char const* pos{line};

    while (used > 0) {
        ssize_t const written{write(STDERR_FILENO, pos, used)};

        if (written < 0 and errno == EINTR) {
            continue;
        }

        // There is nobody to report a broken stderr to. Drop the line.
        if (written <= 0) {
            break;
        }

        pos += written;
        used -= static_cast<size_t>(written);
    }

    used = 0;
}
