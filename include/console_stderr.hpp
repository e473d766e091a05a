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

#pragma once

#include "console.hpp"

#if !__STDC_HOSTED__
#error "The stderr console is only available in hosted builds"
#endif

// The console of hosted builds. Writes to file descriptor 2.
//
// Output is collected per line and written with a single write system call, so lines from concurrent
// processes sharing the descriptor don't interleave. There is no stdio buffering, so nothing is lost when a
// handler terminates the process with _exit.
class Console_stderr : public Console
{
private:
    char line[256];
    size_t used{0};

    void putc(int c) override;
    void flush();

public:
    Console_stderr();

    static Console_stderr con;
};
