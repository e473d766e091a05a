/*
 * Serial Console
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
 *
 * Copyright (C) 2012-2013 Udo Steinberg, Intel Corporation.
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

#include "console_serial.hpp"
#include "platform.hpp"
#include "stdio.hpp"

Console_serial Console_serial::con INIT_PRIORITY(101);

Console_serial::Console_serial()
{
    static_assert(freq % CFG_SERIAL_BAUD == 0, "Baud rate cannot be derived from the UART clock");

    out(LCR, 0x80);
    out(DLL, (freq / CFG_SERIAL_BAUD) & 0xff);
    out(DLM, (freq / CFG_SERIAL_BAUD) >> 8);
    out(LCR, 3);
    out(IER, 0);
    out(FCR, 7);
    out(MCR, 3);

    enable();

    trace(TRACE_CONSOLE, "Serial console on port %#x at %u baud", base, CFG_SERIAL_BAUD);
}

void Console_serial::putc(int c)
{
    if (c == '\n')
        putc('\r');

    while (EXPECT_FALSE(!(in(LSR) & 0x20)))
        relax();

    out(THR, c);
}
