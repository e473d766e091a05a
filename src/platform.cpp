/*
 * Platform Control
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
#include "config.hpp"

#if __STDC_HOSTED__

#include <unistd.h>

void halt()
{
    // pause returns after a signal handler ran. Go back to sleep.
    for (;;)
        pause();
}

void reset_system() { _exit(CFG_RESET_EXIT_STATUS); }

#else

#include "io.hpp"

void halt()
{
    for (;;)
        asm volatile("cli; hlt");
}

void reset_system()
{
    // Reset Control Register: request a full reset (bit 1), then trigger it (bit 2).
    Io::out<uint8>(0xcf9, 0x2);
    Io::out<uint8>(0xcf9, 0x6);

    // Pulse the reset line via the keyboard controller. Give up if the input buffer never drains, because
    // there may be no keyboard controller at all.
    for (unsigned tries{0}; tries < 0x10000 and (Io::in<uint8>(0x64) & 0x2); tries++) {
        relax();
    }

    Io::out<uint8>(0x64, 0xfe);

    halt();
}

#endif // __STDC_HOSTED__
