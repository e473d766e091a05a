/*
 * Configuration
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

// All values can be overridden from the build system. See the DEADSTOP_* options in CMakeLists.txt.

/// Keep fault messages in Fault_record.
///
/// Minimal-footprint builds set this to 0. All message text is then discarded at the fault site and handlers
/// only see the location (if enabled).
#ifndef CFG_PANIC_MESSAGES
#define CFG_PANIC_MESSAGES 1
#endif

/// Keep source locations in Fault_record.
#ifndef CFG_PANIC_LOCATIONS
#define CFG_PANIC_LOCATIONS 1
#endif

/// Size of the stack buffer that formatted fault messages are rendered into, including the terminating NUL
/// character. Longer messages are truncated.
#ifndef CFG_PANIC_MESSAGE_SIZE
#define CFG_PANIC_MESSAGE_SIZE 128
#endif

/// The process exit status the reset handler uses in hosted builds.
///
/// There is no device to reset on a host. A supervisor that wants to restart the program on reset can look
/// for this status.
#ifndef CFG_RESET_EXIT_STATUS
#define CFG_RESET_EXIT_STATUS 82
#endif

/// I/O port of the UART used by the serial console.
#ifndef CFG_SERIAL_PORT
#define CFG_SERIAL_PORT 0x3f8
#endif

#define CFG_SERIAL_BAUD 115200

// The maximum number of CPUs (or host threads) that can contend for a spinlock.
#define NUM_CPU 128

static_assert(CFG_PANIC_MESSAGE_SIZE >= 2, "Panic message buffer cannot hold any text");
