/*
 * I/O Port Access
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
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
#include "types.hpp"

#if __STDC_HOSTED__
#error "Port I/O is only available in freestanding builds"
#endif

class Io
{
public:
    template <typename T> ALWAYS_INLINE static inline T in(unsigned port)
    {
        T val;
        asm volatile("in %w1, %0" : "=a"(val) : "Nd"(port));
        return val;
    }

    template <typename T> ALWAYS_INLINE static inline void out(unsigned port, T val)
    {
        asm volatile("out %0, %w1" : : "a"(val), "Nd"(port));
    }
};
