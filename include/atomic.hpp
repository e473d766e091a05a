/*
 * Atomic Operations
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

// Thin wrappers around the compiler atomic builtins.
//
// We cannot use std::atomic, because the code has to build without a hosted C++ library.
class Atomic
{
public:
    enum Order
    {
        RELAXED = __ATOMIC_RELAXED,
        ACQUIRE = __ATOMIC_ACQUIRE,
        RELEASE = __ATOMIC_RELEASE,
        SEQ_CST = __ATOMIC_SEQ_CST,
    };

    template <typename T, Order ORDER = SEQ_CST> static inline T load(T const& ptr)
    {
        return __atomic_load_n(&ptr, ORDER);
    }

    template <typename T, Order ORDER = SEQ_CST> static inline void store(T& ptr, T n)
    {
        __atomic_store_n(&ptr, n, ORDER);
    }

    template <typename T, Order ORDER = SEQ_CST> static inline T exchange(T& ptr, T n)
    {
        return __atomic_exchange_n(&ptr, n, ORDER);
    }

    template <typename T, Order ORDER = SEQ_CST> static inline T fetch_add(T& ptr, T v)
    {
        return __atomic_fetch_add(&ptr, v, ORDER);
    }
};
