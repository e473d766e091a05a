/*
 * Static Vector
 *
 * Copyright (C) 2020 Julian Stecklina, Cyberus Technology GmbH.
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

#include "panic.hpp"
#include "types.hpp"
#include "util.hpp"

// A vector with statically allocated backing store and a maximum size.
//
// Growing the vector beyond its capacity and accessing elements via at() past its current size panic.
template <typename T, size_t N> class Static_vector
{
private:
    // The number of elements in the vector.
    size_t size_{0};

    // The actual backing storage for the vector elements.
    alignas(T) char backing[sizeof(T) * N];

    template <typename... ARGS> void emplace_at(Source_location const& location, ARGS&&... args)
    {
        if (EXPECT_FALSE(size() >= max_size())) {
            panic_capacity(max_size(), location);
        }

        new (&data()[size_++]) T(forward<ARGS>(args)...);
    }

public:
    Static_vector() = default;

    Static_vector(Static_vector const&) = delete;
    Static_vector& operator=(Static_vector const&) = delete;

    T* data() { return reinterpret_cast<T*>(backing); }
    T const* data() const { return reinterpret_cast<T const*>(backing); }

    T& at(size_t i, Source_location const& location = Source_location::current())
    {
        if (EXPECT_FALSE(i >= size())) {
            panic_index(size(), i, location);
        }

        return data()[i];
    }

    T const& at(size_t i, Source_location const& location = Source_location::current()) const
    {
        if (EXPECT_FALSE(i >= size())) {
            panic_index(size(), i, location);
        }

        return data()[i];
    }

    T* begin() { return &data()[0]; }
    T const* begin() const { return &data()[0]; }

    T* end() { return &data()[size()]; }
    T const* end() const { return &data()[size()]; }

    size_t size() const { return size_; };
    constexpr size_t max_size() const { return N; }

    // Construct an element in place. A variadic function cannot take a defaulted location, so a full vector
    // reports this line instead of the caller. Use push_back to report the caller.
    template <typename... ARGS> void emplace_back(ARGS&&... args)
    {
        emplace_at(Source_location::current(), forward<ARGS>(args)...);
    }

    void push_back(T const& o, Source_location const& location = Source_location::current())
    {
        emplace_at(location, o);
    }

    void reset()
    {
        for (T& elem : *this) {
            elem.~T();
        }

        size_ = 0;
    }

    ~Static_vector() { reset(); }
};
