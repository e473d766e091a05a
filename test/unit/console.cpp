/*
 * Console Formatter Tests
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

#include <console_buffer.hpp>

#include <array>
#include <catch2/catch.hpp>
#include <string>

namespace
{

template <size_t N> std::string render_into(std::array<char, N>& storage, char const* text)
{
    Console_buffer buffer{storage.data(), storage.size()};

    return buffer.render("%s", text);
}

} // namespace

TEST_CASE("Integer conversions", "[console]")
{
    std::array<char, 64> storage;
    Console_buffer buffer{storage.data(), storage.size()};

    SECTION("signed") { CHECK(std::string{buffer.render("%d %d %ld", 0, -17, -123456789L)} == "0 -17 -123456789"); }

    SECTION("unsigned") { CHECK(std::string{buffer.render("%u %lu", 42U, 4000000000UL)} == "42 4000000000"); }

    SECTION("hexadecimal") { CHECK(std::string{buffer.render("%x %#x %llx", 255U, 16U, 0xdeadbeefULL)} == "ff 0x10 deadbeef"); }

    SECTION("pointer") { CHECK(std::string{buffer.render("%p", reinterpret_cast<void*>(0x1000))} == "0x1000"); }
}

TEST_CASE("Field width and padding", "[console]")
{
    std::array<char, 64> storage;
    Console_buffer buffer{storage.data(), storage.size()};

    SECTION("space padding") { CHECK(std::string{buffer.render("[%4u]", 7U)} == "[   7]"); }

    SECTION("zero padding") { CHECK(std::string{buffer.render("[%04x]", 0xaU)} == "[000a]"); }

    SECTION("zero padding with prefix") { CHECK(std::string{buffer.render("[%#06x]", 0xaU)} == "[0x000a]"); }

    SECTION("string width") { CHECK(std::string{buffer.render("[%5s]", "ab")} == "[ab   ]"); }

    SECTION("string precision") { CHECK(std::string{buffer.render("[%.3s]", "abcdef")} == "[abc]"); }
}

TEST_CASE("Characters and literal text", "[console]")
{
    std::array<char, 64> storage;
    Console_buffer buffer{storage.data(), storage.size()};

    CHECK(std::string{buffer.render("%c%c and %s", 'o', 'k', static_cast<char const*>(nullptr))} ==
          "ok and (null)");
}

TEST_CASE("Rendering appends to the buffer", "[console]")
{
    std::array<char, 64> storage;
    Console_buffer buffer{storage.data(), storage.size()};

    buffer.render("panicked ");
    buffer.render("at %s", "main.cpp");

    CHECK(std::string{storage.data()} == "panicked at main.cpp");
    CHECK(buffer.length() == 20);
}

TEST_CASE("Buffer overflow truncates the output", "[console]")
{
    std::array<char, 6> storage;

    CHECK(render_into(storage, "truncated") == "trunc");

    Console_buffer buffer{storage.data(), storage.size()};

    buffer.render("12345");
    CHECK(not buffer.truncated());

    buffer.render("6");
    CHECK(buffer.truncated());
    CHECK(std::string{storage.data()} == "12345");
}

TEST_CASE("A buffer without room for text stays empty", "[console]")
{
    std::array<char, 1> storage{'x'};
    Console_buffer buffer{storage.data(), storage.size()};

    CHECK(std::string{buffer.render("abc")} == "");
    CHECK(buffer.truncated());
}
