/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file string.cpp
 * @brief Implementation of the text and hexadecimal primitives.
 */

#include "uuidcore/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace uuidcore::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * Implementation Strategy:
 * 1. **Prefix Scan**: Locates the first non-whitespace character.
 * 2. **Empty State Detection**: Early exit for all-whitespace input.
 * 3. **Suffix Scan**: Walks back from the end to the last non-whitespace character.
 *
 * @note `static_cast<unsigned char>` keeps `std::isspace` defined for negative
 * `char` values.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_lower(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

char String::hex_digit(uint8_t nibble) noexcept
{
    static constexpr char kDigits[] = "0123456789abcdef";
    return kDigits[nibble & 0x0F];
}

int String::hex_value(char c) noexcept
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace uuidcore::infra
