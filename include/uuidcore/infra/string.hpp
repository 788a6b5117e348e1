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
 * @file string.hpp
 * @brief Text and hexadecimal primitives shared by the codec and the config layer.
 *
 * @details
 * This header defines the `String` utility class. It collects the small, stateless
 * character routines that `uuidcore` needs in more than one place: whitespace
 * trimming and case folding for configuration values, and nibble-level hex
 * conversion for the identifier codec.
 */

#pragma once

#include <cstdint>
#include <string>

namespace uuidcore::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * Whitespace is whatever `std::isspace` accepts in the "C" locale
     * (space, `\t`, `\n`, `\r`, `\v`, `\f`).
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy. Empty if `s` is empty or all whitespace.
     *
     * @code
     * std::string lvl = uuidcore::infra::String::trim("  debug \n"); // "debug"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// Returns an ASCII-lowercased copy of `s`.
    static std::string to_lower(const std::string& s);

    /**
     * @brief Maps the low 4 bits of `nibble` to a lowercase hex digit.
     * @return One of `0-9a-f`.
     */
    static char hex_digit(uint8_t nibble) noexcept;

    /**
     * @brief Decodes a single hexadecimal character.
     *
     * Accepts both `a-f` and `A-F`.
     *
     * @return The value 0-15, or -1 if `c` is not a hex digit.
     */
    static int hex_value(char c) noexcept;
};

} // namespace uuidcore::infra
