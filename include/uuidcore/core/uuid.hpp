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
 * @file uuid.hpp
 * @brief The 128-bit identifier value type and its codec.
 *
 * @details
 * This file declares `Uuid`, a flat 16-byte value in network byte order, together
 * with every pure transformation the library offers on it: Version 4 generation,
 * canonical text rendering and parsing, version/variant extraction and equality.
 *
 * **Byte layout (RFC 4122 / RFC 9562):**
 * ```
 *  0-3   time_low
 *  4-5   time_mid
 *  6-7   time_hi_and_version   (high nibble of byte 6 = version)
 *  8-9   clock_seq             (top bits of byte 8 = variant)
 *  10-15 node
 * ```
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uuidcore::core {

/**
 * @class Uuid
 * @brief An exactly-16-byte universally unique identifier.
 *
 * @details
 * Instances are plain values: copyable, comparable, with no internal pointers.
 * Only `generate_v4()` imposes the version/variant bit pattern. Identifiers built
 * from caller bytes or text keep every bit exactly as supplied.
 */
class Uuid {
  public:
    static constexpr std::size_t kSize = 16;           ///< Raw identifier length.
    static constexpr std::size_t kStringLength = 36;   ///< Canonical text length.
    static constexpr std::size_t kStringCapacity = 37; ///< Text plus NUL terminator.

    using Bytes = std::array<uint8_t, kSize>;

    /// RFC variant classes as reported by `variant()`.
    static constexpr uint8_t kVariantNcs = 0;
    static constexpr uint8_t kVariantRfc4122 = 2;
    static constexpr uint8_t kVariantMicrosoft = 6;
    static constexpr uint8_t kVariantFuture = 7;

    /// Constructs the nil identifier (all zero bits).
    Uuid() : bytes_{} {}

    /// Wraps the given bytes without modification.
    explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * @brief Generates a random Version 4 identifier.
     *
     * 1. Draws 16 bytes from `infra::Entropy`.
     * 2. Sets the high nibble of byte 6 to `0100` (version 4).
     * 3. Sets the top two bits of byte 8 to `10` (RFC 4122 variant).
     *
     * The other 122 bits are left exactly as the entropy source produced them.
     *
     * @throws UuidError with `Status::EntropyFailure` if the OS source fails.
     */
    static Uuid generate_v4();

    /**
     * @brief Builds an identifier from a caller-supplied byte buffer.
     *
     * The length is validated before anything else happens; the bytes are then
     * copied verbatim. No version or variant bits are touched.
     *
     * @param data Pointer to the first byte.
     * @param len Length of the buffer; must be exactly 16.
     *
     * @throws UuidError with `Status::InvalidParameter` if `data` is null or
     * `len != 16`.
     */
    static Uuid from_bytes(const uint8_t* data, std::size_t len);

    /**
     * @brief Parses the canonical `8-4-4-4-12` text form.
     *
     * Hex digits may be in either case; hyphens must sit at offsets 8, 13, 18
     * and 23 and the text must be exactly 36 characters long. Braces, `urn:uuid:`
     * prefixes and hyphen-less forms are rejected.
     *
     * @code
     * auto id = Uuid::parse("f47ac10b-58cc-4372-a567-0e02b2c3d479");
     * @endcode
     *
     * @throws UuidError with `Status::InvalidParameter` on any malformed input.
     */
    static Uuid parse(std::string_view text);

    /// Raw bytes in network order.
    const Bytes& bytes() const noexcept
    {
        return bytes_;
    }

    /// Version field: the high nibble of byte 6, in the range 0-15.
    uint8_t version() const noexcept;

    /**
     * @brief Variant class decoded from the top bits of byte 8.
     *
     * | Bits   | Value | Meaning                    |
     * |--------|-------|----------------------------|
     * | `0xxx` | 0     | NCS backward compatibility |
     * | `10xx` | 2     | RFC 4122 / RFC 9562        |
     * | `110x` | 6     | Microsoft GUID             |
     * | `111x` | 7     | Reserved for future use    |
     */
    uint8_t variant() const noexcept;

    /// Renders the 36-character lowercase canonical form.
    std::string to_string() const;

    /**
     * @brief Renders the canonical form into a caller buffer, NUL-terminated.
     *
     * Writes exactly `kStringCapacity` bytes on success. The capacity check runs
     * before the first write, so on failure the buffer is untouched.
     *
     * @param out Destination buffer.
     * @param capacity Size of `out` in bytes.
     *
     * @throws UuidError with `Status::InvalidParameter` if `out` is null, or
     * `Status::BufferTooSmall` if `capacity < kStringCapacity`.
     */
    void write_to(char* out, std::size_t capacity) const;

    /// Display name of a variant class, e.g. "RFC 4122".
    static const char* variant_name(uint8_t variant) noexcept;

    bool operator==(const Uuid& other) const noexcept
    {
        return bytes_ == other.bytes_;
    }

    bool operator!=(const Uuid& other) const noexcept
    {
        return !(*this == other);
    }

  private:
    void render(char* out) const noexcept;

    Bytes bytes_;
};

} // namespace uuidcore::core
