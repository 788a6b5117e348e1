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
 * @file uuid.cpp
 * @brief Implementation of the identifier codec.
 *
 * @details
 * Generation follows RFC 9562 section 5.4 (Version 4). Rendering and parsing
 * work nibble by nibble on fixed offsets; no stream formatting is involved, so
 * the output is independent of the global locale.
 */

#include "uuidcore/core/uuid.hpp"

#include "uuidcore/core/status.hpp"
#include "uuidcore/infra/entropy.hpp"
#include "uuidcore/infra/string.hpp"

#include <algorithm>

namespace uuidcore::core {

namespace {

// Byte indices that are preceded by a hyphen in the canonical form.
constexpr bool hyphen_before(std::size_t byte_index) noexcept
{
    return byte_index == 4 || byte_index == 6 || byte_index == 8 || byte_index == 10;
}

constexpr bool hyphen_at(std::size_t char_index) noexcept
{
    return char_index == 8 || char_index == 13 || char_index == 18 || char_index == 23;
}

} // namespace

Uuid Uuid::generate_v4()
{
    Bytes raw{};
    infra::Entropy::fill(raw.data(), raw.size());

    // Version 4: high nibble of time_hi_and_version.
    raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40);
    // RFC 4122 variant: top two bits of clock_seq_hi.
    raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80);

    return Uuid(raw);
}

Uuid Uuid::from_bytes(const uint8_t* data, std::size_t len)
{
    if (!data) {
        throw UuidError(Status::InvalidParameter, "Codec: null identifier buffer");
    }
    if (len != kSize) {
        throw UuidError(Status::InvalidParameter, "Codec: identifier must be 16 bytes, got " +
                                                      std::to_string(len));
    }

    Bytes raw{};
    std::copy(data, data + kSize, raw.begin());
    return Uuid(raw);
}

/**
 * @details
 * The whole input is validated into a local buffer first, so a rejected string
 * never produces a partially filled identifier.
 */
Uuid Uuid::parse(std::string_view text)
{
    if (text.size() != kStringLength) {
        throw UuidError(Status::InvalidParameter,
                        "Codec: canonical form is 36 characters, got " +
                            std::to_string(text.size()));
    }

    Bytes raw{};
    std::size_t byte = 0;
    std::size_t i = 0;
    while (i < kStringLength) {
        if (hyphen_at(i)) {
            if (text[i] != '-') {
                throw UuidError(Status::InvalidParameter,
                                "Codec: expected '-' at offset " + std::to_string(i));
            }
            ++i;
            continue;
        }

        const int hi = infra::String::hex_value(text[i]);
        const int lo = infra::String::hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            throw UuidError(Status::InvalidParameter,
                            "Codec: non-hex character near offset " + std::to_string(i));
        }
        raw[byte++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }

    return Uuid(raw);
}

uint8_t Uuid::version() const noexcept
{
    return static_cast<uint8_t>((bytes_[6] & 0xF0) >> 4);
}

uint8_t Uuid::variant() const noexcept
{
    const uint8_t b = bytes_[8];
    if ((b & 0x80) == 0x00) {
        return kVariantNcs;
    }
    if ((b & 0xC0) == 0x80) {
        return kVariantRfc4122;
    }
    if ((b & 0xE0) == 0xC0) {
        return kVariantMicrosoft;
    }
    return kVariantFuture;
}

std::string Uuid::to_string() const
{
    std::string out(kStringLength, '\0');
    render(&out[0]);
    return out;
}

void Uuid::write_to(char* out, std::size_t capacity) const
{
    if (!out) {
        throw UuidError(Status::InvalidParameter, "Codec: null output buffer");
    }
    if (capacity < kStringCapacity) {
        throw UuidError(Status::BufferTooSmall, "Codec: output buffer holds " +
                                                    std::to_string(capacity) + " bytes, need 37");
    }

    render(out);
    out[kStringLength] = '\0';
}

const char* Uuid::variant_name(uint8_t variant) noexcept
{
    switch (variant) {
    case kVariantNcs:
        return "NCS";
    case kVariantRfc4122:
        return "RFC 4122";
    case kVariantMicrosoft:
        return "Microsoft";
    case kVariantFuture:
        return "Future";
    default:
        return "Unknown";
    }
}

// Writes exactly kStringLength characters, no terminator.
void Uuid::render(char* out) const noexcept
{
    char* p = out;
    for (std::size_t i = 0; i < kSize; ++i) {
        if (hyphen_before(i)) {
            *p++ = '-';
        }
        *p++ = infra::String::hex_digit(static_cast<uint8_t>(bytes_[i] >> 4));
        *p++ = infra::String::hex_digit(bytes_[i]);
    }
}

} // namespace uuidcore::core
