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
 * @file entropy.hpp
 * @brief Cryptographically secure random bytes from the operating system.
 *
 * @details
 * This file declares the `Entropy` class, the library's only source of
 * randomness. It reads directly from the kernel CSPRNG through `getrandom(2)`;
 * no user-space generator is seeded or cached, so there is no state to share
 * between threads.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace uuidcore::infra {

/**
 * @class Entropy
 * @brief A stateless gateway to the kernel random number generator.
 */
class Entropy {
  public:
    /// Largest request `getrandom(2)` serves without a short read.
    static constexpr std::size_t kMaxRequest = 256;

    /**
     * @brief Fills `len` bytes at `dst` with secure random data.
     *
     * Issues exactly one `getrandom(2)` call with no flags. The call blocks only
     * while the kernel pool is still uninitialized during early boot.
     *
     * A failure is reported on the spot: there is no retry loop and no fallback
     * to another device.
     *
     * @param dst Destination buffer of at least `len` bytes.
     * @param len Number of bytes to produce (at most `kMaxRequest`).
     *
     * @throws uuidcore::core::UuidError with `Status::InvalidParameter` if `len`
     * exceeds `kMaxRequest`, and with `Status::EntropyFailure` if the system
     * call fails, returns fewer than `len` bytes, or `dst` is null.
     */
    static void fill(uint8_t* dst, std::size_t len);
};

} // namespace uuidcore::infra
