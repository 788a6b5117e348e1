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
 * @file entropy.cpp
 * @brief `getrandom(2)` backed implementation of `Entropy::fill`.
 */

#include "uuidcore/infra/entropy.hpp"

#include "uuidcore/core/status.hpp"
#include "uuidcore/infra/logger.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/random.h>
#include <sys/types.h>

namespace uuidcore::infra {

void Entropy::fill(uint8_t* dst, std::size_t len)
{
    if (!dst) {
        throw core::UuidError(core::Status::EntropyFailure, "Entropy: null destination buffer");
    }
    if (len > kMaxRequest) {
        throw core::UuidError(core::Status::InvalidParameter,
                              "Entropy: request of " + std::to_string(len) + " bytes exceeds " +
                                  std::to_string(kMaxRequest));
    }
    if (len == 0) {
        return;
    }

    // getrandom() never returns a short read for requests up to 256 bytes once
    // the pool is initialized, so anything less is a fault.
    ssize_t got = ::getrandom(dst, len, 0);
    if (got < 0) {
        const int err = errno;
        std::string msg = "Entropy: getrandom failed: " + std::string(std::strerror(err));
        Logger::log(LogLevel::ERROR, msg);
        throw core::UuidError(core::Status::EntropyFailure, msg);
    }
    if (static_cast<std::size_t>(got) != len) {
        std::string msg = "Entropy: short read from getrandom (" + std::to_string(got) + " of " +
                          std::to_string(len) + " bytes)";
        Logger::log(LogLevel::ERROR, msg);
        throw core::UuidError(core::Status::EntropyFailure, msg);
    }
}

} // namespace uuidcore::infra
