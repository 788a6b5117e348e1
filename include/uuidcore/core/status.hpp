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
 * @file status.hpp
 * @brief Outcome taxonomy shared by the core and the ABI boundary.
 *
 * @details
 * The numeric values of `Status` are a published contract: foreign callers
 * hard-code them. Existing values never change meaning, and any addition must
 * take a number that has never been used.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace uuidcore::core {

/**
 * @enum Status
 * @brief Result of every operation that crosses the ABI boundary.
 */
enum class Status : int32_t {
    Success = 0,          ///< Operation completed.
    EntropyFailure = 1,   ///< The OS random source failed or was unavailable.
    InvalidParameter = 2, ///< Null pointer, wrong-length input, malformed text.
    BufferTooSmall = 3,   ///< Output capacity cannot hold the result.
    Unknown = 99          ///< Unanticipated internal fault.
};

/// Human-readable description of `status`. Never returns null.
const char* status_message(Status status) noexcept;

/// Converts a raw code back into a `Status`; unrecognized values map to `Unknown`.
Status status_from_code(int32_t code) noexcept;

/**
 * @class UuidError
 * @brief Exception thrown by the core when an operation cannot complete.
 *
 * Carries the `Status` the ABI boundary reports for it. Core code throws this,
 * and only the boundary guard converts it back into an integer.
 */
class UuidError : public std::runtime_error {
  public:
    UuidError(Status status, const std::string& what)
        : std::runtime_error(what), status_(status)
    {
    }

    Status status() const noexcept
    {
        return status_;
    }

  private:
    Status status_;
};

} // namespace uuidcore::core
