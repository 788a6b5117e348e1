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
 * @file native_adapter.hpp
 * @brief Safe C++ wrapper over the exported `uuid_*` C functions.
 *
 * @details
 * This header is what a C++ host uses when it links against the `uuidcore`
 * shared library through its C ABI rather than the internal `core` classes.
 *
 * ## Architecture
 * 1. **Raw Interface (`uuid_abi.h`)**: integer status codes, caller-owned buffers.
 * 2. **Safe Wrapper (`uuidcore::ffi`)**: value types (`RawUuid`, `std::string`)
 *    in, value types out, and a `NativeError` exception for every non-zero status.
 *
 * The status-to-exception mapping lives here, at the edge, and nowhere in the core.
 */

#pragma once

#include "uuidcore/ffi/uuid_abi.h"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace uuidcore::ffi {

/// A raw identifier as exchanged with the C ABI.
using RawUuid = std::array<uint8_t, UUIDCORE_UUID_SIZE>;

/// Version and variant fields reported by `uuid_get_info`.
struct UuidInfo {
    uint8_t version;
    uint8_t variant;
};

/**
 * @class NativeError
 * @brief Raised when an exported function returns a non-zero status.
 *
 * `what()` combines the operation name with `uuid_status_message(code())`.
 */
class NativeError : public std::runtime_error {
  public:
    NativeError(const std::string& operation, int32_t code);

    int32_t code() const noexcept
    {
        return code_;
    }

  private:
    int32_t code_;
};

/**
 * @brief Throws `NativeError` unless `status` is `UUIDCORE_SUCCESS`.
 *
 * @param operation Name used in the exception message.
 * @param status Value returned by a `uuid_*` function.
 */
void check_status(const char* operation, int32_t status);

// ------------------------------------------------------------------------
// Public FFI Function Declarations
// ------------------------------------------------------------------------

/**
 * @brief Generates a Version 4 identifier through `uuid_generate_v4`.
 * @throws NativeError with code 1 if the entropy source failed.
 */
RawUuid call_generate();

/// Canonical lowercase text of `id` through `uuid_to_string`.
std::string call_to_string(const RawUuid& id);

/// Version and variant of `id` through `uuid_get_info`.
UuidInfo call_get_info(const RawUuid& id);

/// Byte-wise equality through `uuid_compare`.
bool call_compare(const RawUuid& a, const RawUuid& b);

/**
 * @brief Validates an arbitrary byte vector as an identifier.
 *
 * @throws NativeError with code 2 unless `bytes.size() == 16`.
 */
RawUuid call_from_bytes(const std::vector<uint8_t>& bytes);

/**
 * @brief Parses canonical text through `uuid_parse`.
 *
 * @throws NativeError with code 2 if `text` is not a canonical identifier.
 */
RawUuid call_parse(const std::string& text);

/**
 * @class Generator
 * @brief A caller-held handle for producing and inspecting identifiers.
 *
 * @details
 * The handle carries no state; it exists so that callers pass an explicit object
 * around instead of reaching for a global. Copying it is free.
 */
class Generator {
  public:
    RawUuid generate() const;
    RawUuid from_bytes(const std::vector<uint8_t>& bytes) const;
    RawUuid parse(const std::string& text) const;
    std::string to_string(const RawUuid& id) const;
    UuidInfo info(const RawUuid& id) const;
    bool equal(const RawUuid& a, const RawUuid& b) const;
};

/**
 * @brief Process-wide convenience instance.
 *
 * Initialized on first use; the initialization is thread-safe. Nothing in the
 * library depends on it, and an explicit `Generator` works the same way.
 */
const Generator& default_generator();

} // namespace uuidcore::ffi
