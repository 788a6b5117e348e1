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
 * @file uuid_abi.cpp
 * @brief Implementation of the exported C functions.
 *
 * @details
 * Each entry point follows the same shape:
 * 1. **Configure**: applies the environment configuration once per process.
 * 2. **Check**: rejects null pointers and bad sizes before touching memory.
 * 3. **Execute**: delegates to `core::Uuid`.
 * 4. **Translate**: `ffi::guarded` turns the outcome into an integer status.
 *
 * Results are staged in locals and copied into caller buffers only after the
 * core call has succeeded.
 */

#include "uuidcore/ffi/uuid_abi.h"

#include "uuidcore/core/status.hpp"
#include "uuidcore/core/uuid.hpp"
#include "uuidcore/ffi/boundary.hpp"
#include "uuidcore/infra/config.hpp"

#include <algorithm>
#include <string>
#include <string_view>

using uuidcore::core::Status;
using uuidcore::core::Uuid;
using uuidcore::core::UuidError;

namespace {

inline void require(const void* ptr, const char* what)
{
    if (!ptr) {
        throw UuidError(Status::InvalidParameter, std::string("null ") + what);
    }
}

inline void copy_out(const Uuid& id, uint8_t* out)
{
    std::copy(id.bytes().begin(), id.bytes().end(), out);
}

} // namespace

extern "C" {

int32_t uuid_generate_v4(uint8_t* out_bytes)
{
    return uuidcore::ffi::guarded("uuid_generate_v4", [&] {
        uuidcore::infra::Config::apply_env_once();
        require(out_bytes, "out_bytes");

        const Uuid id = Uuid::generate_v4();
        copy_out(id, out_bytes);
    });
}

int32_t uuid_to_string(const uint8_t* in_bytes, char* out_string, size_t out_capacity)
{
    return uuidcore::ffi::guarded("uuid_to_string", [&] {
        uuidcore::infra::Config::apply_env_once();
        require(in_bytes, "in_bytes");
        require(out_string, "out_string");

        const Uuid id = Uuid::from_bytes(in_bytes, Uuid::kSize);
        id.write_to(out_string, out_capacity);
    });
}

int32_t uuid_get_info(const uint8_t* in_bytes, uint8_t* out_version, uint8_t* out_variant)
{
    return uuidcore::ffi::guarded("uuid_get_info", [&] {
        uuidcore::infra::Config::apply_env_once();
        require(in_bytes, "in_bytes");
        require(out_version, "out_version");
        require(out_variant, "out_variant");

        const Uuid id = Uuid::from_bytes(in_bytes, Uuid::kSize);
        *out_version = id.version();
        *out_variant = id.variant();
    });
}

int32_t uuid_compare(const uint8_t* a_bytes, const uint8_t* b_bytes, uint8_t* out_equal)
{
    return uuidcore::ffi::guarded("uuid_compare", [&] {
        uuidcore::infra::Config::apply_env_once();
        require(a_bytes, "a_bytes");
        require(b_bytes, "b_bytes");
        require(out_equal, "out_equal");

        const Uuid a = Uuid::from_bytes(a_bytes, Uuid::kSize);
        const Uuid b = Uuid::from_bytes(b_bytes, Uuid::kSize);
        *out_equal = (a == b) ? 1 : 0;
    });
}

int32_t uuid_from_bytes(const uint8_t* in_bytes, size_t in_len, uint8_t* out_bytes)
{
    return uuidcore::ffi::guarded("uuid_from_bytes", [&] {
        uuidcore::infra::Config::apply_env_once();
        require(out_bytes, "out_bytes");

        const Uuid id = Uuid::from_bytes(in_bytes, in_len);
        copy_out(id, out_bytes);
    });
}

int32_t uuid_parse(const char* in_string, size_t in_len, uint8_t* out_bytes)
{
    return uuidcore::ffi::guarded("uuid_parse", [&] {
        uuidcore::infra::Config::apply_env_once();
        require(in_string, "in_string");
        require(out_bytes, "out_bytes");

        const Uuid id = Uuid::parse(std::string_view(in_string, in_len));
        copy_out(id, out_bytes);
    });
}

const char* uuid_status_message(int32_t status)
{
    switch (status) {
    case UUIDCORE_SUCCESS:
    case UUIDCORE_ENTROPY_FAILURE:
    case UUIDCORE_INVALID_PARAMETER:
    case UUIDCORE_BUFFER_TOO_SMALL:
    case UUIDCORE_UNKNOWN_ERROR:
        return uuidcore::core::status_message(uuidcore::core::status_from_code(status));
    default:
        return "Invalid status code";
    }
}

} // extern "C"
