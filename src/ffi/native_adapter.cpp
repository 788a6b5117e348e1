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
 * @file native_adapter.cpp
 * @brief Implementation of the C++ wrapper functions over the C ABI.
 *
 * @details
 * Each wrapper marshals C++ values into caller-owned stack buffers, invokes the
 * exported symbol, and converts a non-zero status into `NativeError`. No heap
 * memory crosses the boundary in either direction.
 */

#include "uuidcore/ffi/native_adapter.hpp"

namespace uuidcore::ffi {

NativeError::NativeError(const std::string& operation, int32_t code)
    : std::runtime_error(operation + " failed: " + uuid_status_message(code) + " (code " +
                         std::to_string(code) + ")"),
      code_(code)
{
}

void check_status(const char* operation, int32_t status)
{
    if (status != UUIDCORE_SUCCESS) {
        throw NativeError(operation, status);
    }
}

RawUuid call_generate()
{
    RawUuid id{};
    check_status("uuid_generate_v4", uuid_generate_v4(id.data()));
    return id;
}

/**
 * @details
 * **Marshalling:** renders into a fixed 37-byte stack buffer, then copies the
 * 36 characters (without the terminator) into the returned string.
 */
std::string call_to_string(const RawUuid& id)
{
    char buffer[UUIDCORE_STRING_CAPACITY] = {};
    check_status("uuid_to_string", uuid_to_string(id.data(), buffer, sizeof(buffer)));
    return std::string(buffer, UUIDCORE_STRING_CAPACITY - 1);
}

UuidInfo call_get_info(const RawUuid& id)
{
    UuidInfo info{0, 0};
    check_status("uuid_get_info", uuid_get_info(id.data(), &info.version, &info.variant));
    return info;
}

bool call_compare(const RawUuid& a, const RawUuid& b)
{
    uint8_t equal = 0;
    check_status("uuid_compare", uuid_compare(a.data(), b.data(), &equal));
    return equal == 1;
}

RawUuid call_from_bytes(const std::vector<uint8_t>& bytes)
{
    RawUuid id{};
    check_status("uuid_from_bytes", uuid_from_bytes(bytes.data(), bytes.size(), id.data()));
    return id;
}

RawUuid call_parse(const std::string& text)
{
    RawUuid id{};
    check_status("uuid_parse", uuid_parse(text.data(), text.size(), id.data()));
    return id;
}

RawUuid Generator::generate() const
{
    return call_generate();
}

RawUuid Generator::from_bytes(const std::vector<uint8_t>& bytes) const
{
    return call_from_bytes(bytes);
}

RawUuid Generator::parse(const std::string& text) const
{
    return call_parse(text);
}

std::string Generator::to_string(const RawUuid& id) const
{
    return call_to_string(id);
}

UuidInfo Generator::info(const RawUuid& id) const
{
    return call_get_info(id);
}

bool Generator::equal(const RawUuid& a, const RawUuid& b) const
{
    return call_compare(a, b);
}

const Generator& default_generator()
{
    // Function-local static: initialized exactly once, even under concurrent first use.
    static const Generator instance{};
    return instance;
}

} // namespace uuidcore::ffi
