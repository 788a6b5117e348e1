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
 * @file report.cpp
 * @brief cJSON and text renderings of an identifier.
 */

#include "uuidcore/tool/report.hpp"

#include "uuidcore/infra/string.hpp"

#include <cJSON.h>
#include <sstream>
#include <stdexcept>

namespace uuidcore::tool {

namespace {

/**
 * @class ScopedJson
 * @brief RAII owner of a cJSON tree.
 */
class ScopedJson {
  public:
    explicit ScopedJson(cJSON* root) : root_(root) {}

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    ~ScopedJson()
    {
        if (root_) {
            cJSON_Delete(root_);
        }
    }

    cJSON* get() const
    {
        return root_;
    }

  private:
    cJSON* root_;
};

/// Throws if a cJSON constructor or insertion ran out of memory.
void require(const cJSON* node)
{
    if (!node) {
        throw std::runtime_error("Report: cJSON allocation failed");
    }
}

/// Hex of bytes [first, last) with no separators.
std::string hex_range(const core::Uuid::Bytes& b, std::size_t first, std::size_t last)
{
    std::string out;
    out.reserve((last - first) * 2);
    for (std::size_t i = first; i < last; ++i) {
        out.push_back(infra::String::hex_digit(static_cast<uint8_t>(b[i] >> 4)));
        out.push_back(infra::String::hex_digit(b[i]));
    }
    return out;
}

std::string bits(unsigned value, int width)
{
    std::string out;
    for (int i = width - 1; i >= 0; --i) {
        out.push_back(((value >> i) & 1U) ? '1' : '0');
    }
    return out;
}

} // namespace

std::string Report::to_json(const core::Uuid& id)
{
    ScopedJson root(cJSON_CreateObject());
    require(root.get());

    require(cJSON_AddStringToObject(root.get(), "uuid", id.to_string().c_str()));
    require(cJSON_AddNumberToObject(root.get(), "version", id.version()));
    require(cJSON_AddNumberToObject(root.get(), "variant", id.variant()));
    require(cJSON_AddStringToObject(root.get(), "variant_name",
                                    core::Uuid::variant_name(id.variant())));

    cJSON* bytes = cJSON_AddArrayToObject(root.get(), "bytes");
    require(bytes);
    for (uint8_t b : id.bytes()) {
        cJSON* item = cJSON_CreateNumber(b);
        require(item);
        if (!cJSON_AddItemToArray(bytes, item)) {
            cJSON_Delete(item);
            throw std::runtime_error("Report: cJSON insertion failed");
        }
    }

    char* raw = cJSON_PrintUnformatted(root.get());
    if (!raw) {
        throw std::runtime_error("Report: cJSON serialization failed");
    }
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

std::string Report::explain(const core::Uuid& id)
{
    const auto& b = id.bytes();
    std::ostringstream ss;

    ss << "UUID:      " << id.to_string() << "\n";
    ss << "Raw bytes:";
    for (std::size_t i = 0; i < b.size(); ++i) {
        ss << ' ' << infra::String::hex_digit(static_cast<uint8_t>(b[i] >> 4))
           << infra::String::hex_digit(b[i]);
    }
    ss << "\n\n";

    ss << "time_low            (bytes 0-3):   " << hex_range(b, 0, 4) << "\n";
    ss << "time_mid            (bytes 4-5):   " << hex_range(b, 4, 6) << "\n";
    ss << "time_hi_and_version (bytes 6-7):   " << hex_range(b, 6, 8) << "\n";
    ss << "  version (byte 6 high nibble):    " << bits(b[6] >> 4, 4) << " = "
       << static_cast<int>(id.version()) << "\n";
    ss << "clock_seq           (bytes 8-9):   " << hex_range(b, 8, 10) << "\n";
    ss << "  variant (byte 8 top bits):       " << bits(b[8] >> 5, 3) << " = "
       << static_cast<int>(id.variant()) << " (" << core::Uuid::variant_name(id.variant())
       << ")\n";
    ss << "node                (bytes 10-15): " << hex_range(b, 10, 16) << "\n";

    return ss.str();
}

} // namespace uuidcore::tool
