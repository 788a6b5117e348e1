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
 * @file status.cpp
 * @brief Status code descriptions.
 */

#include "uuidcore/core/status.hpp"

namespace uuidcore::core {

const char* status_message(Status status) noexcept
{
    switch (status) {
    case Status::Success:
        return "Success";
    case Status::EntropyFailure:
        return "Failed to generate random data from entropy source";
    case Status::InvalidParameter:
        return "Invalid parameter";
    case Status::BufferTooSmall:
        return "Buffer too small";
    case Status::Unknown:
        return "Unknown error";
    }
    return "Unknown error";
}

Status status_from_code(int32_t code) noexcept
{
    switch (code) {
    case 0:
        return Status::Success;
    case 1:
        return Status::EntropyFailure;
    case 2:
        return Status::InvalidParameter;
    case 3:
        return Status::BufferTooSmall;
    default:
        return Status::Unknown;
    }
}

} // namespace uuidcore::core
