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
 * @file boundary.hpp
 * @brief Exception-to-status translation for exported functions.
 *
 * @details
 * Every `extern "C"` entry point runs its body through `guarded()`. The guard is
 * the single place where C++ exceptions stop: a `core::UuidError` becomes its
 * own status, anything else becomes `Status::Unknown`. Nothing escapes into the
 * foreign caller's stack frame.
 */

#pragma once

#include "uuidcore/core/status.hpp"
#include "uuidcore/infra/logger.hpp"

#include <cstdint>
#include <exception>
#include <string>

namespace uuidcore::ffi {

/**
 * @brief Runs `body` and returns its outcome as an ABI status code.
 *
 * @param operation Name of the exported function, used in log messages.
 * @param body Callable that throws on failure and returns normally on success.
 * @return The integer value of the resulting `core::Status`.
 *
 * **Logging:** caller mistakes (`InvalidParameter`, `BufferTooSmall`) go to
 * `DEBUG`; entropy faults and unexpected exceptions go to `ERROR`; non-standard
 * exceptions go to `FATAL`.
 */
template <typename Fn> int32_t guarded(const char* operation, Fn&& body) noexcept
{
    using core::Status;
    using infra::LogLevel;
    using infra::Logger;

    try {
        body();
        return static_cast<int32_t>(Status::Success);
    } catch (const core::UuidError& e) {
        const LogLevel level =
            (e.status() == Status::EntropyFailure || e.status() == Status::Unknown)
                ? LogLevel::ERROR
                : LogLevel::DEBUG;
        try {
            Logger::log(level, std::string("ABI: ") + operation + " -> " + e.what());
        } catch (const std::exception&) {
            // The status below is the caller's only signal; logging is best effort.
        }
        return static_cast<int32_t>(e.status());
    } catch (const std::exception& e) {
        try {
            Logger::log(LogLevel::ERROR,
                        std::string("ABI: ") + operation + " -> unexpected exception: " + e.what());
        } catch (const std::exception&) {
        }
        return static_cast<int32_t>(Status::Unknown);
    } catch (...) {
        try {
            Logger::log(LogLevel::FATAL,
                        std::string("ABI: ") + operation + " -> non-standard exception");
        } catch (const std::exception&) {
        }
        return static_cast<int32_t>(Status::Unknown);
    }
}

} // namespace uuidcore::ffi
