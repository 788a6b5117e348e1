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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for uuidcore.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used by
 * the library, the ABI boundary and the command-line tool. Output is serialized
 * across threads so that lines never interleave, and a process-wide severity
 * threshold keeps the library silent on `stdout` unless asked otherwise.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace uuidcore::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Rejected arguments and other caller-side mistakes.
    INFO,  ///< Nominal operational events (e.g., CLI start-up).
    WARN,  ///< Ignored configuration values and similar anomalies.
    ERROR, ///< Entropy faults and unexpected exceptions at the boundary.
    FATAL  ///< Failures that end the CLI process.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * Messages below the current threshold are discarded before the output lock is
 * taken, so disabled levels cost a single atomic load.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * uuidcore::infra::Logger::log(LogLevel::ERROR, "Entropy: getrandom failed");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// Sets the minimum severity that reaches the console and marks the Logger configured.
    static void set_level(LogLevel level);

    /// Returns the current minimum severity. Defaults to `LogLevel::WARN`.
    static LogLevel level();

    /// Returns true when a message of `level` would be written.
    static bool enabled(LogLevel level);

    /// Enables or disables ANSI color sequences and marks the Logger configured.
    static void set_color(bool enabled);

    /**
     * @brief Returns true once `set_level` or `set_color` has been called.
     *
     * `Config::apply_env_once` consults this so that a host which configured
     * the Logger itself keeps its settings on the first ABI call.
     */
    static bool configured();

    /**
     * @brief Converts a level name to a `LogLevel`.
     *
     * Accepts `trace`, `debug`, `info`, `warn`, `warning`, `error` and `fatal`,
     * ignoring case and surrounding whitespace.
     *
     * @throws std::invalid_argument if the name is not recognized.
     */
    static LogLevel parse_level(const std::string& name);

    /// Returns the lowercase canonical name of `level`.
    static const char* level_name(LogLevel level);

  private:
    /**
     * @brief Global synchronization primitive.
     *
     * Guards access to `std::cout` and `std::cerr` so that concurrent callers
     * never interleave their lines.
     */
    static std::mutex mutex_;

    static std::atomic<int> threshold_;
    static std::atomic<bool> color_;
    static std::atomic<bool> configured_;
};

} // namespace uuidcore::infra
