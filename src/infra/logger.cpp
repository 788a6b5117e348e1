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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats log entries with a local timestamp, a severity tag and optional ANSI
 * color codes, and filters them against the process-wide threshold.
 */

#include "uuidcore/infra/logger.hpp"

#include "uuidcore/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace uuidcore::infra {

std::mutex Logger::mutex_;
std::atomic<int> Logger::threshold_{static_cast<int>(LogLevel::WARN)};
std::atomic<bool> Logger::color_{true};
std::atomic<bool> Logger::configured_{false};

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops the message if it is below the threshold.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stream Segregation**: Routes messages to `stdout` or `stderr` based on severity.
 * 4. **Stylization**: Injects ANSI escape sequences when color is enabled.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    const bool color = color_.load(std::memory_order_relaxed);

    // Mutex also protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    const char* ansi = "";
    const char* tag = "";
    switch (level) {
    case LogLevel::TRACE:
        ansi = "\033[90m";
        tag = "[TRCE] ";
        break;
    case LogLevel::DEBUG:
        ansi = "\033[36m";
        tag = "[DBUG] ";
        break;
    case LogLevel::INFO:
        ansi = "\033[32m";
        tag = "[INFO] ";
        break;
    case LogLevel::WARN:
        ansi = "\033[33m";
        tag = "[WARN] ";
        break;
    case LogLevel::ERROR:
        ansi = "\033[31m";
        tag = "[FAIL] ";
        break;
    case LogLevel::FATAL:
        ansi = "\033[1;31m";
        tag = "[CRIT] ";
        break;
    }

    if (color) {
        stream << ansi << tag << message << "\033[0m" << std::endl;
    } else {
        stream << tag << message << std::endl;
    }
}

void Logger::set_level(LogLevel level)
{
    threshold_.store(static_cast<int>(level), std::memory_order_relaxed);
    configured_.store(true, std::memory_order_release);
}

LogLevel Logger::level()
{
    return static_cast<LogLevel>(threshold_.load(std::memory_order_relaxed));
}

bool Logger::enabled(LogLevel level)
{
    return static_cast<int>(level) >= threshold_.load(std::memory_order_relaxed);
}

void Logger::set_color(bool enabled)
{
    color_.store(enabled, std::memory_order_relaxed);
    configured_.store(true, std::memory_order_release);
}

bool Logger::configured()
{
    return configured_.load(std::memory_order_acquire);
}

LogLevel Logger::parse_level(const std::string& name)
{
    const std::string key = String::to_lower(String::trim(name));

    if (key == "trace")
        return LogLevel::TRACE;
    if (key == "debug")
        return LogLevel::DEBUG;
    if (key == "info")
        return LogLevel::INFO;
    if (key == "warn" || key == "warning")
        return LogLevel::WARN;
    if (key == "error")
        return LogLevel::ERROR;
    if (key == "fatal")
        return LogLevel::FATAL;

    throw std::invalid_argument("Unknown log level: '" + name + "'");
}

const char* Logger::level_name(LogLevel level)
{
    switch (level) {
    case LogLevel::TRACE:
        return "trace";
    case LogLevel::DEBUG:
        return "debug";
    case LogLevel::INFO:
        return "info";
    case LogLevel::WARN:
        return "warn";
    case LogLevel::ERROR:
        return "error";
    case LogLevel::FATAL:
        return "fatal";
    }
    return "unknown";
}

} // namespace uuidcore::infra
