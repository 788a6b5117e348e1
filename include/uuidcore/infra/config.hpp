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
 * @file config.hpp
 * @brief Runtime configuration for the library and the command-line tool.
 *
 * @details
 * `uuidcore` is loaded into foreign processes, so it cannot take command-line
 * arguments of its own. Its few knobs are read from the environment instead:
 *
 * | Variable              | Meaning                        | Default |
 * |-----------------------|--------------------------------|---------|
 * | `UUIDCORE_LOG_LEVEL`  | Logger threshold               | `warn`  |
 * | `UUIDCORE_LOG_COLOR`  | ANSI colors (`0/false/off/no`) | on      |
 */

#pragma once

#include "uuidcore/infra/logger.hpp"

#include <optional>
#include <string>

namespace uuidcore::infra {

/**
 * @struct Config
 * @brief Plain settings record with environment loading and application helpers.
 */
struct Config {
    LogLevel log_level = LogLevel::WARN;
    bool color = true;

    /**
     * @brief Builds a configuration from the process environment.
     *
     * Unset variables keep their defaults. An unparseable level is reported at
     * `WARN` and ignored.
     */
    static Config from_env();

    /**
     * @brief Builds a configuration from explicit variable values.
     *
     * `from_env()` forwards to this overload; tests call it directly.
     *
     * @param level_text Value of `UUIDCORE_LOG_LEVEL`, if set.
     * @param color_text Value of `UUIDCORE_LOG_COLOR`, if set.
     */
    static Config from_values(const std::optional<std::string>& level_text,
                              const std::optional<std::string>& color_text);

    /// Pushes the settings into the global `Logger`.
    void apply() const;

    /**
     * @brief Applies `from_env()` exactly once per process.
     *
     * Safe to call from any number of threads; only the first call does work.
     * Does nothing if the Logger was already configured explicitly, so a host
     * that calls `Logger::set_level` before its first ABI call keeps its level.
     */
    static void apply_env_once();
};

} // namespace uuidcore::infra
