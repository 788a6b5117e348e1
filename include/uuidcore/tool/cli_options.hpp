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
 * @file cli_options.hpp
 * @brief Command-line option model and parser for `uuidcore-cli`.
 */

#pragma once

#include "uuidcore/infra/logger.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace uuidcore::tool {

enum class Mode { Generate, Explain, Inspect };

/**
 * @struct CliOptions
 * @brief Parsed invocation of `uuidcore-cli`.
 */
struct CliOptions {
    static constexpr long kMaxCount = 100000;

    Mode mode = Mode::Generate;
    long count = 1;
    bool json = false;
    bool help = false;
    std::string inspect;
    std::optional<infra::LogLevel> log_level;

    /**
     * @brief Parses `argv[1..argc)`.
     *
     * `--help` anywhere on the line stops parsing and sets `help`; arguments
     * after it are not examined.
     *
     * @throws std::invalid_argument on an unknown option, a missing value, a
     * count outside 1..`kMaxCount`, or an unknown log level.
     */
    static CliOptions parse(int argc, const char* const argv[]);

    /// Writes the usage text.
    static void print_help(std::ostream& out, const char* binary_name);
};

} // namespace uuidcore::tool
