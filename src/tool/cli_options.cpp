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
 * @file cli_options.cpp
 * @brief Argument parsing for `uuidcore-cli`.
 */

#include "uuidcore/tool/cli_options.hpp"

#include <stdexcept>

namespace uuidcore::tool {

namespace {

std::string require_value(int argc, const char* const argv[], int& i)
{
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

long parse_count(const std::string& value)
{
    long count = 0;
    std::size_t used = 0;
    try {
        count = std::stol(value, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Count is not a number: " + value);
    }
    if (used != value.size() || count < 1 || count > CliOptions::kMaxCount) {
        throw std::invalid_argument("Count out of range: " + value);
    }
    return count;
}

} // namespace

CliOptions CliOptions::parse(int argc, const char* const argv[])
{
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            opts.help = true;
            return opts;
        } else if (arg == "-n" || arg == "--count") {
            opts.count = parse_count(require_value(argc, argv, i));
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--explain") {
            opts.mode = Mode::Explain;
        } else if (arg == "--inspect") {
            opts.mode = Mode::Inspect;
            opts.inspect = require_value(argc, argv, i);
        } else if (arg == "--log-level") {
            opts.log_level = infra::Logger::parse_level(require_value(argc, argv, i));
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return opts;
}

void CliOptions::print_help(std::ostream& out, const char* binary_name)
{
    out << "Usage: " << binary_name << " [OPTIONS]\n"
        << "Options:\n"
        << "  -n, --count N       Print N identifiers (1-" << kMaxCount << ", Default: 1)\n"
        << "  --json              Print each identifier as a JSON object\n"
        << "  --explain           Print a field-by-field breakdown of a new identifier\n"
        << "  --inspect UUID      Describe an existing identifier\n"
        << "  --log-level LEVEL   trace|debug|info|warn|error|fatal (Default: warn)\n"
        << "  -h, --help          Show this help message\n"
        << "Environment:\n"
        << "  UUIDCORE_LOG_LEVEL, UUIDCORE_LOG_COLOR\n";
}

} // namespace uuidcore::tool
