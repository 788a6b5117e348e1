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
 * @file main.cpp
 * @brief `uuidcore-cli` entry point.
 *
 * @details
 * This file contains the `main` function, which runs in this order:
 * 1. Environment configuration (`UUIDCORE_LOG_LEVEL`, `UUIDCORE_LOG_COLOR`).
 * 2. Argument Parsing.
 * 3. Generation or inspection of identifiers.
 */

#include "uuidcore/core/status.hpp"
#include "uuidcore/core/uuid.hpp"
#include "uuidcore/infra/config.hpp"
#include "uuidcore/infra/logger.hpp"
#include "uuidcore/tool/cli_options.hpp"
#include "uuidcore/tool/report.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void describe(const uuidcore::core::Uuid& id, bool json)
{
    if (json) {
        std::cout << uuidcore::tool::Report::to_json(id) << "\n";
    } else {
        std::cout << uuidcore::tool::Report::explain(id);
    }
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 *
 * @return 0 on success, 1 on a generation failure, 2 on a usage error or a
 * malformed `--inspect` argument.
 */
int main(int argc, char* argv[])
{
    using uuidcore::core::Uuid;
    using uuidcore::infra::LogLevel;
    using uuidcore::infra::Logger;
    using uuidcore::tool::CliOptions;
    using uuidcore::tool::Mode;

    uuidcore::infra::Config::from_env().apply();

    CliOptions opts;
    try {
        opts = CliOptions::parse(argc, argv);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::ERROR, std::string("CLI: ") + e.what());
        CliOptions::print_help(std::cerr, argv[0]);
        return 2;
    }

    if (opts.help) {
        CliOptions::print_help(std::cout, argv[0]);
        return 0;
    }
    if (opts.log_level) {
        Logger::set_level(*opts.log_level);
    }

    try {
        switch (opts.mode) {
        case Mode::Inspect:
            Logger::log(LogLevel::DEBUG, "CLI: Inspecting '" + opts.inspect + "'");
            describe(Uuid::parse(opts.inspect), opts.json);
            break;
        case Mode::Explain:
            describe(Uuid::generate_v4(), opts.json);
            break;
        case Mode::Generate:
            Logger::log(LogLevel::INFO, "CLI: Generating " + std::to_string(opts.count) +
                                            " identifier(s)");
            for (long i = 0; i < opts.count; ++i) {
                const Uuid id = Uuid::generate_v4();
                if (opts.json) {
                    std::cout << uuidcore::tool::Report::to_json(id) << "\n";
                } else {
                    std::cout << id.to_string() << "\n";
                }
            }
            break;
        }
    } catch (const uuidcore::core::UuidError& e) {
        Logger::log(LogLevel::FATAL, std::string("CLI: ") + e.what());
        return e.status() == uuidcore::core::Status::InvalidParameter ? 2 : 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "CLI: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    std::cout.flush();
    return 0;
}
