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
 * @file config.cpp
 * @brief Environment-driven configuration loading.
 */

#include "uuidcore/infra/config.hpp"

#include "uuidcore/infra/string.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace uuidcore::infra {

namespace {

std::optional<std::string> read_env(const char* name)
{
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

Config Config::from_env()
{
    return from_values(read_env("UUIDCORE_LOG_LEVEL"), read_env("UUIDCORE_LOG_COLOR"));
}

Config Config::from_values(const std::optional<std::string>& level_text,
                           const std::optional<std::string>& color_text)
{
    Config cfg;

    if (level_text && !String::trim(*level_text).empty()) {
        try {
            cfg.log_level = Logger::parse_level(*level_text);
        } catch (const std::invalid_argument& e) {
            Logger::log(LogLevel::WARN,
                        "Config: " + std::string(e.what()) + " in UUIDCORE_LOG_LEVEL, keeping '" +
                            Logger::level_name(cfg.log_level) + "'");
        }
    }

    if (color_text) {
        const std::string v = String::to_lower(String::trim(*color_text));
        if (v == "0" || v == "false" || v == "off" || v == "no") {
            cfg.color = false;
        }
    }

    return cfg;
}

void Config::apply() const
{
    Logger::set_level(log_level);
    Logger::set_color(color);
}

void Config::apply_env_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        // Settings made by the host through the Logger take precedence.
        if (Logger::configured()) {
            return;
        }
        from_env().apply();
    });
}

} // namespace uuidcore::infra
