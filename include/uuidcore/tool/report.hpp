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
 * @file report.hpp
 * @brief Human- and machine-readable descriptions of an identifier.
 *
 * @details
 * Used by `uuidcore-cli` for its `--json`, `--explain` and `--inspect` modes.
 */

#pragma once

#include "uuidcore/core/uuid.hpp"

#include <string>

namespace uuidcore::tool {

/**
 * @class Report
 * @brief Static formatters over `core::Uuid`.
 */
class Report {
  public:
    /**
     * @brief Serializes an identifier as a single-line JSON object.
     *
     * **Shape:**
     * ```json
     * {"uuid":"...","version":4,"variant":2,"variant_name":"RFC 4122","bytes":[...16 ints...]}
     * ```
     *
     * @throws std::runtime_error if cJSON fails to allocate.
     */
    static std::string to_json(const core::Uuid& id);

    /**
     * @brief Multi-line field breakdown following the RFC 9562 layout.
     *
     * Lists the raw bytes, each field group (time_low, time_mid,
     * time_hi_and_version, clock_seq, node), and the version and variant bits.
     */
    static std::string explain(const core::Uuid& id);
};

} // namespace uuidcore::tool
