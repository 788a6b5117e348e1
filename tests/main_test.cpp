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
 * @file main_test.cpp
 * @brief Central orchestrator for the uuidcore test suite.
 *
 * @details
 * Aggregates the unit and integration tests of every subsystem:
 * Infrastructure, Codec, C ABI, C++ Adapter, CLI Options and CLI Reports.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_to_lower();
void test_string_hex_helpers();
void test_logger_parse_level();
void test_logger_threshold();
void test_config_defaults();
void test_config_from_values();
void test_entropy_fill();
void test_entropy_null_destination();
void test_entropy_rejects_oversized_request();
void test_config_env_keeps_explicit_logger();

// Identifier Codec (codec_test.cpp)
void test_uuid_length();
void test_uuid_uniqueness();
void test_generate_sets_version_and_variant();
void test_render_known_vector();
void test_write_to_exact_capacity();
void test_write_to_rejects_small_buffer();
void test_info_extraction();
void test_from_bytes_preserves_input();
void test_from_bytes_rejects_wrong_length();
void test_parse_canonical();
void test_parse_rejects_malformed();
void test_comparator();
void test_status_codes();

// C ABI Boundary (abi_test.cpp)
void test_abi_first_call_keeps_host_log_level();
void test_abi_log_levels();
void test_abi_generate_v4();
void test_abi_null_pointers();
void test_abi_to_string_capacity_10();
void test_abi_to_string_capacity_boundary();
void test_abi_to_string_any_bytes();
void test_abi_get_info_vector();
void test_abi_compare();
void test_abi_from_bytes_length();
void test_abi_from_bytes_round_trip();
void test_abi_parse();
void test_abi_status_message();
void test_abi_guard_mapping();
void test_abi_statistical_randomness();
void test_abi_concurrent_generation();

// C++ Adapter (adapter_test.cpp)
void test_adapter_round_trip();
void test_adapter_from_bytes_errors();
void test_adapter_parse_errors();
void test_adapter_check_status();
void test_adapter_generator_handle();
void test_adapter_default_generator_once();

// CLI Options (cli_options_test.cpp)
void test_cli_defaults();
void test_cli_help_anywhere();
void test_cli_options_parsed();
void test_cli_rejects_bad_arguments();

// CLI Reports (report_test.cpp)
void test_report_json();
void test_report_json_single_line();
void test_report_explain();
void test_report_json_allocation_failure();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed.
 * - 1: One or more assertions failed.
 */
int main()
{
    std::cout << "\033[36mInitiating uuidcore Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_to_lower);
    RUN_TEST(test_string_hex_helpers);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_from_values);
    RUN_TEST(test_entropy_fill);
    RUN_TEST(test_entropy_null_destination);
    RUN_TEST(test_entropy_rejects_oversized_request);
    RUN_TEST(test_config_env_keeps_explicit_logger);

    // --- 2. Identifier Codec ---
    RUN_TEST(test_uuid_length);
    RUN_TEST(test_uuid_uniqueness);
    RUN_TEST(test_generate_sets_version_and_variant);
    RUN_TEST(test_render_known_vector);
    RUN_TEST(test_write_to_exact_capacity);
    RUN_TEST(test_write_to_rejects_small_buffer);
    RUN_TEST(test_info_extraction);
    RUN_TEST(test_from_bytes_preserves_input);
    RUN_TEST(test_from_bytes_rejects_wrong_length);
    RUN_TEST(test_parse_canonical);
    RUN_TEST(test_parse_rejects_malformed);
    RUN_TEST(test_comparator);
    RUN_TEST(test_status_codes);

    // --- 3. C ABI Boundary ---
    // Status codes, buffer discipline and generation quality as seen by a foreign caller.
    RUN_TEST(test_abi_first_call_keeps_host_log_level);
    RUN_TEST(test_abi_log_levels);
    RUN_TEST(test_abi_generate_v4);
    RUN_TEST(test_abi_null_pointers);
    RUN_TEST(test_abi_to_string_capacity_10);
    RUN_TEST(test_abi_to_string_capacity_boundary);
    RUN_TEST(test_abi_to_string_any_bytes);
    RUN_TEST(test_abi_get_info_vector);
    RUN_TEST(test_abi_compare);
    RUN_TEST(test_abi_from_bytes_length);
    RUN_TEST(test_abi_from_bytes_round_trip);
    RUN_TEST(test_abi_parse);
    RUN_TEST(test_abi_status_message);
    RUN_TEST(test_abi_guard_mapping);
    RUN_TEST(test_abi_statistical_randomness);
    RUN_TEST(test_abi_concurrent_generation);

    // --- 4. C++ Adapter ---
    RUN_TEST(test_adapter_round_trip);
    RUN_TEST(test_adapter_from_bytes_errors);
    RUN_TEST(test_adapter_parse_errors);
    RUN_TEST(test_adapter_check_status);
    RUN_TEST(test_adapter_generator_handle);
    RUN_TEST(test_adapter_default_generator_once);

    // --- 5. CLI Options ---
    RUN_TEST(test_cli_defaults);
    RUN_TEST(test_cli_help_anywhere);
    RUN_TEST(test_cli_options_parsed);
    RUN_TEST(test_cli_rejects_bad_arguments);

    // --- 6. CLI Reports ---
    RUN_TEST(test_report_json);
    RUN_TEST(test_report_json_single_line);
    RUN_TEST(test_report_explain);
    RUN_TEST(test_report_json_allocation_failure);

    uuidcore::test::print_summary();

    return (uuidcore::test::failed_count == 0) ? 0 : 1;
}
