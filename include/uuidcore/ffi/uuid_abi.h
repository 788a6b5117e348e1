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
 * @file uuid_abi.h
 * @brief Stable C ABI exported by the `uuidcore` shared library.
 *
 * @details
 * This header is valid C and C++. It is the only contract foreign runtimes
 * (ctypes, JNI, P/Invoke, cgo, N-API) rely on.
 *
 * ## Rules
 * 1. **Caller-owned memory**: every buffer is allocated and freed by the caller.
 *    The library never returns memory to be freed and never keeps a pointer
 *    after the call returns.
 * 2. **Status first**: every function returns a `uuid_status_t` value as an
 *    `int32_t`. Computed values go to output parameters.
 * 3. **No undefined behavior on bad input**: null pointers and undersized
 *    buffers are detected and reported; no exception crosses this boundary.
 * 4. **Outputs are only meaningful on success**: on a non-zero status the
 *    contents of output parameters are unspecified (in practice, untouched).
 * 5. **Thread safety**: all functions may be called concurrently.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#if defined(__GNUC__) || defined(__clang__)
#define UUIDCORE_API __attribute__((visibility("default")))
#else
#define UUIDCORE_API
#endif

/// Size in bytes of a raw identifier.
#define UUIDCORE_UUID_SIZE 16

/// Minimum capacity for `uuid_to_string` (36 characters plus NUL).
#define UUIDCORE_STRING_CAPACITY 37

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Status codes returned by every exported function.
 *
 * The numeric values are frozen. New codes may only take unused numbers.
 */
typedef enum {
    UUIDCORE_SUCCESS = 0,           /**< Operation completed successfully. */
    UUIDCORE_ENTROPY_FAILURE = 1,   /**< The OS random source failed. */
    UUIDCORE_INVALID_PARAMETER = 2, /**< Null pointer, wrong length, malformed text. */
    UUIDCORE_BUFFER_TOO_SMALL = 3,  /**< Output buffer cannot hold the result. */
    UUIDCORE_UNKNOWN_ERROR = 99     /**< Unanticipated internal fault. */
} uuid_status_t;

/**
 * @brief Generates a new random Version 4 identifier.
 *
 * @param out_bytes Caller buffer of at least 16 bytes.
 * @return `UUIDCORE_SUCCESS`, `UUIDCORE_INVALID_PARAMETER` if `out_bytes` is
 * null, or `UUIDCORE_ENTROPY_FAILURE` if the OS source failed.
 *
 * @code
 * uint8_t id[UUIDCORE_UUID_SIZE];
 * if (uuid_generate_v4(id) != UUIDCORE_SUCCESS) {
 *     // handle error
 * }
 * @endcode
 */
UUIDCORE_API int32_t uuid_generate_v4(uint8_t* out_bytes);

/**
 * @brief Writes the canonical lowercase `8-4-4-4-12` form, NUL-terminated.
 *
 * @param in_bytes 16-byte identifier.
 * @param out_string Caller buffer.
 * @param out_capacity Size of `out_string` in bytes; must be at least 37.
 * @return `UUIDCORE_SUCCESS`, `UUIDCORE_INVALID_PARAMETER` for null pointers,
 * or `UUIDCORE_BUFFER_TOO_SMALL` (nothing written) if `out_capacity < 37`.
 */
UUIDCORE_API int32_t uuid_to_string(const uint8_t* in_bytes, char* out_string,
                                    size_t out_capacity);

/**
 * @brief Reads the version and variant fields of an identifier.
 *
 * Any 16-byte pattern is accepted. Variant values: 0 NCS, 2 RFC 4122,
 * 6 Microsoft, 7 reserved.
 *
 * @return `UUIDCORE_SUCCESS` or `UUIDCORE_INVALID_PARAMETER` for null pointers.
 */
UUIDCORE_API int32_t uuid_get_info(const uint8_t* in_bytes, uint8_t* out_version,
                                   uint8_t* out_variant);

/**
 * @brief Byte-wise equality of two identifiers.
 *
 * @param out_equal Receives 1 if all 16 bytes match, 0 otherwise.
 * @return `UUIDCORE_SUCCESS` or `UUIDCORE_INVALID_PARAMETER` for null pointers.
 */
UUIDCORE_API int32_t uuid_compare(const uint8_t* a_bytes, const uint8_t* b_bytes,
                                  uint8_t* out_equal);

/**
 * @brief Validates a caller buffer as an identifier and copies it unchanged.
 *
 * @param in_bytes Source buffer.
 * @param in_len Length of `in_bytes`; anything other than 16 is rejected
 * before any byte is read.
 * @param out_bytes Caller buffer of at least 16 bytes.
 * @return `UUIDCORE_SUCCESS` or `UUIDCORE_INVALID_PARAMETER`.
 */
UUIDCORE_API int32_t uuid_from_bytes(const uint8_t* in_bytes, size_t in_len, uint8_t* out_bytes);

/**
 * @brief Parses the canonical text form into 16 bytes.
 *
 * @param in_string Text, not necessarily NUL-terminated.
 * @param in_len Number of characters in `in_string`; must be 36.
 * @param out_bytes Caller buffer of at least 16 bytes; untouched on failure.
 * @return `UUIDCORE_SUCCESS` or `UUIDCORE_INVALID_PARAMETER`.
 */
UUIDCORE_API int32_t uuid_parse(const char* in_string, size_t in_len, uint8_t* out_bytes);

/**
 * @brief Returns a static description of a status code.
 *
 * The pointer refers to a string literal; it must not be freed. Unrecognized
 * codes yield "Invalid status code". Never returns null.
 */
UUIDCORE_API const char* uuid_status_message(int32_t status);

#ifdef __cplusplus
}
#endif
