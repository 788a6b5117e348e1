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
 * @file export_test.cpp
 * @brief Checks the dynamic symbol table of the shared library.
 *
 * @details
 * Loads `libuuidcore.so` (path given as the first argument) with `dlopen` and
 * verifies that every C ABI function resolves while internal C++ symbols stay
 * hidden.
 */

#include "framework.hpp"
#include "uuidcore/ffi/uuid_abi.h"

#include <dlfcn.h>
#include <iostream>
#include <string>

namespace {

const char* library_path = nullptr;

/**
 * @class ScopedLibrary
 * @brief RAII owner of a `dlopen` handle.
 */
class ScopedLibrary {
  public:
    explicit ScopedLibrary(const char* path) : handle_(dlopen(path, RTLD_NOW | RTLD_LOCAL)) {}

    ScopedLibrary(const ScopedLibrary&) = delete;
    ScopedLibrary& operator=(const ScopedLibrary&) = delete;

    ~ScopedLibrary()
    {
        if (handle_) {
            dlclose(handle_);
        }
    }

    bool exports(const char* symbol) const
    {
        return handle_ && dlsym(handle_, symbol) != nullptr;
    }

    void* get() const
    {
        return handle_;
    }

  private:
    void* handle_;
};

} // namespace

/**
 * @brief All seven C functions are visible and callable through `dlsym`.
 */
void test_exports_c_abi()
{
    ScopedLibrary lib(library_path);
    ASSERT_TRUE(lib.get() != nullptr);

    for (const char* name : {"uuid_generate_v4", "uuid_to_string", "uuid_get_info", "uuid_compare",
                             "uuid_from_bytes", "uuid_parse", "uuid_status_message"}) {
        ASSERT_TRUE(lib.exports(name));
    }

    using GenerateFn = int32_t (*)(uint8_t*);
    auto generate = reinterpret_cast<GenerateFn>(dlsym(lib.get(), "uuid_generate_v4"));
    uint8_t id[UUIDCORE_UUID_SIZE] = {};
    ASSERT_EQ(generate(id), static_cast<int32_t>(UUIDCORE_SUCCESS));
    ASSERT_EQ(static_cast<int>(id[6] >> 4), 4);
}

/**
 * @brief Internal C++ classes do not leak into the dynamic symbol table.
 */
void test_hides_internal_symbols()
{
    ScopedLibrary lib(library_path);
    ASSERT_TRUE(lib.get() != nullptr);

    // uuidcore::core::Uuid::generate_v4()
    ASSERT_FALSE(lib.exports("_ZN8uuidcore4core4Uuid11generate_v4Ev"));
    // uuidcore::infra::Logger::mutex_
    ASSERT_FALSE(lib.exports("_ZN8uuidcore5infra6Logger6mutex_E"));
}

int main(int argc, char* argv[])
{
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <path to libuuidcore.so>" << std::endl;
        return 2;
    }
    library_path = argv[1];

    RUN_TEST(test_exports_c_abi);
    RUN_TEST(test_hides_internal_symbols);

    uuidcore::test::print_summary();

    return (uuidcore::test::failed_count == 0) ? 0 : 1;
}
