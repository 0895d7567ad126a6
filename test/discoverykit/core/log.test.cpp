/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */


#include "discoverykit/core/log.hpp"

#include <catch2/catch_all.hpp>

#include <cstdlib>

namespace {

bool log_level_is_info() {
#if DSK_ENABLE_SPDLOG
    return spdlog::get_level() == spdlog::level::info;
#else
    return dsk::log_level == dsk::LogLevel::info;
#endif
}

bool log_level_is_trace() {
#if DSK_ENABLE_SPDLOG
    return spdlog::get_level() == spdlog::level::trace;
#else
    return dsk::log_level == dsk::LogLevel::trace;
#endif
}

}  // namespace

TEST_CASE("dsk::set_log_level") {
    SECTION("Level names are case-insensitive") {
        dsk::set_log_level("tRaCe");
        REQUIRE(log_level_is_trace());
    }

    SECTION("An unknown level falls back to info") {
        dsk::set_log_level("trace");
        dsk::set_log_level("verbose");
        REQUIRE(log_level_is_info());
    }

    SECTION("An unset variable means info") {
        dsk::set_log_level("trace");
        dsk::set_log_level_from_env("DSK_LOG_LEVEL_NOT_SET_ANYWHERE");
        REQUIRE(log_level_is_info());
    }

#if !defined(_WIN32)
    SECTION("The level is read from the variable") {
        REQUIRE(::setenv("DSK_LOG_LEVEL_TEST", "TRACE", 1) == 0);
        dsk::set_log_level_from_env("DSK_LOG_LEVEL_TEST");
        REQUIRE(log_level_is_trace());
        REQUIRE(::unsetenv("DSK_LOG_LEVEL_TEST") == 0);
    }
#endif

    dsk::set_log_level_from_env();
}
