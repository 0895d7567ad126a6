/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "platform.hpp"
#include "string.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdlib>

#ifndef DSK_ENABLE_SPDLOG
    #define DSK_ENABLE_SPDLOG 0
#endif

#if DSK_ENABLE_SPDLOG

    #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

    #if DSK_MACOS
        #define SPDLOG_FUNCTION __PRETTY_FUNCTION__
    #endif

    #include <spdlog/spdlog.h>

    #ifndef DSK_TRACE
        #define DSK_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #endif

    #ifndef DSK_DEBUG
        #define DSK_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #endif

    #ifndef DSK_CRITICAL
        #define DSK_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
    #endif

    #ifndef DSK_ERROR
        #define DSK_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #endif

    #ifndef DSK_WARNING
        #define DSK_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #endif

    #ifndef DSK_INFO
        #define DSK_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #endif

#else

namespace dsk {

enum class LogLevel { off, critical, error, warning, info, debug, trace };

inline std::atomic<LogLevel> log_level {LogLevel::info};

}  // namespace dsk

    #define DSK_LOG_WITH_PREFIX_(level, prefix, ...)                   \
        if (dsk::log_level.load() >= (level)) {                         \
            fmt::print(stderr, prefix " {}\n", fmt::format(__VA_ARGS__)); \
        }

    #ifndef DSK_TRACE
        #define DSK_TRACE(...) DSK_LOG_WITH_PREFIX_(dsk::LogLevel::trace, "[T]", __VA_ARGS__)
    #endif

    #ifndef DSK_DEBUG
        #define DSK_DEBUG(...) DSK_LOG_WITH_PREFIX_(dsk::LogLevel::debug, "[D]", __VA_ARGS__)
    #endif

    #ifndef DSK_CRITICAL
        #define DSK_CRITICAL(...) DSK_LOG_WITH_PREFIX_(dsk::LogLevel::critical, "[C]", __VA_ARGS__)
    #endif

    #ifndef DSK_ERROR
        #define DSK_ERROR(...) DSK_LOG_WITH_PREFIX_(dsk::LogLevel::error, "[E]", __VA_ARGS__)
    #endif

    #ifndef DSK_WARNING
        #define DSK_WARNING(...) DSK_LOG_WITH_PREFIX_(dsk::LogLevel::warning, "[W]", __VA_ARGS__)
    #endif

    #ifndef DSK_INFO
        #define DSK_INFO(...) DSK_LOG_WITH_PREFIX_(dsk::LogLevel::info, "[I]", __VA_ARGS__)
    #endif

#endif

namespace dsk {

/**
 * Sets the log level for the application based on the given string.
 * The following are valid values:
 *  - TRACE
 *  - DEBUG
 *  - INFO (default)
 *  - WARN
 *  - ERROR
 *  - CRITICAL
 *  - OFF
 * @param level The log level as string, case-insensitive.
 */
inline void set_log_level(const char* level) {
#if DSK_ENABLE_SPDLOG
    if (string_compare_case_insensitive(level, "TRACE")) {
        spdlog::set_level(spdlog::level::trace);
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        spdlog::set_level(spdlog::level::debug);
    } else if (string_compare_case_insensitive(level, "INFO")) {
        spdlog::set_level(spdlog::level::info);
    } else if (string_compare_case_insensitive(level, "WARN")) {
        spdlog::set_level(spdlog::level::warn);
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        spdlog::set_level(spdlog::level::err);
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        spdlog::set_level(spdlog::level::critical);
    } else if (string_compare_case_insensitive(level, "OFF")) {
        spdlog::set_level(spdlog::level::off);
    } else {
        fmt::print("Invalid log level: {}. Setting log level to info.\n", level);
        spdlog::set_level(spdlog::level::info);
    }
#else
    if (string_compare_case_insensitive(level, "TRACE")) {
        log_level = LogLevel::trace;
    } else if (string_compare_case_insensitive(level, "DEBUG")) {
        log_level = LogLevel::debug;
    } else if (string_compare_case_insensitive(level, "INFO")) {
        log_level = LogLevel::info;
    } else if (string_compare_case_insensitive(level, "WARN")) {
        log_level = LogLevel::warning;
    } else if (string_compare_case_insensitive(level, "ERROR")) {
        log_level = LogLevel::error;
    } else if (string_compare_case_insensitive(level, "CRITICAL")) {
        log_level = LogLevel::critical;
    } else if (string_compare_case_insensitive(level, "OFF")) {
        log_level = LogLevel::off;
    } else {
        fmt::print("Invalid log level: {}. Setting log level to info.\n", level);
        log_level = LogLevel::info;
    }
#endif
}

/**
 * Sets the log level from an environment variable, see set_log_level() for the valid values. The level is INFO when
 * the variable is not set.
 * @param env_var The environment variable to read the log level from.
 */
inline void set_log_level_from_env(const char* env_var = "DSK_LOG_LEVEL") {
    const char* value = std::getenv(env_var);  // NOLINT(concurrency-mt-unsafe)
    set_log_level(value != nullptr ? value : "INFO");
}

}  // namespace dsk
