#pragma once

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cerrno>
#include <string>
#include <string_view>
#include <system_error>

// Set log level based on whether we're in DEBUG mode
// Needs to be done before including spdlog
#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(RELEASE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#endif

#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Wrappers for spdlog macros
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

namespace refcheck {

/// Obtain Linux error code message given by ``err`` via libc functions
inline std::string get_err_msg(int err) {
    return std::error_code(err, std::generic_category()).message();
}

/// Obtain Linux error (i.e., ``errno``) message via libc functions
inline std::string get_err_msg() {
    return get_err_msg(errno);
}

inline void init_loggers() {
#if defined(DEBUG)
    spdlog::set_level(spdlog::level::debug);
#elif defined(RELEASE)
    spdlog::set_level(spdlog::level::err);
#else
    spdlog::set_level(spdlog::level::warn);
#endif

    // Override any previously set log-level with the enviornment variable LOG_LEVEL, if set
    spdlog::cfg::load_env_levels("LOG_LEVEL");

#if defined(DEBUG) || defined(TRACE)
    spdlog::set_pattern("[%T.%e] [%^%8l%$] [pid %6P] [%30!!@%20!s:%-4#] %v");
#else
    // Pattern:
    //   time - [HH:MM:SS.MS]
    //   level (colored, center aligned) - [ info ]
    //   process id - [pid 12345]; workers log too, so this is how their lines are told apart
    //   message - "foo bar"
    spdlog::set_pattern("[%T.%e] [%^%=8l%$] [pid %6P] %v");
#endif

    // Log to stderr, so that stdout only carries the messages meant for the person being graded
    // Registering the same name twice throws
    if (spdlog::get("default") == nullptr) {
        spdlog::set_default_logger(spdlog::stderr_color_st("default"));
    }
}

} // namespace refcheck
