/// \file
/// Logging macros and logger setup shared by the host driver, the in-sandbox grader and the tests.
/// Sandbox workers log from their own threads, so messages carry the thread id.
#pragma once

#include <batchgrader/common/class_traits.hpp>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

// Compile-time floor for the LOG_* macros; must be defined before spdlog is included
#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(RELEASE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif

#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

/// Evaluates ``expr`` and, in debug builds, logs how long it took. Yields the value of ``expr``.
#ifdef DEBUG
#define DEBUG_TIME(expr)                                                                                               \
    [&]() {                                                                                                            \
        const ::batchgrader::detail::ScopeTimer scope_timer__{#expr};                                                  \
        return expr;                                                                                                   \
    }()
#else
#define DEBUG_TIME(expr) expr
#endif

namespace batchgrader {

/// Name of the environment variable that overrides the log level (spdlog's ``load_env_levels`` syntax)
constexpr const char* LOG_LEVEL_ENV = "LOG_LEVEL";

namespace detail {

class ScopeTimer : NonMovable
{
public:
    explicit ScopeTimer(std::string_view label)
        : label_{label}
        , start_{std::chrono::steady_clock::now()} {}

    ~ScopeTimer() {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
        LOG_DEBUG("{} took {}", label_, elapsed);
    }

private:
    std::string_view label_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail

/// Message for the error number ``err``
inline std::string get_err_msg(int err) {
    return std::error_code(err, std::generic_category()).message();
}

/// Message for the current ``errno``
inline std::string get_err_msg() {
    return get_err_msg(errno);
}

/// Installs a thread-safe stderr logger as the default one.
/// ``LOG_LEVEL`` from the environment takes precedence over the build's default level.
inline void init_loggers() {
    spdlog::drop("default");
    spdlog::set_default_logger(spdlog::stderr_color_mt("default"));

#if defined(DEBUG) || defined(TRACE)
    spdlog::set_level(spdlog::level::debug);
    spdlog::set_pattern("[%T.%e] [%^%8l%$] [tid %6t] [%20!s:%-4#] %v");
#else
    spdlog::set_level(spdlog::level::info);
    // [HH:MM:SS.ms] [level] [tid] message
    spdlog::set_pattern("[%T.%e] [%^%=8l%$] [tid %6t] %v");
#endif

    spdlog::cfg::load_env_levels(LOG_LEVEL_ENV);
}

/// Raises the default logger to debug, unless ``LOG_LEVEL`` already chose a level
inline void enable_debug_logging() {
    if (std::getenv(LOG_LEVEL_ENV) != nullptr) {
        return;
    }

    spdlog::set_level(spdlog::level::debug);
}

} // namespace batchgrader
