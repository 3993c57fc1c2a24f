#pragma once

#include <batchgrader/logging.hpp>

#include <boost/core/demangle.hpp>
#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace batchgrader {

/// Logs an exception nothing else handled, followed by the stack of the handler reporting it
inline void trace_exception(std::string_view type, std::string_view what) {
    const boost::stacktrace::stacktrace trace;

    LOG_FATAL("Unhandled exception {}: {}", type, what);

    const std::string trace_str = boost::stacktrace::to_string(trace);
    fmt::print(stderr, "Stacktrace:\n{}\n", trace_str.empty() ? " <unavailable>" : trace_str);
}

/// Invokes ``fn``, reporting any exception that escapes it.
/// Returns nullopt if an exception escaped.
template <typename Func, typename... Args>
    requires(std::invocable<Func, Args...>)
std::optional<std::invoke_result_t<Func, Args...>> wrap_throwable_fn(Func&& fn, Args&&... args) {
    try {
        return std::invoke(std::forward<Func>(fn), std::forward<Args>(args)...);
    } catch (const std::exception& ex) {
        trace_exception(boost::core::demangle(typeid(ex).name()), ex.what());
    } catch (...) {
        trace_exception("<unknown>", "not derived from std::exception");
    }

    return std::nullopt;
}

} // namespace batchgrader
