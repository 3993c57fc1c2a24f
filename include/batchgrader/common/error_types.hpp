#pragma once

#include <batchgrader/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string_view>

namespace batchgrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,       ///< Process / operation surpassed its maximum allotted time
    Crashed,        ///< Process was terminated by a signal
    NonZeroExit,    ///< Process exited with a nonzero status
    BadOutput,      ///< Process finished, but its output could not be interpreted
    Cancelled,      ///< Operation was aborted by a pool-wide cancellation request
    SyscallFailure, ///< A Linux syscall failed
    UnknownError,   ///< As named; use this as little as possible
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::TimedOut:
        return "TimedOut";
    case ErrorKind::Crashed:
        return "Crashed";
    case ErrorKind::NonZeroExit:
        return "NonZeroExit";
    case ErrorKind::BadOutput:
        return "BadOutput";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::UnknownError:
        return "UnknownError";
    }
    return "<invalid>";
}

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::ErrorKind> : fmt::formatter<std::string_view>
{
    auto format(::batchgrader::ErrorKind from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::batchgrader::to_string(from), ctx);
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            using enum ::batchgrader::ErrorKind;                                                                       \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
