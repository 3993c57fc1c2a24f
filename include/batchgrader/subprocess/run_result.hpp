#pragma once

#include <fmt/format.h>

namespace batchgrader {

/// How a finished child process ended
class RunResult
{
public:
    enum class Kind { Exited, Killed };

    static RunResult make_exited(int code);
    static RunResult make_killed(int signal);

    /// Decode a status as returned by waitpid(2)
    static RunResult from_wait_status(int status);

    Kind get_kind() const;

    /// Exit code for ``Exited``, signal number for ``Killed``
    int get_code() const;

    bool succeeded() const { return kind_ == Kind::Exited && code_ == 0; }

    bool operator==(const RunResult&) const = default;

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::RunResult> : fmt::formatter<std::string_view>
{
    auto format(const ::batchgrader::RunResult& from, fmt::format_context& ctx) const {
        if (from.get_kind() == ::batchgrader::RunResult::Kind::Exited) {
            return fmt::format_to(ctx.out(), "exited with code {}", from.get_code());
        }
        return fmt::format_to(ctx.out(), "killed by signal {}", from.get_code());
    }
};
