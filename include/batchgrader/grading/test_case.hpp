/// \file
/// Value types describing a single test case and the outcome of running it
#pragma once

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace batchgrader {

struct ExecutionContext;

/// What a test case body reports back once it has run
struct CaseOutcome
{
    bool passed;
    std::string diagnostic;
};

/// Body of a ``TestFileFormat::Command`` case: a shell command run against the submission
struct CommandBody
{
    std::string command;
    std::optional<std::string> expected_output;
    std::optional<std::chrono::milliseconds> timeout;
};

/// Body of a ``TestFileFormat::Native`` case: an in-process check
struct NativeBody
{
    std::function<CaseOutcome(const ExecutionContext&)> check;
};

using CaseBody = std::variant<CommandBody, NativeBody>;

struct TestCase
{
    std::string name;
    CaseBody body;
    bool hidden = false;
    std::string success_message;
    std::string failure_message;

    /// Unset until point allocation resolves it
    std::optional<double> points;
};

/// Created once per case per run; never modified afterward
struct TestCaseResult
{
    std::size_t case_index; ///< index of the case within its owning TestFile
    bool passed;
    std::string message;
    double points; ///< points earned
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::TestCaseResult> : fmt::formatter<std::string_view>
{
    auto format(const ::batchgrader::TestCaseResult& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "TestCaseResult{{case_index={}, passed={}, points={}, message={:?}}}",
                              from.case_index, from.passed, from.points, from.message);
    }
};
