#pragma once

#include <batchgrader/common/error_types.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace batchgrader {

/// Base for every error raised by the grading pipeline
class GradingError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// A test file's point budget cannot be resolved. Raised before any sandbox is launched.
class AllocationError : public GradingError
{
public:
    enum class Kind {
        Overallocated,        ///< explicit case points sum to more than the file's total value
        UnallocatedRemainder, ///< budget remains, but no case is left to receive it
        InvalidValue,         ///< total value or a case's points are not usable numbers
    };

    AllocationError(Kind kind, std::string test_file, const std::string& msg)
        : GradingError{test_file.empty() ? msg : fmt::format("{}: {}", test_file, msg)}
        , kind_{kind}
        , test_file_{std::move(test_file)} {}

    Kind get_kind() const noexcept { return kind_; }

    const std::string& get_test_file() const noexcept { return test_file_; }

private:
    Kind kind_;
    std::string test_file_;
};

/// A test file in the autograder bundle is malformed
class TestFileParseError : public GradingError
{
public:
    using GradingError::GradingError;
};

/// Infrastructure failure provisioning a sandbox. Fatal for the whole batch.
class SandboxLaunchError : public GradingError
{
public:
    using GradingError::GradingError;
};

/// A single submission's sandbox crashed, timed out, or exited abnormally. Local to that submission.
class SandboxExecutionFailure : public GradingError
{
public:
    explicit SandboxExecutionFailure(ErrorKind error, const std::string& msg = "")
        : GradingError{msg}
        , error_{error} {}

    ErrorKind get_error() const noexcept { return error_; }

private:
    ErrorKind error_;
};

/// The batch was aborted by an external request before every submission was graded
class BatchCancelledError : public GradingError
{
public:
    using GradingError::GradingError;
};

class AggregationError : public GradingError
{
public:
    using GradingError::GradingError;
};

/// Merged score tables have inconsistent shapes
class AggregationSchemaError : public AggregationError
{
public:
    using AggregationError::AggregationError;
};

/// A submission filename could not be mapped to an identifier
class IdentifierResolutionError : public AggregationError
{
public:
    explicit IdentifierResolutionError(std::string filename)
        : AggregationError{fmt::format("No identifier known for submission {:?}", filename)}
        , filename_{std::move(filename)} {}

    const std::string& get_filename() const noexcept { return filename_; }

private:
    std::string filename_;
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::SandboxExecutionFailure> : fmt::formatter<std::string_view>
{
    auto format(const ::batchgrader::SandboxExecutionFailure& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{} : {}", from.what(), from.get_error());
    }
};
