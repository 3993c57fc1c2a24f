#pragma once

#include <batchgrader/grading/test_case.hpp>
#include <batchgrader/grading/test_file.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stop_token>

namespace batchgrader {

/// Everything a test case body may need to know about the submission it is checking
struct ExecutionContext
{
    std::filesystem::path submission;

    /// Working directory for command cases
    std::filesystem::path working_dir = std::filesystem::current_path();

    /// Applied to command cases that do not specify their own timeout
    std::chrono::milliseconds default_timeout = std::chrono::seconds{30};

    std::stop_token stop;
};

/// Runs a test file's cases in declared order and computes the file's grade
class GradeComputer
{
public:
    explicit GradeComputer(ExecutionContext context);

    /// Runs every case of ``test_file`` and records the results, grade and passed-all flag on it.
    ///
    /// A case that fails at runtime (exception, timeout, crash) is recorded as failed with a
    /// diagnostic message; the remaining cases still run.
    ///
    /// \throws std::logic_error if ``test_file`` has already been run
    void run(TestFile& test_file) const;

    const ExecutionContext& get_context() const noexcept { return context_; }

private:
    TestCaseResult run_case(const TestFile& test_file, std::size_t idx) const;

    CaseOutcome execute(const CommandBody& body) const;
    CaseOutcome execute(const NativeBody& body) const;

    ExecutionContext context_;
};

} // namespace batchgrader
