#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/results/identifier_resolver.hpp>
#include <batchgrader/results/result_aggregator.hpp>
#include <batchgrader/sandbox/sandbox.hpp>
#include <batchgrader/sandbox/sandbox_pool.hpp>
#include <batchgrader/sandbox/submission_job.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace batchgrader {

struct BatchOptions
{
    std::filesystem::path submissions_dir;
    std::filesystem::path bundle_dir;

    /// ``final_grades.csv`` is written here; created if missing
    std::filesystem::path output_dir;

    /// Only grade files with this extension (e.g. ".ipynb"); every regular file if unset
    std::optional<std::string> extension;

    PoolOptions pool;
};

struct BatchResult
{
    FinalGradeTable table;

    /// Every job, in discovery order
    std::vector<SubmissionJob> jobs;

    std::filesystem::path output_file;
};

/// Grades a directory of submissions against an autograder bundle and writes the merged grades.
class BatchGrader : NonMovable
{
public:
    /// \throws std::invalid_argument for an unusable pool configuration
    BatchGrader(BatchOptions options, std::shared_ptr<SandboxBackend> backend,
                std::shared_ptr<const IdentifierResolver> resolver = nullptr);

    /// Regular, non-hidden files directly inside the submissions directory, in lexicographic order
    ///
    /// \throws GradingError if the submissions directory cannot be listed
    std::vector<std::filesystem::path> discover_submissions() const;

    /// Validates the bundle, grades every submission, merges the results and writes them.
    /// Nothing is launched if the bundle is invalid.
    ///
    /// \throws TestFileParseError, AllocationError if the bundle is invalid
    /// \throws SandboxLaunchError if sandboxes cannot be provisioned
    /// \throws BatchCancelledError if ``cancel`` was called before every submission finished
    /// \throws AggregationError if the results cannot be merged
    BatchResult run();

    /// Aborts a running batch. Safe to call from any thread.
    void cancel();

    const BatchOptions& get_options() const noexcept { return options_; }

private:
    BatchOptions options_;
    std::shared_ptr<const IdentifierResolver> resolver_;
    SandboxPool pool_;
};

} // namespace batchgrader
