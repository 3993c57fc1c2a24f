#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/sandbox/sandbox.hpp>
#include <batchgrader/sandbox/submission_job.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <stop_token>
#include <vector>

namespace batchgrader {

struct PoolOptions
{
    /// Maximum number of sandboxes running at once; must be positive
    std::size_t concurrency_limit = 4;

    /// Leave sandboxes in place after their job finishes
    bool keep_alive = false;

    /// Keep and log each sandbox's console output
    bool debug = false;

    /// Have sandboxes copy out rendered documents
    bool capture_artifacts = false;
};

/// Grades submissions in private sandboxes, never running more than ``concurrency_limit`` at once.
///
/// The calling thread coordinates: it dispatches queued jobs in order whenever a slot is free, and
/// sleeps otherwise until some running job finishes. Each dispatched job runs on its own thread.
///
/// A job whose sandbox crashes, exits abnormally or times out is marked ``Failed`` with a
/// diagnostic; the other jobs are unaffected. A ``SandboxLaunchError`` is fatal for the whole
/// batch: no further jobs are dispatched, running ones are cancelled, and the error is rethrown
/// once every sandbox has been released.
class SandboxPool : NonMovable
{
public:
    /// Invoked on the calling thread of ``submit`` as each job reaches a terminal state
    using CompletionCallback = std::function<void(const SubmissionJob&)>;

    /// \throws std::invalid_argument if ``options.concurrency_limit`` is 0 or ``backend`` is null
    SandboxPool(std::shared_ptr<SandboxBackend> backend, PoolOptions options);

    /// Runs every job to a terminal state.
    ///
    /// \returns the jobs in completion order, followed by any jobs never dispatched because the
    ///          pool was cancelled (still ``Queued``)
    /// \throws SandboxLaunchError if sandboxes cannot be provisioned
    std::vector<SubmissionJob> submit(std::vector<SubmissionJob> jobs, const CompletionCallback& on_complete = {});

    /// Stops dispatching and cancels every running sandbox. Safe to call from any thread.
    /// Once cancelled, the pool does not run further jobs.
    void cancel();

    bool is_cancelled() const noexcept { return stop_source_.stop_requested(); }

    const PoolOptions& get_options() const noexcept { return options_; }

private:
    /// Body of a job's worker thread
    void execute(SubmissionJob& job, std::stop_token stop) const;

    std::shared_ptr<SandboxBackend> backend_;
    PoolOptions options_;
    std::stop_source stop_source_;
};

} // namespace batchgrader
