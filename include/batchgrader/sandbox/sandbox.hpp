/// \file
/// Capability interfaces over a sandbox's lifecycle: acquire, run, collect, release.
/// The SandboxPool only talks to these, so it does not care what the sandbox actually is.
#pragma once

#include <batchgrader/results/score_table.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>

namespace batchgrader {

/// What a backend needs to know to provision a sandbox for one submission
struct SandboxRequest
{
    std::filesystem::path submission;
    std::size_t slot;

    /// Run the grader verbosely; its console output is kept for the job
    bool debug = false;

    /// Copy rendered documents out of the sandbox when collecting
    bool capture_artifacts = false;
};

/// A private execution environment for exactly one submission
class Sandbox
{
public:
    virtual ~Sandbox() = default;

    /// Grades the submission. Returns early if ``stop`` is requested.
    ///
    /// \throws SandboxExecutionFailure on a crash, nonzero exit, timeout or cancellation
    /// \throws SandboxLaunchError if the sandbox cannot be started at all
    virtual void run(std::stop_token stop) = 0;

    /// Retrieves the score table produced by ``run``
    ///
    /// \throws SandboxExecutionFailure if no usable score table was produced
    virtual ScoreTable collect() = 0;

    /// Tears the sandbox down. Safe to call more than once.
    virtual void release() noexcept = 0;

    /// Everything the sandbox printed while running
    virtual std::string console_output() const = 0;

    /// Where the sandbox lives, for log messages (e.g. when it is kept alive)
    virtual std::string describe() const = 0;
};

/// Provisions sandboxes. Holds only read-only configuration, and must be safe to call from
/// several worker threads at once.
class SandboxBackend
{
public:
    virtual ~SandboxBackend() = default;

    /// Checks that sandboxes can be provisioned at all. Called once before any job is dispatched.
    ///
    /// \throws SandboxLaunchError if they cannot
    virtual void prepare() = 0;

    /// \throws SandboxLaunchError if the sandbox cannot be provisioned
    virtual std::unique_ptr<Sandbox> acquire(const SandboxRequest& request) = 0;
};

} // namespace batchgrader
