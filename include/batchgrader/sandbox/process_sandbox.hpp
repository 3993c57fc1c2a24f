#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/results/score_table.hpp>
#include <batchgrader/sandbox/sandbox.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace batchgrader {

/// Name of the score table a grader image writes into its working directory
constexpr std::string_view SANDBOX_RESULTS_FILENAME = "results.csv";

struct ProcessSandboxConfig
{
    /// Grader executable, launched as ``image <bundle dir> <submission> [--points]``
    std::filesystem::path image;

    /// Autograder bundle; copied into every sandbox
    std::filesystem::path bundle;

    /// Directory sandboxes are created under
    std::filesystem::path work_root = std::filesystem::temp_directory_path();

    /// Where captured artifacts are copied to, one subdirectory per submission
    std::filesystem::path artifacts_dir = std::filesystem::current_path();

    /// Wall-clock limit of one grader run
    std::chrono::milliseconds timeout = std::chrono::minutes{10};

    /// Ask the grader for earned points instead of grade fractions
    bool absolute_points = false;
};

/// Sandboxes each submission in a private temporary directory, running the grader image as a
/// child process in its own process group.
class ProcessSandboxBackend : public SandboxBackend
{
public:
    explicit ProcessSandboxBackend(ProcessSandboxConfig config);

    /// \throws SandboxLaunchError if the image is not an executable file or the bundle is not a directory
    void prepare() override;

    /// Creates the sandbox directory and copies the bundle and the submission into it
    ///
    /// \throws SandboxLaunchError if any of that fails
    std::unique_ptr<Sandbox> acquire(const SandboxRequest& request) override;

    const ProcessSandboxConfig& get_config() const noexcept { return config_; }

private:
    ProcessSandboxConfig config_;
};

class ProcessSandbox : public Sandbox, NonMovable
{
public:
    ProcessSandbox(const ProcessSandboxConfig& config, SandboxRequest request, std::filesystem::path dir);

    void run(std::stop_token stop) override;

    ScoreTable collect() override;

    void release() noexcept override;

    std::string console_output() const override { return console_output_; }

    std::string describe() const override { return dir_.string(); }

    const std::filesystem::path& get_dir() const noexcept { return dir_; }

private:
    void capture_artifacts() const;

    const ProcessSandboxConfig* config_;
    SandboxRequest request_;
    std::filesystem::path dir_;
    std::string console_output_;
    bool released_ = false;
};

} // namespace batchgrader
