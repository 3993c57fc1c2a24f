#include <batchgrader/sandbox/process_sandbox.hpp>

#include <batchgrader/common/error_types.hpp>
#include <batchgrader/common/linux.hpp>
#include <batchgrader/exceptions.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/results/score_table.hpp>
#include <batchgrader/subprocess/subprocess.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <gsl/util>

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace batchgrader {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view BUNDLE_SUBDIR = "bundle";
constexpr std::string_view SUBMISSION_SUBDIR = "submission";
constexpr std::string_view ARTIFACT_EXTENSION = ".pdf";

} // namespace

ProcessSandboxBackend::ProcessSandboxBackend(ProcessSandboxConfig config)
    : config_{std::move(config)} {}

void ProcessSandboxBackend::prepare() {
    std::error_code err;

    if (!fs::is_regular_file(config_.image, err)) {
        throw SandboxLaunchError(fmt::format("Grader image {:?} does not exist or is not a file", config_.image.string()));
    }

    if (auto res = linux::access(config_.image.string(), X_OK); !res) {
        throw SandboxLaunchError(
            fmt::format("Grader image {:?} is not executable: {}", config_.image.string(), res.error().message()));
    }

    if (!fs::is_directory(config_.bundle, err)) {
        throw SandboxLaunchError(fmt::format("Autograder bundle {:?} is not a directory", config_.bundle.string()));
    }

    if (!fs::is_directory(config_.work_root, err)) {
        throw SandboxLaunchError(
            fmt::format("Sandbox work root {:?} is not a directory", config_.work_root.string()));
    }

    LOG_DEBUG("Process sandbox backend ready (image={:?}, bundle={:?})", config_.image.string(),
              config_.bundle.string());
}

std::unique_ptr<Sandbox> ProcessSandboxBackend::acquire(const SandboxRequest& request) {
    const std::string dir_template =
        (config_.work_root / fmt::format("batchgrader-{}-XXXXXX", request.submission.stem().string())).string();

    auto dir_res = linux::mkdtemp(dir_template);
    if (!dir_res) {
        throw SandboxLaunchError(
            fmt::format("Failed to create sandbox under {:?}: {}", config_.work_root.string(), dir_res.error().message()));
    }

    const fs::path dir{*dir_res};

    // Until the sandbox object owns the directory, any failure must remove it here
    auto cleanup = gsl::finally([&dir] {
        std::error_code err;
        fs::remove_all(dir, err);
        if (err) {
            LOG_WARN("Failed to remove half-built sandbox {:?}: {}", dir.string(), err.message());
        }
    });

    std::error_code err;

    fs::copy(config_.bundle, dir / BUNDLE_SUBDIR, fs::copy_options::recursive, err);
    if (err) {
        throw SandboxLaunchError(fmt::format("Failed to copy bundle into sandbox {:?}: {}", dir.string(), err.message()));
    }

    fs::create_directory(dir / SUBMISSION_SUBDIR, err);
    if (!err) {
        fs::copy_file(request.submission, dir / SUBMISSION_SUBDIR / request.submission.filename(), err);
    }
    if (err) {
        throw SandboxLaunchError(fmt::format("Failed to copy submission {:?} into sandbox {:?}: {}",
                                             request.submission.string(), dir.string(), err.message()));
    }

    auto sandbox = std::make_unique<ProcessSandbox>(config_, request, dir);
    cleanup.dismiss();

    LOG_DEBUG("Acquired sandbox {:?} for slot {}", dir.string(), request.slot);

    return sandbox;
}

ProcessSandbox::ProcessSandbox(const ProcessSandboxConfig& config, SandboxRequest request, std::filesystem::path dir)
    : config_{&config}
    , request_{std::move(request)}
    , dir_{std::move(dir)} {}

void ProcessSandbox::run(std::stop_token stop) {
    std::vector<std::string> args{std::string{BUNDLE_SUBDIR},
                                  (fs::path{SUBMISSION_SUBDIR} / request_.submission.filename()).string()};

    if (config_->absolute_points) {
        args.emplace_back("--points");
    }

    Subprocess::Options opts{.working_dir = dir_, .extra_env = {}};

    if (request_.debug) {
        opts.extra_env.emplace_back("LOG_LEVEL=debug");
    }

    Subprocess proc{config_->image.string(), std::move(args), std::move(opts)};

    if (auto res = proc.start(); !res) {
        throw SandboxLaunchError(
            fmt::format("Failed to start grader image {:?}: {}", config_->image.string(), res.error()));
    }

    auto run_res = proc.wait_for_exit(config_->timeout, std::move(stop));
    console_output_ = proc.get_full_stdout();

    if (!run_res) {
        switch (run_res.error()) {
        case ErrorKind::TimedOut:
            throw SandboxExecutionFailure(ErrorKind::TimedOut,
                                          fmt::format("Grader timed out after {}", config_->timeout));
        case ErrorKind::Cancelled:
            throw SandboxExecutionFailure(ErrorKind::Cancelled, "Grading was cancelled");
        default:
            throw SandboxExecutionFailure(run_res.error(), "Lost track of the grader process");
        }
    }

    if (run_res->get_kind() == RunResult::Kind::Killed) {
        throw SandboxExecutionFailure(ErrorKind::Crashed, fmt::format("Grader {}", *run_res));
    }

    if (!run_res->succeeded()) {
        throw SandboxExecutionFailure(ErrorKind::NonZeroExit, fmt::format("Grader {}", *run_res));
    }
}

ScoreTable ProcessSandbox::collect() {
    const fs::path results_path = dir_ / SANDBOX_RESULTS_FILENAME;

    std::ifstream in_file{results_path};

    if (!in_file.is_open()) {
        throw SandboxExecutionFailure(ErrorKind::BadOutput, fmt::format("Grader did not write {}", SANDBOX_RESULTS_FILENAME));
    }

    std::stringstream contents;
    contents << in_file.rdbuf();

    auto table = ScoreTable::parse_csv(contents.str());

    if (!table) {
        throw SandboxExecutionFailure(ErrorKind::BadOutput,
                                      fmt::format("Malformed {}: {}", SANDBOX_RESULTS_FILENAME, table.error()));
    }

    if (request_.capture_artifacts) {
        capture_artifacts();
    }

    return std::move(*table);
}

void ProcessSandbox::capture_artifacts() const {
    const fs::path dest = config_->artifacts_dir / request_.submission.stem();

    std::error_code err;
    fs::create_directories(dest, err);
    if (err) {
        LOG_WARN("Cannot create artifact directory {:?}: {}", dest.string(), err.message());
        return;
    }

    fs::directory_iterator iter{dir_, err};
    if (err) {
        LOG_WARN("Failed to list artifacts of sandbox {:?}: {}", dir_.string(), err.message());
        return;
    }

    for (const fs::directory_entry& entry : iter) {
        if (!entry.is_regular_file() || entry.path().extension() != ARTIFACT_EXTENSION) {
            continue;
        }

        std::error_code copy_err;
        fs::copy_file(entry.path(), dest / entry.path().filename(), fs::copy_options::overwrite_existing, copy_err);
        if (copy_err) {
            LOG_WARN("Failed to copy artifact {:?}: {}", entry.path().string(), copy_err.message());
        }
    }
}

void ProcessSandbox::release() noexcept {
    if (released_) {
        return;
    }
    released_ = true;

    std::error_code err;
    fs::remove_all(dir_, err);

    if (err) {
        LOG_WARN("Failed to remove sandbox {:?}: {}", dir_.string(), err.message());
        return;
    }

    LOG_DEBUG("Released sandbox {:?}", dir_.string());
}

} // namespace batchgrader
