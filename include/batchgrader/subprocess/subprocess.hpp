#pragma once

#include <batchgrader/common/class_traits.hpp>
#include <batchgrader/common/error_types.hpp>
#include <batchgrader/common/linux.hpp>
#include <batchgrader/subprocess/run_result.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <sys/types.h>

namespace batchgrader {

/// A child process with its stdout and stderr captured through a pipe.
///
/// The child runs as the leader of its own process group, so anything it spawns is
/// killed along with it. A still-running child is killed when the object is destroyed.
class Subprocess : NonCopyable
{
public:
    struct Options
    {
        /// Working directory of the child; inherited if unset
        std::optional<std::filesystem::path> working_dir;

        /// "KEY=value" entries added to (or overriding) the parent's environment
        std::vector<std::string> extra_env;
    };

    /// Does not start the process; call ``start`` for that
    Subprocess(std::string exec, std::vector<std::string> args, Options opts = {});
    ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    Result<void> start();

    /// Blocks until the child exits, ``timeout`` elapses, or ``stop`` is requested.
    /// Output is drained while waiting so a chatty child cannot block on a full pipe.
    ///
    /// On timeout or cancellation the whole process group is killed and
    /// ``TimedOut`` / ``Cancelled`` is returned.
    Result<RunResult> wait_for_exit(std::chrono::milliseconds timeout, std::stop_token stop = {});

    /// Kills the child's process group and reaps the child
    Result<void> kill();

    /// Output produced since the last call
    Result<std::string> read_stdout();

    /// Everything the child has written so far
    const std::string& get_full_stdout();

    bool is_alive() const;

    std::optional<RunResult> get_run_result() const { return run_result_; }

    pid_t get_pid() const { return child_pid_; }

private:
    Result<void> create();
    Result<void> read_stdout_impl();
    Result<void> close_pipe();
    Result<std::optional<RunResult>> poll_exit();

    std::string exec_;
    std::vector<std::string> args_;
    Options opts_;

    pid_t child_pid_{};
    linux::Pipe stdout_pipe_;

    std::string stdout_buffer_;
    std::size_t stdout_cursor_{};

    std::optional<RunResult> run_result_;
};

} // namespace batchgrader
