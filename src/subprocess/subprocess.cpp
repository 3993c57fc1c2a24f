#include <batchgrader/subprocess/subprocess.hpp>

#include <batchgrader/common/error_types.hpp>
#include <batchgrader/common/expected.hpp>
#include <batchgrader/common/linux.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/subprocess/run_result.hpp>

#include <fmt/ranges.h>
#include <range/v3/algorithm/remove_if.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ; // NOLINT

namespace batchgrader {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds{10};

/// Exit code used by the child when it fails before (or at) execve; mirrors the shell's convention
constexpr int EXEC_FAILURE_CODE = 127;

std::vector<std::string> build_environment(const std::vector<std::string>& extra_env) {
    std::vector<std::string> env;

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        env.emplace_back(*entry);
    }

    for (const std::string& var : extra_env) {
        const std::string_view key = std::string_view{var}.substr(0, var.find('=') + 1);

        env.erase(ranges::remove_if(env, [key](const std::string& existing) { return existing.starts_with(key); }),
                  env.end());
        env.push_back(var);
    }

    return env;
}

/// Null-terminated array of pointers into ``strs``, as expected by execve(2)
std::vector<char*> to_cstr_list(std::vector<std::string>& strs) {
    std::vector<char*> list(strs.size() + 1, nullptr);

    ranges::transform(strs, list.begin(), [](std::string& str) { return str.data(); });

    return list;
}

/// Runs in the forked child. Only async-signal-safe calls are allowed here, as the
/// parent may be multithreaded.
[[noreturn]] void exec_child(int stdout_fd, const char* working_dir, char* const* argv, char* const* envp) {
    ::setpgid(0, 0);

    // The signal mask survives execve; the child must not inherit signals the parent blocked
    sigset_t no_signals;
    ::sigemptyset(&no_signals);
    ::sigprocmask(SIG_SETMASK, &no_signals, nullptr);

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC); // NOLINT(*vararg)

    if (devnull == -1 || ::dup2(devnull, STDIN_FILENO) == -1 || ::dup2(stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stdout_fd, STDERR_FILENO) == -1) {
        ::_exit(EXEC_FAILURE_CODE);
    }

    if (working_dir != nullptr && ::chdir(working_dir) == -1) {
        ::_exit(EXEC_FAILURE_CODE);
    }

    ::execve(argv[0], argv, envp);

    ::_exit(EXEC_FAILURE_CODE);
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, Options opts)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , opts_{std::move(opts)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then initialization failed, or the object was moved from
    if (child_pid_ != 0 && is_alive()) {
        if (auto res = kill(); !res) {
            LOG_WARN("Failed to kill child process {} on destruction: {}", child_pid_, res.error());
        }
    }

    std::ignore = close_pipe();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , opts_{std::move(other.opts_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {})}
    , stdout_buffer_{std::exchange(other.stdout_buffer_, {})}
    , stdout_cursor_{std::exchange(other.stdout_cursor_, 0)}
    , run_result_{std::exchange(other.run_result_, std::nullopt)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    if (child_pid_ != 0 && is_alive()) {
        std::ignore = kill();
    }
    std::ignore = close_pipe();

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    opts_ = std::move(rhs.opts_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, {});
    stdout_buffer_ = std::exchange(rhs.stdout_buffer_, {});
    stdout_cursor_ = std::exchange(rhs.stdout_cursor_, 0);
    run_result_ = std::exchange(rhs.run_result_, std::nullopt);

    return *this;
}

Result<void> Subprocess::start() {
    return create();
}

bool Subprocess::is_alive() const {
    return child_pid_ != 0 && !run_result_.has_value();
}

Result<std::optional<RunResult>> Subprocess::poll_exit() {
    if (run_result_) {
        return run_result_;
    }

    auto wait_res = TRYE(linux::waitpid(child_pid_, WNOHANG), SyscallFailure);

    // Child has not changed state yet
    if (wait_res.pid == 0) {
        return std::optional<RunResult>{};
    }

    run_result_ = RunResult::from_wait_status(wait_res.status);

    // The leader is gone; take down anything it left running in its group
    std::ignore = linux::killpg(child_pid_, SIGKILL);

    return run_result_;
}

Result<RunResult> Subprocess::wait_for_exit(std::chrono::milliseconds timeout, std::stop_token stop) {
    using std::chrono::steady_clock;

    if (child_pid_ == 0) {
        LOG_WARN("wait_for_exit called on a process that was never started");
        return ErrorKind::UnknownError;
    }

    const auto deadline = steady_clock::now() + timeout;

    while (true) {
        TRY(read_stdout_impl());

        std::optional<RunResult> exited = TRY(poll_exit());

        if (exited) {
            TRY(read_stdout_impl());
            return *exited;
        }

        if (stop.stop_requested()) {
            LOG_DEBUG("Stop requested; killing process group {}", child_pid_);
            TRY(kill());
            return ErrorKind::Cancelled;
        }

        if (steady_clock::now() >= deadline) {
            LOG_DEBUG("Process group {} exceeded its {} timeout; killing", child_pid_, timeout);
            TRY(kill());
            return ErrorKind::TimedOut;
        }

        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

Result<void> Subprocess::kill() {
    if (!is_alive()) {
        return {};
    }

    TRYE(linux::killpg(child_pid_, SIGKILL), SyscallFailure);

    auto wait_res = TRYE(linux::waitpid(child_pid_), SyscallFailure);
    run_result_ = RunResult::from_wait_status(wait_res.status);

    std::ignore = read_stdout_impl();

    return {};
}

Result<void> Subprocess::close_pipe() {
    // Make sure all available data is read before the pipe is closed
    std::ignore = read_stdout_impl();

    if (stdout_pipe_.read_fd != -1) {
        TRYE(linux::close(stdout_pipe_.read_fd), SyscallFailure);
        stdout_pipe_.read_fd = -1;
    }
    if (stdout_pipe_.write_fd != -1) {
        TRYE(linux::close(stdout_pipe_.write_fd), SyscallFailure);
        stdout_pipe_.write_fd = -1;
    }

    return {};
}

Result<std::string> Subprocess::read_stdout() {
    TRY(read_stdout_impl());

    // Cursor is still at the end of the buffer -> no data was read
    if (stdout_cursor_ == stdout_buffer_.size()) {
        return std::string{};
    }

    auto res = stdout_buffer_.substr(stdout_cursor_);
    stdout_cursor_ = stdout_buffer_.size();

    return res;
}

const std::string& Subprocess::get_full_stdout() {
    std::ignore = read_stdout_impl();

    return stdout_buffer_;
}

Result<void> Subprocess::read_stdout_impl() {
    int num_bytes_avail = 0;

    if (stdout_pipe_.read_fd == -1) {
        return {};
    }

    TRYE(linux::ioctl(stdout_pipe_.read_fd, FIONREAD, &num_bytes_avail), SyscallFailure);

    if (num_bytes_avail <= 0) {
        return {};
    }

    std::string res =
        TRYE(linux::read(stdout_pipe_.read_fd, static_cast<std::size_t>(num_bytes_avail)), SyscallFailure);

    stdout_buffer_ += res;

    return {};
}

Result<void> Subprocess::create() {
    // Everything the child needs is prepared before forking
    std::vector<std::string> argv_strs{exec_};
    argv_strs.insert(argv_strs.end(), args_.begin(), args_.end());
    std::vector<std::string> env_strs = build_environment(opts_.extra_env);

    std::vector<char*> argv = to_cstr_list(argv_strs);
    std::vector<char*> envp = to_cstr_list(env_strs);
    const std::string working_dir = opts_.working_dir ? opts_.working_dir->string() : std::string{};

    // CLOEXEC, so that children forked concurrently by other workers do not inherit this pipe
    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    if (fork_res.which == linux::Fork::Child) {
        exec_child(stdout_pipe_.write_fd, working_dir.empty() ? nullptr : working_dir.c_str(), argv.data(),
                   envp.data());
    }

    // Parent process
    child_pid_ = fork_res.pid;
    LOG_TRACE("Started {:?} {} as pid {}", exec_, args_, child_pid_);

    // Also done in the child; whichever runs first wins. Failure here just means the child already exec'd.
    std::ignore = linux::setpgid(child_pid_, child_pid_);

    TRYE(linux::close(stdout_pipe_.write_fd), SyscallFailure);
    stdout_pipe_.write_fd = -1;

    // Make reading from stdout non-blocking
    int pre_flags = TRYE(linux::fcntl(stdout_pipe_.read_fd, F_GETFL), SyscallFailure);

    TRYE(linux::fcntl(stdout_pipe_.read_fd, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
         SyscallFailure);

    return {};
}

} // namespace batchgrader
