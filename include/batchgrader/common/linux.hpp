/// \file
/// Thin wrappers over the POSIX calls used to run and sandbox child processes.
/// Each returns an Expected carrying ``errno`` as a std::error_code, and logs failures at debug level.
#pragma once

#include <batchgrader/common/expected.hpp>
#include <batchgrader/logging.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/ioctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace batchgrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

namespace detail {

/// ``res`` if the call succeeded, otherwise the current errno
template <typename T>
Expected<T> check(std::string_view call, T res) {
    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("{} failed: '{}'", call, err.message());
        return err;
    }

    return res;
}

inline Expected<> check_void(std::string_view call, int res) {
    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("{} failed: '{}'", call, err.message());
        return err;
    }

    return {};
}

} // namespace detail

/// Reads at most ``count`` bytes. See read(2)
inline Expected<std::string> read(int fd, std::size_t count) { // NOLINT
    std::string buffer(count, '\0');

    auto res = detail::check<ssize_t>("read", ::read(fd, buffer.data(), count));
    if (!res) {
        return res.error();
    }

    buffer.resize(static_cast<std::size_t>(*res));

    return buffer;
}

/// See close(2)
inline Expected<> close(int fd) {
    return detail::check_void("close", ::close(fd));
}

/// Signals every process in the group ``pgid``. See killpg(3)
inline Expected<> killpg(pid_t pgid, int sig) {
    return detail::check_void("killpg", ::killpg(pgid, sig));
}

/// See setpgid(2)
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    return detail::check_void("setpgid", ::setpgid(pid, pgid));
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; ///< the child's pid; only set in the parent
};

/// See fork(2)
inline Expected<Fork> fork() {
    auto res = detail::check<pid_t>("fork", ::fork());
    if (!res) {
        return res.error();
    }

    if (*res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = *res};
}

/// See ioctl(2)
// NOLINTNEXTLINE(google-runtime-int)
inline Expected<int> ioctl(int fd, unsigned long request, void* argp) {
    return detail::check("ioctl", ::ioctl(fd, request, argp)); // NOLINT(*vararg)
}

/// See fcntl(2)
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    // NOLINTNEXTLINE(*vararg)
    const int res = arg ? ::fcntl(fd, cmd, *arg) : ::fcntl(fd, cmd);

    return detail::check("fcntl", res);
}

struct WaitStatus
{
    pid_t pid; ///< 0 if the child has not changed state yet (WNOHANG)
    int status;
};

/// See waitpid(2)
inline Expected<WaitStatus> waitpid(pid_t pid, int options = 0) {
    int status = 0;

    auto res = detail::check<pid_t>("waitpid", ::waitpid(pid, &status, options));
    if (!res) {
        return res.error();
    }

    return WaitStatus{.pid = *res, .status = status};
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

/// See pipe2(2)
inline Expected<Pipe> pipe2(int flags = 0) {
    int pipefd[2] = {-1, -1}; // NOLINT(*-avoid-c-arrays)

    if (auto res = detail::check_void("pipe2", ::pipe2(pipefd, flags)); !res) { // NOLINT(*-array-to-pointer-decay)
        return res.error();
    }

    return Pipe{.read_fd = pipefd[0], .write_fd = pipefd[1]};
}

/// Creates a unique directory from ``dir_template``, whose last six characters must be "XXXXXX".
/// See mkdtemp(3)
///
/// \returns the created directory's path
inline Expected<std::string> mkdtemp(std::string dir_template) {
    if (::mkdtemp(dir_template.data()) == nullptr) {
        auto err = make_error_code(errno);
        LOG_DEBUG("mkdtemp failed: '{}'", err.message());
        return err;
    }

    return dir_template;
}

/// See access(2)
inline Expected<> access(const std::string& path, int mode) {
    return detail::check_void("access", ::access(path.c_str(), mode));
}

} // namespace batchgrader::linux
