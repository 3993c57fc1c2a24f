#include "catch2_custom.hpp"

#include <batchgrader/common/error_types.hpp>
#include <batchgrader/subprocess/run_result.hpp>
#include <batchgrader/subprocess/subprocess.hpp>

#include "test_helpers.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <stop_token>
#include <thread>

using namespace std::chrono_literals;
using batchgrader::ErrorKind;
using batchgrader::RunResult;
using batchgrader::Subprocess;

TEST_CASE("Read /bin/echo stdout") {
    Subprocess proc("/bin/echo", {"-n", "Hello", "world!"});
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(5s);

    REQUIRE(res == RunResult::make_exited(0));
    REQUIRE(proc.read_stdout() == "Hello world!");
    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("stderr is captured along with stdout") {
    Subprocess proc("/bin/sh", {"-c", "echo out; echo err >&2; exit 7"});
    REQUIRE(proc.start());

    auto res = proc.wait_for_exit(5s);

    REQUIRE(res->get_kind() == RunResult::Kind::Exited);
    REQUIRE(res->get_code() == 7);
    REQUIRE_FALSE(res->succeeded());
    REQUIRE(proc.get_full_stdout() == "out\nerr\n");
}

TEST_CASE("Working directory and environment are applied") {
    batchgrader::test::TempDir dir;

    Subprocess proc("/bin/sh", {"-c", "pwd; echo \"$GREETING\""},
                    {.working_dir = dir.path(), .extra_env = {"GREETING=hi there"}});
    REQUIRE(proc.start());
    REQUIRE(proc.wait_for_exit(5s));

    const auto canonical_dir = std::filesystem::canonical(dir.path()).string();
    REQUIRE(proc.get_full_stdout() == canonical_dir + "\nhi there\n");
}

TEST_CASE("A missing executable exits with 127") {
    Subprocess proc("/nonexistent/grader", {});
    REQUIRE(proc.start());

    REQUIRE(proc.wait_for_exit(5s) == RunResult::make_exited(127));
}

TEST_CASE("Processes killed by a signal report it") {
    Subprocess proc("/bin/sh", {"-c", "kill -SEGV $$"});
    REQUIRE(proc.start());

    REQUIRE(proc.wait_for_exit(5s) == RunResult::make_killed(SIGSEGV));
}

TEST_CASE("Timeouts kill the whole process group") {
    // The background sleep would keep the pipe open if it survived its parent
    Subprocess proc("/bin/sh", {"-c", "sleep 30 & sleep 30"});
    REQUIRE(proc.start());

    const auto start = std::chrono::steady_clock::now();
    auto res = proc.wait_for_exit(200ms);

    REQUIRE(res == ErrorKind::TimedOut);
    REQUIRE_FALSE(proc.is_alive());
    REQUIRE(std::chrono::steady_clock::now() - start < 10s);
}

TEST_CASE("A stop request cancels the wait") {
    Subprocess proc("/bin/sleep", {"30"});
    REQUIRE(proc.start());

    std::stop_source stop_source;
    std::jthread canceller{[&stop_source] {
        std::this_thread::sleep_for(100ms);
        stop_source.request_stop();
    }};

    REQUIRE(proc.wait_for_exit(30s, stop_source.get_token()) == ErrorKind::Cancelled);
    REQUIRE_FALSE(proc.is_alive());
}
