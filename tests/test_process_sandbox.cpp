#include "catch2_custom.hpp"

#include <batchgrader/common/error_types.hpp>
#include <batchgrader/exceptions.hpp>
#include <batchgrader/results/score_table.hpp>
#include <batchgrader/sandbox/process_sandbox.hpp>
#include <batchgrader/sandbox/sandbox.hpp>

#include "test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <tuple>

using namespace batchgrader;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

/// Scratch layout shared by every test: a bundle, one submission and a root for sandboxes
struct SandboxFixture
{
    test::TempDir root;
    fs::path bundle = root / "bundle";
    fs::path submission = root / "submissions" / "alice.txt";
    fs::path work_root = root / "work";
    fs::path artifacts = root / "artifacts";

    SandboxFixture() {
        test::write_file(bundle / "q1.json", R"({"cases": []})");
        test::write_file(submission, "hello\n");
        fs::create_directories(work_root);
    }

    ProcessSandboxBackend make_backend(std::string_view script, std::chrono::milliseconds timeout = 10s,
                                       bool absolute_points = false) const {
        return ProcessSandboxBackend{ProcessSandboxConfig{.image = test::write_script(root / "grader.sh", script),
                                                          .bundle = bundle,
                                                          .work_root = work_root,
                                                          .artifacts_dir = artifacts,
                                                          .timeout = timeout,
                                                          .absolute_points = absolute_points}};
    }

    SandboxRequest request(bool capture_artifacts = false) const {
        return SandboxRequest{.submission = submission, .slot = 0, .debug = false, .capture_artifacts = capture_artifacts};
    }

    bool work_root_empty() const { return fs::is_empty(work_root); }
};

constexpr std::string_view WRITE_RESULTS = R"(
test -f bundle/q1.json || exit 9
test -f "$2" || exit 10
echo "grading $2"
printf 'file,q1,q2\n%s,1,0.5\n' "$(basename "$2")" > results.csv)";

ErrorKind execution_failure_kind(Sandbox& sandbox) {
    try {
        sandbox.run({});
        std::ignore = sandbox.collect();
    } catch (const SandboxExecutionFailure& ex) {
        return ex.get_error();
    }
    FAIL("sandbox did not fail");
    return {};
}

} // namespace

TEST_CASE("Grade a submission in a process sandbox") {
    SandboxFixture fixture;
    auto backend = fixture.make_backend(WRITE_RESULTS);
    backend.prepare();

    auto sandbox = backend.acquire(fixture.request());
    REQUIRE_FALSE(fixture.work_root_empty());

    sandbox->run({});
    const ScoreTable scores = sandbox->collect();

    REQUIRE(scores == ScoreTable{{{"q1", 1.0}, {"q2", 0.5}}});
    REQUIRE(sandbox->console_output() == "grading submission/alice.txt\n");

    sandbox->release();
    REQUIRE(fixture.work_root_empty());

    // Releasing twice is harmless
    sandbox->release();
}

TEST_CASE("Absolute points are requested from the grader") {
    SandboxFixture fixture;
    auto backend = fixture.make_backend(R"(
if [ "$3" = "--points" ]; then value=7; else value=0.7; fi
printf 'q1\n%s\n' "$value" > results.csv)",
                                        10s, true);

    auto sandbox = backend.acquire(fixture.request());
    sandbox->run({});

    REQUIRE(sandbox->collect().get("q1") == 7.0);
}

TEST_CASE("Grader failures are reported by kind") {
    SandboxFixture fixture;

    SECTION("crash") {
        auto backend = fixture.make_backend("kill -KILL $$");
        auto sandbox = backend.acquire(fixture.request());
        REQUIRE(execution_failure_kind(*sandbox) == ErrorKind::Crashed);
    }

    SECTION("nonzero exit") {
        auto backend = fixture.make_backend("exit 3");
        auto sandbox = backend.acquire(fixture.request());
        REQUIRE(execution_failure_kind(*sandbox) == ErrorKind::NonZeroExit);
    }

    SECTION("no results") {
        auto backend = fixture.make_backend("exit 0");
        auto sandbox = backend.acquire(fixture.request());
        REQUIRE(execution_failure_kind(*sandbox) == ErrorKind::BadOutput);
    }

    SECTION("malformed results") {
        auto backend = fixture.make_backend("echo garbage > results.csv");
        auto sandbox = backend.acquire(fixture.request());
        REQUIRE(execution_failure_kind(*sandbox) == ErrorKind::BadOutput);
    }

    SECTION("timeout") {
        auto backend = fixture.make_backend("sleep 30", 200ms);
        auto sandbox = backend.acquire(fixture.request());
        REQUIRE(execution_failure_kind(*sandbox) == ErrorKind::TimedOut);
    }
}

TEST_CASE("A stop request cancels a running grader") {
    SandboxFixture fixture;
    auto backend = fixture.make_backend("sleep 30");
    auto sandbox = backend.acquire(fixture.request());

    std::stop_source stop_source;
    stop_source.request_stop();

    try {
        sandbox->run(stop_source.get_token());
        FAIL("run did not throw");
    } catch (const SandboxExecutionFailure& ex) {
        REQUIRE(ex.get_error() == ErrorKind::Cancelled);
    }
}

TEST_CASE("Rendered documents are captured as artifacts") {
    SandboxFixture fixture;
    auto backend = fixture.make_backend("echo report > report.pdf; echo notes > notes.txt; printf 'q1\\n1\\n' > results.csv");

    auto sandbox = backend.acquire(fixture.request(true));
    sandbox->run({});
    std::ignore = sandbox->collect();

    REQUIRE(fs::is_regular_file(fixture.artifacts / "alice" / "report.pdf"));
    REQUIRE_FALSE(fs::exists(fixture.artifacts / "alice" / "notes.txt"));
}

TEST_CASE("prepare rejects unusable configurations") {
    SandboxFixture fixture;

    SECTION("missing image") {
        ProcessSandboxBackend backend{{.image = fixture.root / "nope", .bundle = fixture.bundle}};
        REQUIRE_THROWS_AS(backend.prepare(), SandboxLaunchError);
    }

    SECTION("image is not executable") {
        const auto image = test::write_file(fixture.root / "plain.sh", "exit 0\n");
        fs::permissions(image, fs::perms::owner_read | fs::perms::owner_write);

        ProcessSandboxBackend backend{{.image = image, .bundle = fixture.bundle}};
        REQUIRE_THROWS_AS(backend.prepare(), SandboxLaunchError);
    }

    SECTION("missing bundle") {
        auto image = test::write_script(fixture.root / "grader.sh", "exit 0");

        ProcessSandboxBackend backend{{.image = image, .bundle = fixture.root / "no-bundle"}};
        REQUIRE_THROWS_AS(backend.prepare(), SandboxLaunchError);
    }
}

TEST_CASE("acquire cleans up when the submission cannot be copied") {
    SandboxFixture fixture;
    auto backend = fixture.make_backend(WRITE_RESULTS);

    SandboxRequest request = fixture.request();
    request.submission = fixture.root / "submissions" / "ghost.txt";

    REQUIRE_THROWS_AS(backend.acquire(request), SandboxLaunchError);
    REQUIRE(fixture.work_root_empty());
}
