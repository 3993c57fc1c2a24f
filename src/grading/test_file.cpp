#include <batchgrader/grading/test_file.hpp>

#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/point_allocator.hpp>
#include <batchgrader/grading/test_case.hpp>

#include <libassert/assert.hpp>
#include <range/v3/algorithm/all_of.hpp>

#include <filesystem>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace batchgrader {

std::string_view to_string(TestFileFormat format) {
    switch (format) {
    case TestFileFormat::Command:
        return "Command";
    case TestFileFormat::Native:
        return "Native";
    }
    return "<invalid>";
}

std::string_view to_string(TestFileState state) {
    switch (state) {
    case TestFileState::NotRun:
        return "NotRun";
    case TestFileState::Running:
        return "Running";
    case TestFileState::PassedAll:
        return "PassedAll";
    case TestFileState::Partial:
        return "Partial";
    case TestFileState::FailedAll:
        return "FailedAll";
    }
    return "<invalid>";
}

namespace {

bool body_matches_format(const TestCase& test_case, TestFileFormat format) {
    switch (format) {
    case TestFileFormat::Command:
        return std::holds_alternative<CommandBody>(test_case.body);
    case TestFileFormat::Native:
        return std::holds_alternative<NativeBody>(test_case.body);
    }
    return false;
}

} // namespace

TestFile::TestFile(std::string name, std::filesystem::path path, TestFileFormat format, std::vector<TestCase> cases,
                   double total_value, bool all_or_nothing)
    : name_{std::move(name)}
    , path_{std::move(path)}
    , format_{format}
    , cases_{resolve_points(total_value, std::move(cases), name_)}
    , total_value_{total_value}
    , all_or_nothing_{all_or_nothing} {
    if (!ranges::all_of(cases_, [format](const TestCase& tc) { return body_matches_format(tc, format); })) {
        throw TestFileParseError(fmt::format("{}: test case bodies do not match the {} format", name_, format_));
    }
}

bool TestFile::has_run() const noexcept {
    return state_ != TestFileState::NotRun && state_ != TestFileState::Running;
}

std::optional<double> TestFile::get_earned_points() const noexcept {
    if (!grade_) {
        return std::nullopt;
    }

    return *grade_ * total_value_;
}

void TestFile::mark_running() {
    ASSERT(state_ == TestFileState::NotRun, "A test file may only be run once");

    state_ = TestFileState::Running;
}

void TestFile::finalize(std::vector<TestCaseResult> results, double grade, bool passed_all) {
    ASSERT(state_ == TestFileState::Running);
    DEBUG_ASSERT(results.size() == cases_.size());

    results_ = std::move(results);
    grade_ = grade;
    passed_all_ = passed_all;

    if (passed_all) {
        state_ = TestFileState::PassedAll;
    } else if (grade <= 0.0) {
        state_ = TestFileState::FailedAll;
    } else {
        state_ = TestFileState::Partial;
    }
}

} // namespace batchgrader
