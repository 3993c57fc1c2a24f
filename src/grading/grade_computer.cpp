#include <batchgrader/grading/grade_computer.hpp>

#include <batchgrader/grading/test_case.hpp>
#include <batchgrader/grading/test_file.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/subprocess/subprocess.hpp>

#include <fmt/chrono.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace batchgrader {

namespace {

/// Captured output beyond this many bytes is cut from diagnostics
constexpr std::size_t MAX_DIAGNOSTIC_OUTPUT = 2048;

std::string_view trim(std::string_view str) {
    constexpr std::string_view WHITESPACE = " \t\r\n";

    const auto first = str.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = str.find_last_not_of(WHITESPACE);
    return str.substr(first, last - first + 1);
}

std::string truncate_output(std::string_view output) {
    if (output.size() <= MAX_DIAGNOSTIC_OUTPUT) {
        return std::string{output};
    }

    return fmt::format("{}\n... ({} more bytes)", output.substr(0, MAX_DIAGNOSTIC_OUTPUT),
                       output.size() - MAX_DIAGNOSTIC_OUTPUT);
}

std::string make_message(const TestCase& test_case, const CaseOutcome& outcome) {
    if (outcome.passed) {
        return test_case.success_message;
    }

    if (test_case.failure_message.empty()) {
        return outcome.diagnostic;
    }

    if (outcome.diagnostic.empty()) {
        return test_case.failure_message;
    }

    return fmt::format("{}\n{}", test_case.failure_message, outcome.diagnostic);
}

} // namespace

GradeComputer::GradeComputer(ExecutionContext context)
    : context_{std::move(context)} {}

void GradeComputer::run(TestFile& test_file) const {
    if (test_file.get_state() != TestFileState::NotRun) {
        throw std::logic_error(fmt::format("Test file {:?} has already been run", test_file.get_name()));
    }

    test_file.mark_running();

    std::vector<TestCaseResult> results;
    results.reserve(test_file.get_cases().size());

    for (std::size_t idx = 0; idx < test_file.get_cases().size(); ++idx) {
        results.push_back(run_case(test_file, idx));
    }

    const bool passed_all = ranges::all_of(results, &TestCaseResult::passed);

    double grade = 0.0;

    if (test_file.is_all_or_nothing()) {
        grade = passed_all ? 1.0 : 0.0;

        // No partial credit; every case earns its weight only if the whole file passed
        for (TestCaseResult& res : results) {
            res.points = passed_all ? test_file.get_weight(res.case_index) : 0.0;
        }
    } else {
        const double earned = ranges::accumulate(results | ranges::views::transform(&TestCaseResult::points), 0.0);
        grade = std::clamp(earned / test_file.get_total_value(), 0.0, 1.0);
    }

    LOG_DEBUG("{:?}: grade {} ({}/{} cases passed)", test_file.get_name(), grade,
              ranges::count_if(results, &TestCaseResult::passed), results.size());

    test_file.finalize(std::move(results), grade, passed_all);
}

TestCaseResult GradeComputer::run_case(const TestFile& test_file, std::size_t idx) const {
    const TestCase& test_case = test_file.get_cases()[idx];

    CaseOutcome outcome;

    try {
        outcome = std::visit([this](const auto& body) { return execute(body); }, test_case.body);
    } catch (const std::exception& ex) {
        LOG_DEBUG("Test case {:?} of {:?} raised: {}", test_case.name, test_file.get_name(), ex.what());
        outcome = {.passed = false, .diagnostic = fmt::format("Test case raised an exception: {}", ex.what())};
    } catch (...) {
        LOG_DEBUG("Test case {:?} of {:?} raised a non-standard exception", test_case.name, test_file.get_name());
        outcome = {.passed = false, .diagnostic = "Test case raised an exception not derived from std::exception"};
    }

    return TestCaseResult{.case_index = idx,
                          .passed = outcome.passed,
                          .message = make_message(test_case, outcome),
                          .points = outcome.passed ? test_file.get_weight(idx) : 0.0};
}

CaseOutcome GradeComputer::execute(const CommandBody& body) const {
    const std::filesystem::path submission =
        context_.submission.empty() ? context_.submission : std::filesystem::absolute(context_.submission);

    Subprocess proc{"/bin/sh",
                    {"-c", body.command},
                    {.working_dir = context_.working_dir, .extra_env = {"SUBMISSION=" + submission.string()}}};

    if (auto res = proc.start(); !res) {
        return {.passed = false, .diagnostic = fmt::format("Could not start test command: {}", res.error())};
    }

    const auto timeout = body.timeout.value_or(context_.default_timeout);
    auto run_res = proc.wait_for_exit(timeout, context_.stop);
    const std::string full_output = proc.get_full_stdout();
    const std::string output = truncate_output(full_output);

    if (!run_res) {
        if (run_res.error() == ErrorKind::TimedOut) {
            return {.passed = false, .diagnostic = fmt::format("Timed out after {}\n{}", timeout, output)};
        }
        return {.passed = false, .diagnostic = fmt::format("Test command failed: {}\n{}", run_res.error(), output)};
    }

    if (!run_res->succeeded()) {
        return {.passed = false, .diagnostic = fmt::format("Test command {}\n{}", *run_res, output)};
    }

    if (body.expected_output && trim(full_output) != trim(*body.expected_output)) {
        return {.passed = false,
                .diagnostic = fmt::format("Expected output:\n{}\nActual output:\n{}",
                                          truncate_output(trim(*body.expected_output)), trim(output))};
    }

    return {.passed = true, .diagnostic = output};
}

CaseOutcome GradeComputer::execute(const NativeBody& body) const {
    if (!body.check) {
        return {.passed = false, .diagnostic = "Test case has no check to run"};
    }

    return body.check(context_);
}

} // namespace batchgrader
