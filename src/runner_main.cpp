/// \file
/// In-sandbox entry point: grades one submission against the autograder bundle and writes its score table
#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/grade_computer.hpp>
#include <batchgrader/grading/summary.hpp>
#include <batchgrader/grading/test_file.hpp>
#include <batchgrader/grading/test_file_loader.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/results/score_table.hpp>

#include "app/trace_exception.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

namespace {

using namespace batchgrader;

/// Exit status when the bundle itself is unusable, as opposed to a grading failure
constexpr int EXIT_BAD_BUNDLE = 2;

int run(std::span<const char*> args) {
    const auto options = parse_args_or_exit<RunnerOptions>(args);

    std::vector<TestFile> test_files;

    try {
        test_files = load_bundle(options.bundle_dir);
    } catch (const GradingError& ex) {
        LOG_ERROR("{}", ex.what());
        return EXIT_BAD_BUNDLE;
    }

    const GradeComputer computer{ExecutionContext{.submission = options.submission,
                                                  .working_dir = std::filesystem::current_path(),
                                                  .default_timeout = options.case_timeout,
                                                  .stop = {}}};

    for (TestFile& test_file : test_files) {
        DEBUG_TIME(computer.run(test_file));
    }

    fmt::print("{}", format_summary(test_files));

    const ScoreTable scores = ScoreTable::from_test_files(test_files, options.absolute_points);

    std::ofstream out_file{options.output, std::ios::trunc};

    if (!out_file.is_open()) {
        LOG_ERROR("Failed to open {:?} for writing", options.output.string());
        return 1;
    }

    out_file << scores.to_csv(options.submission.filename().string());
    out_file.flush();

    if (!out_file) {
        LOG_ERROR("IO error in writing {:?}", options.output.string());
        return 1;
    }

    LOG_DEBUG("Wrote scores {} to {:?}", scores, options.output.string());

    return 0;
}

} // namespace

int main(int argc, const char* argv[]) {
    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    return wrap_throwable_fn(run, args).value_or(1);
}
