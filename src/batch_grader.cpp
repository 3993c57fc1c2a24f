#include <batchgrader/batch_grader.hpp>

#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/test_file.hpp>
#include <batchgrader/grading/test_file_loader.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/results/csv_writer.hpp>
#include <batchgrader/results/result_aggregator.hpp>
#include <batchgrader/sandbox/sandbox_pool.hpp>
#include <batchgrader/sandbox/submission_job.hpp>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace batchgrader {

namespace fs = std::filesystem;

BatchGrader::BatchGrader(BatchOptions options, std::shared_ptr<SandboxBackend> backend,
                         std::shared_ptr<const IdentifierResolver> resolver)
    : options_{std::move(options)}
    , resolver_{std::move(resolver)}
    , pool_{std::move(backend), options_.pool} {}

std::vector<fs::path> BatchGrader::discover_submissions() const {
    std::error_code err;
    fs::directory_iterator iter{options_.submissions_dir, err};

    if (err) {
        throw GradingError(fmt::format("Cannot list submissions directory {:?}: {}", options_.submissions_dir.string(),
                                       err.message()));
    }

    std::vector<fs::path> submissions;

    for (const fs::directory_entry& entry : iter) {
        const fs::path& path = entry.path();

        if (!entry.is_regular_file() || path.filename().string().starts_with('.')) {
            continue;
        }

        if (options_.extension && path.extension() != *options_.extension) {
            continue;
        }

        submissions.push_back(path);
    }

    ranges::sort(submissions);

    return submissions;
}

BatchResult BatchGrader::run() {
    // Parses every test file and resolves its points; a bad bundle stops the batch here
    const std::vector<TestFile> test_files = DEBUG_TIME(load_bundle(options_.bundle_dir));

    const std::vector<fs::path> submissions = discover_submissions();

    LOG_INFO("Grading {} submission(s) from {:?} with up to {} concurrent sandbox(es)", submissions.size(),
             options_.submissions_dir.string(), options_.pool.concurrency_limit);

    std::vector<SubmissionJob> jobs;
    jobs.reserve(submissions.size());

    for (std::size_t idx = 0; idx < submissions.size(); ++idx) {
        jobs.push_back(SubmissionJob{.index = idx, .submission = submissions[idx]});
    }

    std::size_t done = 0;
    auto report_progress = [&done, total = submissions.size()](const SubmissionJob& job) {
        ++done;
        LOG_INFO("[{}/{}] {} {}", done, total, job.get_key(), job.state == JobState::Completed ? "done" : "failed");
    };

    std::vector<SubmissionJob> completed = pool_.submit(std::move(jobs), report_progress);

    const auto ungraded =
        ranges::count_if(completed, [](const SubmissionJob& job) { return job.state != JobState::Completed; });

    if (pool_.is_cancelled() && ungraded > 0) {
        throw BatchCancelledError(
            fmt::format("Batch cancelled with {} of {} submission(s) not graded", ungraded, completed.size()));
    }

    // Completion order is arbitrary; rows follow discovery order
    ranges::sort(completed, {}, &SubmissionJob::index);

    auto results = completed | ranges::views::transform([](const SubmissionJob& job) {
                       return SubmissionResult{.key = job.get_key(), .scores = job.scores, .diagnostic = job.diagnostic};
                   }) |
                   ranges::to<std::vector<SubmissionResult>>();

    ResultAggregator aggregator{resolver_};
    aggregator.seed_columns(test_files | ranges::views::transform(&TestFile::get_name) |
                            ranges::to<std::vector<std::string>>());

    FinalGradeTable table = aggregator.merge(results);

    std::error_code err;
    fs::create_directories(options_.output_dir, err);
    if (err) {
        throw GradingError(
            fmt::format("Cannot create output directory {:?}: {}", options_.output_dir.string(), err.message()));
    }

    fs::path output_file = write_final_grades(table, options_.output_dir);

    if (ungraded > 0) {
        LOG_WARN("{} of {} submission(s) failed to grade and were given 0", ungraded, completed.size());
    }

    return BatchResult{.table = std::move(table), .jobs = std::move(completed), .output_file = std::move(output_file)};
}

void BatchGrader::cancel() {
    pool_.cancel();
}

} // namespace batchgrader
