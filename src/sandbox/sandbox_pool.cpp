#include <batchgrader/sandbox/sandbox_pool.hpp>

#include <batchgrader/common/error_types.hpp>
#include <batchgrader/exceptions.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/sandbox/sandbox.hpp>
#include <batchgrader/sandbox/submission_job.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace batchgrader {

namespace {

void mark_failed(SubmissionJob& job, std::string diagnostic) {
    job.state = JobState::Failed;
    job.scores = {};
    job.diagnostic = std::move(diagnostic);
}

} // namespace

SandboxPool::SandboxPool(std::shared_ptr<SandboxBackend> backend, PoolOptions options)
    : backend_{std::move(backend)}
    , options_{options} {
    if (!backend_) {
        throw std::invalid_argument("SandboxPool requires a sandbox backend");
    }

    if (options_.concurrency_limit == 0) {
        throw std::invalid_argument("SandboxPool concurrency limit must be positive");
    }
}

void SandboxPool::cancel() {
    if (stop_source_.request_stop()) {
        LOG_WARN("Batch cancelled; stopping every running sandbox");
    }
}

std::vector<SubmissionJob> SandboxPool::submit(std::vector<SubmissionJob> jobs, const CompletionCallback& on_complete) {
    backend_->prepare();

    std::mutex mutex;
    std::condition_variable_any job_finished;

    // Indices of jobs whose worker is done, in the order they finished
    std::deque<std::size_t> finished;
    std::exception_ptr launch_error;

    std::vector<std::size_t> free_slots;
    for (std::size_t slot = options_.concurrency_limit; slot > 0; --slot) {
        free_slots.push_back(slot - 1);
    }

    std::size_t next = 0;
    std::size_t running = 0;
    std::vector<std::size_t> completion_order;
    completion_order.reserve(jobs.size());

    const std::stop_token stop = stop_source_.get_token();

    // One worker per slot, joined as soon as its job is reaped. Declared last so that the workers
    // are joined before anything they reference is destroyed.
    std::vector<std::jthread> workers(options_.concurrency_limit);

    auto dispatch = [&](std::size_t idx, std::size_t slot) {
        SubmissionJob& job = jobs[idx];
        job.state = JobState::Running;
        job.slot = slot;

        LOG_DEBUG("Dispatching {} to slot {}", job, slot);

        workers[slot] = std::jthread([this, &job, &mutex, &job_finished, &finished, &launch_error, stop, idx] {
            std::exception_ptr error;

            try {
                execute(job, stop);
            } catch (const SandboxLaunchError& ex) {
                mark_failed(job, ex.what());
                error = std::current_exception();
            } catch (const std::exception& ex) {
                mark_failed(job, fmt::format("Could not provision a sandbox: {}", ex.what()));
            }

            std::lock_guard guard{mutex};

            if (error && !launch_error) {
                launch_error = error;
                stop_source_.request_stop();
            }

            finished.push_back(idx);
            job_finished.notify_all();
        });
    };

    try {
        std::unique_lock lock{mutex};

        while (true) {
            while (!finished.empty()) {
                const std::size_t idx = finished.front();
                finished.pop_front();

                const SubmissionJob& job = jobs[idx];

                // The worker is past its last use of the lock; it only has to return
                workers[*job.slot].join();

                free_slots.push_back(*job.slot);
                --running;
                completion_order.push_back(idx);

                if (job.state == JobState::Completed) {
                    LOG_INFO("Graded {}: {}", job.get_key(), job.scores);
                } else {
                    LOG_WARN("Failed to grade {}: {}", job.get_key(), job.diagnostic.value_or("unknown error"));
                }

                LOG_DEBUG("Slot {} released; {} job(s) still running", *job.slot, running);

                if (on_complete) {
                    lock.unlock();
                    on_complete(job);
                    lock.lock();
                }
            }

            const bool halted = launch_error || stop.stop_requested();

            while (!halted && next < jobs.size() && !free_slots.empty()) {
                const std::size_t slot = free_slots.back();
                free_slots.pop_back();
                ++running;
                dispatch(next++, slot);
            }

            if (running == 0) {
                break;
            }

            // Sleep until the first running job finishes. Cancellation also wakes the coordinator
            // up, but after that only a finished job can.
            if (stop.stop_requested()) {
                job_finished.wait(lock, [&finished] { return !finished.empty(); });
            } else {
                job_finished.wait(lock, stop, [&finished] { return !finished.empty(); });
            }
        }
    } catch (...) {
        // Unwinding joins the workers; make sure they are not left grading
        stop_source_.request_stop();
        throw;
    }

    workers.clear();

    if (launch_error) {
        LOG_ERROR("Sandbox launch failed; {} job(s) were never dispatched", jobs.size() - next);
        std::rethrow_exception(launch_error);
    }

    if (next < jobs.size()) {
        LOG_WARN("Batch cancelled with {} job(s) never dispatched", jobs.size() - next);
    }

    std::vector<SubmissionJob> result;
    result.reserve(jobs.size());

    for (std::size_t idx : completion_order) {
        result.push_back(std::move(jobs[idx]));
    }

    for (std::size_t idx = next; idx < jobs.size(); ++idx) {
        result.push_back(std::move(jobs[idx]));
    }

    return result;
}

void SandboxPool::execute(SubmissionJob& job, std::stop_token stop) const {
    const SandboxRequest request{.submission = job.submission,
                                 .slot = job.slot.value_or(0),
                                 .debug = options_.debug,
                                 .capture_artifacts = options_.capture_artifacts};

    std::unique_ptr<Sandbox> sandbox = backend_->acquire(request);

    if (!sandbox) {
        throw SandboxLaunchError(fmt::format("Backend provided no sandbox for {}", job.get_key()));
    }

    auto release = gsl::finally([this, &sandbox, &job] {
        if (options_.keep_alive) {
            LOG_INFO("Keeping sandbox of {} alive at {}", job.get_key(), sandbox->describe());
            return;
        }
        sandbox->release();
    });

    try {
        if (stop.stop_requested()) {
            throw SandboxExecutionFailure(ErrorKind::Cancelled, "Cancelled before the sandbox started");
        }

        sandbox->run(stop);
        job.scores = sandbox->collect();
        job.state = JobState::Completed;
    } catch (const SandboxExecutionFailure& ex) {
        mark_failed(job, fmt::format("{} ({})", ex.what(), ex.get_error()));
    } catch (const SandboxLaunchError&) {
        throw;
    } catch (const std::exception& ex) {
        mark_failed(job, fmt::format("Unexpected error while grading: {}", ex.what()));
    }

    if (options_.debug) {
        job.console_output = sandbox->console_output();
        LOG_INFO("Console output of {}:\n{}", job.get_key(), job.console_output);
    }
}

} // namespace batchgrader
