#include <batchgrader/batch_grader.hpp>
#include <batchgrader/exceptions.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/results/identifier_resolver.hpp>
#include <batchgrader/sandbox/process_sandbox.hpp>

#include "app/trace_exception.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <stop_token>
#include <thread>
#include <utility>

#include <signal.h>
#include <time.h>

namespace {

using namespace batchgrader;

constexpr int EXIT_INTERRUPTED = 130;

/// Cancels ``grader`` when SIGINT or SIGTERM arrives.
///
/// The signals are blocked in every thread (``block_termination_signals`` must run before any
/// thread is spawned) and picked up here with sigtimedwait, so no work happens in signal context.
std::jthread watch_termination_signals(BatchGrader& grader) {
    return std::jthread{[&grader](std::stop_token stop) {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);

        constexpr timespec POLL_INTERVAL{.tv_sec = 0, .tv_nsec = 200'000'000};

        while (!stop.stop_requested()) {
            const int sig = sigtimedwait(&signals, nullptr, &POLL_INTERVAL);

            if (sig == -1) {
                if (errno != EAGAIN && errno != EINTR) {
                    LOG_ERROR("sigtimedwait failed: {}", get_err_msg());
                    return;
                }
                continue;
            }

            LOG_WARN("Received {}, cancelling the batch", sig == SIGINT ? "SIGINT" : "SIGTERM");
            grader.cancel();
            return;
        }
    }};
}

void block_termination_signals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);

    if (int err = pthread_sigmask(SIG_BLOCK, &signals, nullptr); err != 0) {
        LOG_WARN("Could not block termination signals ({}); interrupts will not cancel cleanly", get_err_msg(err));
    }
}

int run(std::span<const char*> args) {
    const auto options = parse_args_or_exit<ProgramOptions>(args);

    if (options.debug) {
        enable_debug_logging();
    }

    LOG_DEBUG("Options: {}", options);

    std::shared_ptr<const IdentifierResolver> resolver;

    if (options.ids_path) {
        auto ids = load_identifier_map(*options.ids_path);

        if (!ids) {
            LOG_ERROR("Could not load identifier map {:?}: {}", options.ids_path->string(), ids.error());
            return 1;
        }

        resolver = std::make_shared<MapIdentifierResolver>(std::move(*ids));
    }

    auto backend = std::make_shared<ProcessSandboxBackend>(
        ProcessSandboxConfig{.image = std::filesystem::absolute(options.image),
                             .bundle = std::filesystem::absolute(options.bundle_dir),
                             .work_root = std::filesystem::temp_directory_path(),
                             .artifacts_dir = std::filesystem::absolute(options.output_dir),
                             .timeout = options.timeout,
                             .absolute_points = options.absolute_points});

    BatchGrader grader{BatchOptions{.submissions_dir = options.submissions_dir,
                                    .bundle_dir = options.bundle_dir,
                                    .output_dir = options.output_dir,
                                    .extension = options.extension,
                                    .pool = PoolOptions{.concurrency_limit = options.containers,
                                                        .keep_alive = options.keep_alive,
                                                        .debug = options.debug,
                                                        .capture_artifacts = options.capture_artifacts}},
                       backend, resolver};

    block_termination_signals();
    std::jthread signal_watcher = watch_termination_signals(grader);

    try {
        BatchResult result = grader.run();

        fmt::print("Wrote grades of {} submission(s) to {}\n", result.table.get_rows().size(),
                   result.output_file.string());
    } catch (const BatchCancelledError& ex) {
        LOG_ERROR("{}", ex.what());
        return EXIT_INTERRUPTED;
    } catch (const GradingError& ex) {
        // Configuration, launch and aggregation errors; nothing useful was written
        LOG_ERROR("{}", ex.what());
        return 1;
    }

    return 0;
}

} // namespace

int main(int argc, const char* argv[]) {
    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    return wrap_throwable_fn(run, args).value_or(1);
}
