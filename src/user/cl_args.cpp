#include "user/cl_args.hpp"

#include <batchgrader/common/expected.hpp>
#include <batchgrader/logging.hpp>

#include "user/program_options.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#ifndef BATCHGRADER_VERSION_STRING
#define BATCHGRADER_VERSION_STRING "unknown"
#endif

namespace batchgrader {

namespace {

constexpr std::size_t MAX_USAGE_WIDTH = 100;

std::size_t parse_positive(const std::string& opt, std::string_view what) {
    std::size_t value{};
    const char* end = opt.data() + opt.size();
    auto [ptr, ec] = std::from_chars(opt.data(), end, value);

    if (ec != std::errc{} || ptr != end || value == 0) {
        throw std::invalid_argument(fmt::format("{} must be a positive integer, got {:?}", what, opt));
    }

    return value;
}

/// The runner image shipped alongside the host driver
std::filesystem::path default_image() {
    std::error_code err;
    auto self = std::filesystem::read_symlink("/proc/self/exe", err);

    if (err) {
        LOG_DEBUG("Could not locate own executable: {}", err.message());
        return "batchgrader-run";
    }

    return self.parent_path() / "batchgrader-run";
}

} // namespace

template <typename OptionsT>
CommandLineArgs<OptionsT>::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), BATCHGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

template <>
void CommandLineArgs<ProgramOptions>::setup_parser() {
    arg_parser_.set_usage_max_line_width(MAX_USAGE_WIDTH);
    arg_parser_.add_description(fmt::format("batchgrader v{}\nGrades a directory of submissions in parallel sandboxes.",
                                            BATCHGRADER_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("path")
        .action([this] (const std::string& opt) { opts_buffer_.submissions_dir = opt; })
        .help("Directory of submissions to grade, one file per submission.");

    arg_parser_.add_argument("-a", "--bundle")
        .required()
        .nargs(1)
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.bundle_dir = opt; })
        .help("Autograder bundle: a directory of JSON test files.");

    arg_parser_.add_argument("-i", "--image")
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.image = opt; })
        .help("Grader executable run in each sandbox. Defaults to batchgrader-run next to this program.");

    arg_parser_.add_argument("-o", "--output-dir")
        .default_value(std::string{ProgramOptions::DEFAULT_OUTPUT_DIR})
        .nargs(1)
        .metavar("DIR")
        .action([this] (const std::string& opt) { opts_buffer_.output_dir = opt; })
        .help("Where final_grades.csv (and any artifacts) are written.");

    arg_parser_.add_argument("-n", "--containers")
        .default_value(std::to_string(ProgramOptions::DEFAULT_CONTAINERS))
        .nargs(1)
        .metavar("N")
        .action([this] (const std::string& opt) { opts_buffer_.containers = parse_positive(opt, "--containers"); })
        .help("Maximum number of sandboxes running at once.");

    arg_parser_.add_argument("-t", "--timeout")
        .default_value(std::to_string(ProgramOptions::DEFAULT_TIMEOUT.count()))
        .nargs(1)
        .metavar("SECONDS")
        .action([this] (const std::string& opt) {
                opts_buffer_.timeout = std::chrono::seconds{static_cast<std::chrono::seconds::rep>(parse_positive(opt, "--timeout"))};
        })
        .help("Wall-clock limit of a single submission's sandbox.");

    arg_parser_.add_argument("--ids")
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.ids_path = opt; })
        .help("CSV of \"filename,identifier\" entries. Rows are keyed by identifier instead of filename.");

    arg_parser_.add_argument("--ext")
        .nargs(1)
        .metavar("EXT")
        .action([this] (const std::string& opt) {
                opts_buffer_.extension = opt.starts_with('.') ? opt : "." + opt;
        })
        .help("Only grade files with this extension.");

    arg_parser_.add_argument("--keep-alive")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.keep_alive = true; })
        .help("Do not remove sandboxes after grading, for inspection.");

    arg_parser_.add_argument("--debug")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.debug = true; })
        .help("Print the console output of every sandbox.");

    arg_parser_.add_argument("--points")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.absolute_points = true; })
        .help("Report earned points instead of fractional scores.");

    arg_parser_.add_argument("--artifacts")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.capture_artifacts = true; })
        .help("Copy rendered documents (*.pdf) out of each sandbox into the output directory.");
    // clang-format on
}

template <>
void CommandLineArgs<RunnerOptions>::setup_parser() {
    arg_parser_.set_usage_max_line_width(MAX_USAGE_WIDTH);
    arg_parser_.add_description(
        fmt::format("batchgrader-run v{}\nGrades one submission against an autograder bundle.", BATCHGRADER_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("bundle")
        .action([this] (const std::string& opt) { opts_buffer_.bundle_dir = opt; })
        .help("Autograder bundle: a directory of JSON test files.");

    arg_parser_.add_argument("submission")
        .action([this] (const std::string& opt) { opts_buffer_.submission = opt; })
        .help("The submission to grade.");

    arg_parser_.add_argument("-o", "--output")
        .default_value(std::string{RunnerOptions::DEFAULT_OUTPUT})
        .nargs(1)
        .metavar("FILE")
        .action([this] (const std::string& opt) { opts_buffer_.output = opt; })
        .help("Where the score table is written.");

    arg_parser_.add_argument("--case-timeout")
        .default_value(std::to_string(RunnerOptions::DEFAULT_CASE_TIMEOUT.count()))
        .nargs(1)
        .metavar("MS")
        .action([this] (const std::string& opt) {
                opts_buffer_.case_timeout = std::chrono::milliseconds{
                    static_cast<std::chrono::milliseconds::rep>(parse_positive(opt, "--case-timeout"))};
        })
        .help("Timeout of test cases that do not set their own.");

    arg_parser_.add_argument("--points")
        .flag()
        .action([this] (const std::string& /*unused*/) { opts_buffer_.absolute_points = true; })
        .help("Report earned points instead of fractional scores.");
    // clang-format on
}

template <typename OptionsT>
Expected<OptionsT, std::string> CommandLineArgs<OptionsT>::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    if constexpr (std::is_same_v<OptionsT, ProgramOptions>) {
        if (opts_buffer_.image.empty()) {
            opts_buffer_.image = default_image();
        }
    }

    if (auto valid = opts_buffer_.validate(); !valid) {
        return valid.error();
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

template <typename OptionsT>
std::string CommandLineArgs<OptionsT>::help_message() const {
    return arg_parser_.help().str();
}

template <typename OptionsT>
std::string CommandLineArgs<OptionsT>::usage_message() const {
    return arg_parser_.usage();
}

template <typename OptionsT>
std::string CommandLineArgs<OptionsT>::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

template <typename OptionsT>
OptionsT parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs<OptionsT> cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

template class CommandLineArgs<ProgramOptions>;
template class CommandLineArgs<RunnerOptions>;

template ProgramOptions parse_args_or_exit<ProgramOptions>(std::span<const char*>, int) noexcept;
template RunnerOptions parse_args_or_exit<RunnerOptions>(std::span<const char*>, int) noexcept;

} // namespace batchgrader
