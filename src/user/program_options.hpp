#pragma once

#include <batchgrader/common/error_types.hpp>
#include <batchgrader/common/expected.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace batchgrader {

namespace detail {

inline Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                      fmt::format_string<std::string> fmt) {
    if (!std::filesystem::exists(path)) {
        return (fmt::format(fmt, path.string()) + " does not exist");
    }

    return {};
}

inline Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
    TRY(ensure_file_exists(path, fmt));

    if (!std::filesystem::is_regular_file(path)) {
        return (fmt::format(fmt, path.string()) + " is not a regular file");
    }

    return {};
}

inline Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                       fmt::format_string<std::string> fmt) {
    TRY(ensure_file_exists(path, fmt));

    if (!std::filesystem::is_directory(path)) {
        return (fmt::format(fmt, path.string()) + " is not a directory");
    }

    return {};
}

} // namespace detail

/// Options of the host-side ``batchgrader`` driver
struct ProgramOptions
{

    // ###### Argument fields

    /// Directory holding one file per submission
    std::filesystem::path submissions_dir;

    /// Directory of ``*.json`` test files
    std::filesystem::path bundle_dir;

    /// Grader executable run inside each sandbox. Defaults to ``batchgrader-run`` next to this program.
    std::filesystem::path image;

    std::filesystem::path output_dir = DEFAULT_OUTPUT_DIR;

    /// Maximum number of sandboxes running at once
    std::size_t containers = DEFAULT_CONTAINERS;

    bool keep_alive = false;
    bool debug = false;

    std::chrono::seconds timeout = DEFAULT_TIMEOUT;

    /// Write earned points instead of grade fractions
    bool absolute_points = false;

    /// Copy rendered documents out of each sandbox into the output directory
    bool capture_artifacts = false;

    /// "filename,identifier" CSV; rows are keyed by identifier when given
    std::optional<std::filesystem::path> ids_path;

    /// Only grade submissions with this extension
    std::optional<std::string> extension;

    // ###### Argument defaults

    static constexpr std::string_view DEFAULT_OUTPUT_DIR = ".";
    static constexpr std::size_t DEFAULT_CONTAINERS = 4;
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{600};

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        TRY(detail::ensure_is_directory(submissions_dir, "Submissions directory {:?}"));
        TRY(detail::ensure_is_directory(bundle_dir, "Autograder bundle {:?}"));
        TRY(detail::ensure_is_regular_file(image, "Grader image {:?}"));

        if (ids_path) {
            TRY(detail::ensure_is_regular_file(*ids_path, "Identifier map {:?}"));
        }

        if (containers == 0) {
            return std::string{"Number of containers must be positive"};
        }

        if (timeout <= std::chrono::seconds::zero()) {
            return std::string{"Timeout must be positive"};
        }

        return {};
    }
};

/// Options of the in-sandbox ``batchgrader-run`` entry point
struct RunnerOptions
{
    std::filesystem::path bundle_dir;
    std::filesystem::path submission;

    /// Score table written here
    std::filesystem::path output = DEFAULT_OUTPUT;

    bool absolute_points = false;

    /// Applied to test cases that do not set their own timeout
    std::chrono::milliseconds case_timeout = DEFAULT_CASE_TIMEOUT;

    static constexpr std::string_view DEFAULT_OUTPUT = "results.csv";
    static constexpr std::chrono::milliseconds DEFAULT_CASE_TIMEOUT{30'000};

    Expected<void, std::string> validate() const {
        TRY(detail::ensure_is_directory(bundle_dir, "Autograder bundle {:?}"));
        TRY(detail::ensure_is_regular_file(submission, "Submission {:?}"));

        if (case_timeout <= std::chrono::milliseconds::zero()) {
            return std::string{"Case timeout must be positive"};
        }

        return {};
    }
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::ProgramOptions> : fmt::formatter<std::string_view>
{
    auto format(const ::batchgrader::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{submissions={:?}, bundle={:?}, image={:?}, output={:?}, containers={}, keep_alive={}, "
                              "debug={}, timeout={}s, points={}, artifacts={}, ids={:?}, ext={:?}}}",
                              from.submissions_dir.string(), from.bundle_dir.string(), from.image.string(),
                              from.output_dir.string(), from.containers, from.keep_alive, from.debug,
                              from.timeout.count(), from.absolute_points, from.capture_artifacts,
                              from.ids_path.value_or("").string(), from.extension.value_or(""));
    }
};

template <>
struct fmt::formatter<::batchgrader::RunnerOptions> : fmt::formatter<std::string_view>
{
    auto format(const ::batchgrader::RunnerOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{{bundle={:?}, submission={:?}, output={:?}, points={}, case_timeout={}ms}}",
                              from.bundle_dir.string(), from.submission.string(), from.output.string(),
                              from.absolute_points, from.case_timeout.count());
    }
};
