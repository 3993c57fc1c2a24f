#pragma once

#include <batchgrader/results/score_table.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace batchgrader {

enum class JobState { Queued, Running, Completed, Failed };

constexpr std::string_view to_string(JobState state) {
    switch (state) {
    case JobState::Queued:
        return "Queued";
    case JobState::Running:
        return "Running";
    case JobState::Completed:
        return "Completed";
    case JobState::Failed:
        return "Failed";
    }
    return "<invalid>";
}

/// One submission travelling through the SandboxPool
struct SubmissionJob
{
    /// Position in discovery order
    std::size_t index{};

    std::filesystem::path submission;

    JobState state = JobState::Queued;

    /// Worker slot the job ran in; set once it is dispatched
    std::optional<std::size_t> slot;

    /// Empty for a failed job
    ScoreTable scores;

    /// What went wrong, for a failed job
    std::optional<std::string> diagnostic;

    /// Sandbox console output; only captured in debug mode
    std::string console_output;

    /// Key the job's row is merged under: the submission's filename
    std::string get_key() const { return submission.filename().string(); }

    bool is_terminal() const noexcept { return state == JobState::Completed || state == JobState::Failed; }
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::JobState> : fmt::formatter<std::string_view>
{
    auto format(::batchgrader::JobState from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::batchgrader::to_string(from), ctx);
    }
};

template <>
struct fmt::formatter<::batchgrader::SubmissionJob> : fmt::formatter<std::string_view>
{
    auto format(const ::batchgrader::SubmissionJob& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "#{} {:?} ({})", from.index, from.get_key(), from.state);
    }
};
