#include <batchgrader/grading/summary.hpp>

#include <batchgrader/grading/test_case.hpp>
#include <batchgrader/grading/test_file.hpp>

#include <fmt/format.h>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>

#include <span>
#include <string>
#include <string_view>

namespace batchgrader {

namespace {

constexpr std::size_t DIVIDER_WIDTH = 60;

std::string indent(std::string_view text, std::string_view prefix) {
    std::string out;

    for (std::size_t pos = 0; pos < text.size();) {
        const auto newline = text.find('\n', pos);
        const auto line = text.substr(pos, newline == std::string_view::npos ? std::string_view::npos : newline - pos);
        out += fmt::format("{}{}\n", prefix, line);

        if (newline == std::string_view::npos) {
            break;
        }
        pos = newline + 1;
    }

    return out;
}

} // namespace

std::string format_summary(const TestFile& test_file) {
    std::string out = fmt::format("{}: {} ({:.2f}/{:.2f} points)\n", test_file.get_name(), test_file.get_state(),
                                  test_file.get_earned_points().value_or(0.0), test_file.get_total_value());

    for (const TestCaseResult& result : test_file.get_results()) {
        const TestCase& test_case = test_file.get_cases()[result.case_index];

        out += fmt::format("  [{}] {} ({:.2f}/{:.2f})\n", result.passed ? "PASS" : "FAIL",
                           test_case.hidden ? "hidden test" : test_case.name, result.points,
                           test_file.get_weight(result.case_index));

        if (!test_case.hidden && !result.message.empty()) {
            out += indent(result.message, "      ");
        }
    }

    return out;
}

std::string format_summary(std::span<const TestFile> test_files) {
    std::string out;

    for (const TestFile& test_file : test_files) {
        out += format_summary(test_file);
    }

    const double earned = ranges::accumulate(
        test_files | ranges::views::transform([](const TestFile& tf) { return tf.get_earned_points().value_or(0.0); }),
        0.0);
    const double total =
        ranges::accumulate(test_files | ranges::views::transform(&TestFile::get_total_value), 0.0);

    out += fmt::format("{}\nTotal: {:.2f}/{:.2f} points\n", std::string(DIVIDER_WIDTH, '-'), earned, total);

    return out;
}

} // namespace batchgrader
