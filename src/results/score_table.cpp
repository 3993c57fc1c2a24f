#include <batchgrader/results/score_table.hpp>

#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/test_file.hpp>
#include <batchgrader/results/csv.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>

#include <charconv>
#include <cmath>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace batchgrader {

namespace {

std::optional<double> parse_value(std::string_view str) {
    while (!str.empty() && str.front() == ' ') {
        str.remove_prefix(1);
    }
    while (!str.empty() && str.back() == ' ') {
        str.remove_suffix(1);
    }

    double value{};
    const auto* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);

    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) {
        return std::nullopt;
    }

    return value;
}

} // namespace

ScoreTable::ScoreTable(std::vector<Entry> entries) {
    entries_.reserve(entries.size());

    for (auto& [column, value] : entries) {
        if (get(column)) {
            throw AggregationSchemaError(fmt::format("Column {:?} appears more than once in a score table", column));
        }
        entries_.emplace_back(std::move(column), value);
    }
}

ScoreTable ScoreTable::from_test_files(std::span<const TestFile> test_files, bool absolute_points) {
    ScoreTable table;

    for (const TestFile& test_file : test_files) {
        const auto score = absolute_points ? test_file.get_earned_points() : test_file.get_grade();
        table.set(test_file.get_name(), score.value_or(0.0));
    }

    return table;
}

Expected<ScoreTable, std::string> ScoreTable::parse_csv(std::string_view text) {
    auto records = parse_csv_records(text);
    if (!records) {
        return records.error();
    }

    if (records->size() != 2) {
        return fmt::format("Expected a header row and one value row, got {} row(s)", records->size());
    }

    std::vector<std::string>& header = (*records)[0].fields;
    const std::vector<std::string>& values = (*records)[1].fields;

    if (header.size() != values.size()) {
        return fmt::format("Header has {} column(s) but the value row has {}", header.size(), values.size());
    }

    std::size_t first_score = 0;
    if (!header.empty() && header.front() == FILE_COLUMN) {
        first_score = 1;
    }

    ScoreTable table;

    for (std::size_t i = first_score; i < header.size(); ++i) {
        if (header[i].empty()) {
            return fmt::format("Column {} has an empty name", i);
        }

        if (table.get(header[i])) {
            return fmt::format("Column {:?} appears more than once", header[i]);
        }

        auto value = parse_value(values[i]);
        if (!value) {
            return fmt::format("Value {:?} of column {:?} is not a number", values[i], header[i]);
        }

        table.set(std::move(header[i]), *value);
    }

    return table;
}

std::string ScoreTable::to_csv(std::string_view filename) const {
    std::vector<std::string> header;
    std::vector<std::string> values;
    header.reserve(entries_.size() + 1);
    values.reserve(entries_.size() + 1);

    if (!filename.empty()) {
        header.emplace_back(FILE_COLUMN);
        values.emplace_back(filename);
    }

    for (const auto& [column, value] : entries_) {
        header.push_back(column);
        values.push_back(fmt::format("{}", value));
    }

    return fmt::format("{}\n{}\n", join_csv_row(header), join_csv_row(values));
}

void ScoreTable::set(std::string column, double value) {
    auto iter = ranges::find_if(entries_, [&column](const Entry& entry) { return entry.first == column; });

    if (iter != entries_.end()) {
        iter->second = value;
        return;
    }

    entries_.emplace_back(std::move(column), value);
}

std::optional<double> ScoreTable::get(std::string_view column) const {
    auto iter = ranges::find_if(entries_, [column](const Entry& entry) { return entry.first == column; });

    if (iter == entries_.end()) {
        return std::nullopt;
    }

    return iter->second;
}

} // namespace batchgrader
