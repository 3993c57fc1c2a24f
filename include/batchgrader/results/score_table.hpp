#pragma once

#include <batchgrader/common/expected.hpp>
#include <batchgrader/grading/test_file.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchgrader {

/// One submission's scores, as ordered (column, value) pairs. Columns are test file names.
class ScoreTable
{
public:
    using Entry = std::pair<std::string, double>;

    ScoreTable() = default;

    /// \throws AggregationSchemaError if a column name repeats
    explicit ScoreTable(std::vector<Entry> entries);

    /// Scores of a set of test files that have run: each file's grade fraction,
    /// or its earned points if ``absolute_points``
    static ScoreTable from_test_files(std::span<const TestFile> test_files, bool absolute_points = false);

    /// Parses the two-row CSV form produced by ``to_csv``.
    /// A leading ``file`` column is ignored.
    static Expected<ScoreTable, std::string> parse_csv(std::string_view text);

    /// Header row then value row, each prefixed with a ``file`` column when ``filename`` is given.
    /// Fields are quoted as needed.
    std::string to_csv(std::string_view filename = "") const;

    /// Sets ``column`` to ``value``, appending the column if it is new
    void set(std::string column, double value);

    std::optional<double> get(std::string_view column) const;

    std::span<const Entry> get_entries() const noexcept { return entries_; }

    std::size_t size() const noexcept { return entries_.size(); }

    bool empty() const noexcept { return entries_.empty(); }

    bool operator==(const ScoreTable&) const = default;

private:
    std::vector<Entry> entries_;
};

} // namespace batchgrader

template <>
struct fmt::formatter<::batchgrader::ScoreTable> : fmt::formatter<std::string_view>
{
    auto format(const ::batchgrader::ScoreTable& from, fmt::format_context& ctx) const {
        auto out = fmt::format_to(ctx.out(), "{{");
        bool first = true;
        for (const auto& [column, value] : from.get_entries()) {
            out = fmt::format_to(out, "{}{}: {}", first ? "" : ", ", column, value);
            first = false;
        }
        return fmt::format_to(out, "}}");
    }
};
