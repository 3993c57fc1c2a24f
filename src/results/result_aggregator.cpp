#include <batchgrader/results/result_aggregator.hpp>

#include <batchgrader/exceptions.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/results/csv.hpp>
#include <batchgrader/results/identifier_resolver.hpp>
#include <batchgrader/results/score_table.hpp>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchgrader {

namespace {

auto find_column(const std::vector<std::string>& columns, std::string_view column) {
    return ranges::find_if(columns, [column](const std::string& col) { return col == column; });
}

void append_unique(std::vector<std::string>& columns, std::string_view column) {
    if (find_column(columns, column) == columns.end()) {
        columns.emplace_back(column);
    }
}

} // namespace

FinalGradeTable::FinalGradeTable(std::string key_column, std::vector<std::string> columns)
    : key_column_{std::move(key_column)}
    , columns_{std::move(columns)} {}

void FinalGradeTable::add_row(std::string key, std::vector<double> values, std::optional<std::string> diagnostic,
                              std::string submission) {
    if (values.size() != columns_.size()) {
        throw AggregationSchemaError(fmt::format("Row {:?} has {} value(s) but the table has {} column(s)", key,
                                                 values.size(), columns_.size()));
    }

    if (submission.empty()) {
        submission = key;
    }

    if (find_submission(submission) != nullptr) {
        throw AggregationSchemaError(fmt::format("Submission {:?} has more than one row", submission));
    }

    rows_.push_back(Row{.key = std::move(key),
                        .values = std::move(values),
                        .diagnostic = std::move(diagnostic),
                        .submission = std::move(submission)});
}

std::vector<std::string> FinalGradeTable::get_header() const {
    std::vector<std::string> header;
    header.reserve(columns_.size() + 1);

    header.push_back(key_column_);
    header.insert(header.end(), columns_.begin(), columns_.end());

    return header;
}

double FinalGradeTable::at(std::string_view key, std::string_view column) const {
    const Row* row = find_row(key);
    if (row == nullptr) {
        throw std::out_of_range(fmt::format("No row {:?} in grade table", key));
    }

    auto col_iter = find_column(columns_, column);
    if (col_iter == columns_.end()) {
        throw std::out_of_range(fmt::format("No column {:?} in grade table", column));
    }

    return row->values.at(static_cast<std::size_t>(col_iter - columns_.begin()));
}

const FinalGradeTable::Row* FinalGradeTable::find_row(std::string_view key) const {
    auto iter = ranges::find_if(rows_, [key](const Row& row) { return row.key == key; });

    return iter == rows_.end() ? nullptr : &*iter;
}

const FinalGradeTable::Row* FinalGradeTable::find_submission(std::string_view submission) const {
    auto iter = ranges::find_if(rows_, [submission](const Row& row) { return row.submission == submission; });

    return iter == rows_.end() ? nullptr : &*iter;
}

ResultAggregator::ResultAggregator(std::shared_ptr<const IdentifierResolver> resolver)
    : resolver_{std::move(resolver)} {}

void ResultAggregator::seed_columns(std::vector<std::string> columns) {
    seed_columns_.clear();

    for (const std::string& column : columns) {
        append_unique(seed_columns_, column);
    }
}

FinalGradeTable ResultAggregator::merge(std::span<const SubmissionResult> results) const {
    std::vector<std::string> columns = seed_columns_;

    for (const SubmissionResult& result : results) {
        for (const ScoreTable::Entry& entry : result.scores.get_entries()) {
            append_unique(columns, entry.first);
        }
    }

    // Neither key column may double as a score column
    if (auto reserved = ranges::find_if(columns, &is_key_column); reserved != columns.end()) {
        throw AggregationSchemaError(fmt::format("Score column {:?} collides with a key column", *reserved));
    }

    FinalGradeTable table{std::string{resolver_ ? IDENTIFIER_COLUMN : FILE_COLUMN}, columns};

    for (const SubmissionResult& result : results) {
        auto values = columns | ranges::views::transform([&result](const std::string& column) {
                          return result.scores.get(column).value_or(0.0);
                      }) |
                      ranges::to<std::vector<double>>();

        // Rows stay one per submission; a resubmission keeps its own row under the same identifier
        std::string key = resolver_ ? resolver_->file_to_id(result.key) : result.key;

        table.add_row(std::move(key), std::move(values), result.diagnostic, result.key);
    }

    LOG_DEBUG("Merged {} score table(s) into {} column(s)", results.size(), columns.size());

    return table;
}

} // namespace batchgrader
