#pragma once

#include <batchgrader/results/identifier_resolver.hpp>
#include <batchgrader/results/score_table.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace batchgrader {

/// The scores one submission produced, keyed by its filename
struct SubmissionResult
{
    std::string key;
    ScoreTable scores;

    /// Set when the submission's sandbox failed
    std::optional<std::string> diagnostic;
};

/// Merged grades of a batch: one row per submission, one column per test file.
/// Every row holds a value for every column.
class FinalGradeTable
{
public:
    struct Row
    {
        std::string key;
        std::vector<double> values;
        std::optional<std::string> diagnostic;

        /// Filename of the submission the row came from. Unique within a table.
        std::string submission;
    };

    FinalGradeTable(std::string key_column, std::vector<std::string> columns);

    /// \param submission the row's submission filename; ``key`` if empty
    /// \throws AggregationSchemaError if ``values`` does not have one entry per column,
    ///         or ``submission`` already has a row
    void add_row(std::string key, std::vector<double> values, std::optional<std::string> diagnostic = std::nullopt,
                 std::string submission = {});

    /// Either ``file`` or ``identifier``
    const std::string& get_key_column() const noexcept { return key_column_; }

    const std::vector<std::string>& get_columns() const noexcept { return columns_; }

    std::span<const Row> get_rows() const noexcept { return rows_; }

    /// Key column followed by the score columns
    std::vector<std::string> get_header() const;

    /// \throws std::out_of_range if either the row or the column does not exist
    double at(std::string_view key, std::string_view column) const;

    /// First row keyed ``key``. Identifiers may key more than one row.
    const Row* find_row(std::string_view key) const;

    const Row* find_submission(std::string_view submission) const;

private:
    std::string key_column_;
    std::vector<std::string> columns_;
    std::vector<Row> rows_;
};

/// Merges per-submission score tables into a FinalGradeTable.
///
/// Columns are the union of every table's columns, ordered by first appearance (seed columns first).
/// Rows keep the order of the input. A cell a submission did not produce is 0.
class ResultAggregator
{
public:
    /// \param resolver if set, rows are keyed by ``resolver->file_to_id(key)`` under an ``identifier``
    ///        column, and the filename column is dropped
    explicit ResultAggregator(std::shared_ptr<const IdentifierResolver> resolver = nullptr);

    /// Columns every merged table starts with, even if no submission produced them
    void seed_columns(std::vector<std::string> columns);

    /// \throws IdentifierResolutionError if the resolver cannot map a submission
    /// \throws AggregationSchemaError if a score column is named like a key column,
    ///         or a submission appears more than once
    FinalGradeTable merge(std::span<const SubmissionResult> results) const;

private:
    std::shared_ptr<const IdentifierResolver> resolver_;
    std::vector<std::string> seed_columns_;
};

} // namespace batchgrader
