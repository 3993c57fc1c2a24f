#pragma once

#include <batchgrader/results/result_aggregator.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>

namespace batchgrader {

/// Name of the merged grades file written to the output directory
constexpr std::string_view FINAL_GRADES_FILENAME = "final_grades.csv";

/// Writes ``table`` as CSV: the header row, then one row per submission.
/// Fields containing a comma, quote or newline are quoted.
void write_csv(const FinalGradeTable& table, std::ostream& out);

/// Writes ``table`` to ``output_dir/final_grades.csv``, replacing any existing file
///
/// \returns the path written
/// \throws std::filesystem::filesystem_error if the file cannot be written
std::filesystem::path write_final_grades(const FinalGradeTable& table, const std::filesystem::path& output_dir);

} // namespace batchgrader
