/// \file
/// The CSV dialect shared by every table batchgrader reads or writes: comma separated,
/// fields quoted as in RFC 4180, LF or CRLF line endings.
#pragma once

#include <batchgrader/common/expected.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace batchgrader {

/// Key column of a table whose rows are keyed by submission filename
constexpr std::string_view FILE_COLUMN = "file";

/// Key column of a final grade table whose filenames were resolved to identifiers
constexpr std::string_view IDENTIFIER_COLUMN = "identifier";

/// Whether ``column`` is one of the key columns, which no score column may be named
bool is_key_column(std::string_view column);

struct CsvRecord
{
    std::size_t line; ///< 1-based line the record starts on
    std::vector<std::string> fields;
};

/// Quotes ``field`` if it holds a separator, a quote or a line break
std::string escape_csv_field(std::string_view field);

/// Escaped ``fields`` joined by commas, without a line ending
std::string join_csv_row(std::span<const std::string> fields);

/// Splits ``text`` into records. Blank lines are skipped.
/// Quoted fields may contain commas, doubled quotes and line breaks.
///
/// \returns an error message naming the line of a malformed quoted field
Expected<std::vector<CsvRecord>, std::string> parse_csv_records(std::string_view text);

} // namespace batchgrader
