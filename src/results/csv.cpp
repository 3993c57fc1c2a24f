#include <batchgrader/results/csv.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchgrader {

bool is_key_column(std::string_view column) {
    return column == FILE_COLUMN || column == IDENTIFIER_COLUMN;
}

std::string escape_csv_field(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }

    std::string escaped = "\"";
    for (char chr : field) {
        if (chr == '"') {
            escaped += '"';
        }
        escaped += chr;
    }
    escaped += '"';

    return escaped;
}

std::string join_csv_row(std::span<const std::string> fields) {
    std::string row;

    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            row += ',';
        }
        row += escape_csv_field(fields[i]);
    }

    return row;
}

Expected<std::vector<CsvRecord>, std::string> parse_csv_records(std::string_view text) {
    std::vector<CsvRecord> records;

    CsvRecord record{.line = 1, .fields = {}};
    std::string field;
    std::size_t line = 1;

    // Whether anything (even an empty quoted field) was read for the current record
    bool record_started = false;

    auto end_record = [&] {
        if (record_started) {
            record.fields.push_back(std::move(field));
            records.push_back(std::move(record));
        }
        field.clear();
        record = CsvRecord{.line = line + 1, .fields = {}};
        record_started = false;
    };

    std::size_t pos = 0;
    while (pos < text.size()) {
        const char chr = text[pos];

        if (chr == '"' && field.empty()) {
            const std::size_t quote_line = line;
            record_started = true;
            ++pos;

            while (true) {
                if (pos >= text.size()) {
                    return fmt::format("Line {}: unterminated quoted field", quote_line);
                }

                if (text[pos] == '"') {
                    if (pos + 1 < text.size() && text[pos + 1] == '"') {
                        field += '"';
                        pos += 2;
                        continue;
                    }
                    ++pos;
                    break;
                }

                if (text[pos] == '\n') {
                    ++line;
                }
                field += text[pos++];
            }

            if (pos < text.size() && text.substr(pos, 2) == "\r\n") {
                ++pos;
            }

            if (pos < text.size() && text[pos] != ',' && text[pos] != '\n') {
                return fmt::format("Line {}: unexpected text after a quoted field", line);
            }
            continue;
        }

        if (chr == ',') {
            record.fields.push_back(std::move(field));
            field.clear();
            record_started = true;
        } else if (chr == '\n') {
            end_record();
            ++line;
        } else if (chr == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') {
            // Dropped; the LF ends the record
        } else {
            field += chr;
            record_started = true;
        }

        ++pos;
    }

    end_record();

    return records;
}

} // namespace batchgrader
