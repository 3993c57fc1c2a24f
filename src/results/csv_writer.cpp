#include <batchgrader/results/csv_writer.hpp>

#include <batchgrader/logging.hpp>
#include <batchgrader/results/csv.hpp>
#include <batchgrader/results/result_aggregator.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace batchgrader {

void write_csv(const FinalGradeTable& table, std::ostream& out) {
    bool first = true;
    for (const std::string& column : table.get_header()) {
        fmt::print(out, "{}{}", first ? "" : ",", escape_csv_field(column));
        first = false;
    }
    fmt::print(out, "\n");

    for (const FinalGradeTable::Row& row : table.get_rows()) {
        fmt::print(out, "{}", escape_csv_field(row.key));
        for (double value : row.values) {
            fmt::print(out, ",{}", value);
        }
        fmt::print(out, "\n");
    }
}

std::filesystem::path write_final_grades(const FinalGradeTable& table, const std::filesystem::path& output_dir) {
    namespace fs = std::filesystem;

    const fs::path out_path = output_dir / FINAL_GRADES_FILENAME;

    std::ofstream out_file{out_path, std::ios::trunc};

    if (!out_file.is_open()) {
        throw fs::filesystem_error("Failed to open output file", out_path,
                                   std::make_error_code(std::errc::io_error));
    }

    write_csv(table, out_file);
    out_file.flush();

    if (!out_file) {
        throw fs::filesystem_error("Failed to write output file", out_path, std::make_error_code(std::errc::io_error));
    }

    LOG_INFO("Wrote {} row(s) to {:?}", table.get_rows().size(), out_path.string());

    return out_path;
}

} // namespace batchgrader
