#include <batchgrader/results/identifier_resolver.hpp>

#include <batchgrader/common/expected.hpp>
#include <batchgrader/exceptions.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/results/csv.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchgrader {

MapIdentifierResolver::MapIdentifierResolver(std::map<std::string, std::string, std::less<>> ids)
    : ids_{std::move(ids)} {}

std::string MapIdentifierResolver::file_to_id(std::string_view filename) const {
    auto iter = ids_.find(filename);

    if (iter == ids_.end()) {
        throw IdentifierResolutionError(std::string{filename});
    }

    return iter->second;
}

Expected<MapIdentifierResolver, std::string> load_identifier_map(const std::filesystem::path& path) {
    std::ifstream in_file{path};

    if (not in_file.is_open()) {
        return fmt::format("Failed to open identifier map {:?}", path.string());
    }

    std::stringstream contents;
    contents << in_file.rdbuf();

    if (in_file.bad()) {
        return "IO error in reading identifier map";
    }

    auto records = parse_csv_records(contents.str());
    if (!records) {
        return records.error();
    }

    std::map<std::string, std::string, std::less<>> ids;

    for (CsvRecord& record : *records) {
        std::vector<std::string>& values = record.fields;

        if (values.size() < 2) {
            return fmt::format("Line {}: too few values in identifier entry", record.line);
        }

        if (values.size() > 2) {
            return fmt::format("Line {}: too many values in identifier entry", record.line);
        }

        if (record.line == 1 && values[0] == FILE_COLUMN && values[1] == IDENTIFIER_COLUMN) {
            continue;
        }

        if (!ids.emplace(std::move(values[0]), std::move(values[1])).second) {
            return fmt::format("Line {}: filename is mapped more than once", record.line);
        }
    }

    LOG_DEBUG("Read {} identifier(s) from {:?}", ids.size(), path.string());

    return MapIdentifierResolver{std::move(ids)};
}

} // namespace batchgrader
