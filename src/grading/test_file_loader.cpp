#include <batchgrader/grading/test_file_loader.hpp>

#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/test_case.hpp>
#include <batchgrader/grading/test_file.hpp>
#include <batchgrader/logging.hpp>
#include <batchgrader/results/csv.hpp>

#include <nlohmann/json.hpp>
#include <range/v3/algorithm/adjacent_find.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace batchgrader {

using nlohmann::json;

namespace {

constexpr double DEFAULT_TOTAL_VALUE = 1.0;
constexpr bool DEFAULT_ALL_OR_NOTHING = true;

TestCase parse_case(const json& j) {
    CommandBody body{.command = j.at("command").get<std::string>()};

    if (j.contains("expected_output") && !j.at("expected_output").is_null()) {
        body.expected_output = j.at("expected_output").get<std::string>();
    }

    if (j.contains("timeout_ms") && !j.at("timeout_ms").is_null()) {
        body.timeout = std::chrono::milliseconds{j.at("timeout_ms").get<long>()};
    }

    TestCase test_case{.name = j.at("name").get<std::string>(), .body = std::move(body)};
    test_case.hidden = j.value("hidden", false);
    test_case.success_message = j.value("success_message", std::string{});
    test_case.failure_message = j.value("failure_message", std::string{});

    // null and absent both mean "resolve from the remaining budget"
    if (j.contains("points") && !j.at("points").is_null()) {
        test_case.points = j.at("points").get<double>();
    }

    return test_case;
}

} // namespace

TestFile parse_command_test_file(std::string_view json_text, const std::filesystem::path& path) {
    std::string name;
    double total_value = DEFAULT_TOTAL_VALUE;
    bool all_or_nothing = DEFAULT_ALL_OR_NOTHING;
    std::vector<TestCase> cases;

    try {
        const json root = json::parse(json_text);

        name = root.value("name", path.stem().string());
        total_value = root.value("points", DEFAULT_TOTAL_VALUE);
        all_or_nothing = root.value("all_or_nothing", DEFAULT_ALL_OR_NOTHING);

        for (const json& case_json : root.at("cases")) {
            cases.push_back(parse_case(case_json));
        }
    } catch (const json::exception& ex) {
        throw TestFileParseError(fmt::format("{}: malformed test file: {}", path.string(), ex.what()));
    }

    LOG_DEBUG("Parsed test file {:?} ({} cases, {} points, all_or_nothing={})", name, cases.size(), total_value,
              all_or_nothing);

    return TestFile{std::move(name), path, TestFileFormat::Command, std::move(cases), total_value, all_or_nothing};
}

TestFile load_test_file(const std::filesystem::path& path, TestFileFormat format) {
    if (format != TestFileFormat::Command) {
        throw TestFileParseError(fmt::format("{}: {} test files cannot be loaded from disk", path.string(), format));
    }

    std::ifstream in_file{path};

    if (!in_file.is_open()) {
        throw TestFileParseError(fmt::format("Failed to open test file {:?}", path.string()));
    }

    std::stringstream contents;
    contents << in_file.rdbuf();

    if (in_file.bad()) {
        throw TestFileParseError(fmt::format("IO error in reading test file {:?}", path.string()));
    }

    return parse_command_test_file(contents.str(), path);
}

std::vector<TestFile> load_bundle(const std::filesystem::path& bundle_dir) {
    namespace fs = std::filesystem;

    if (!fs::is_directory(bundle_dir)) {
        throw TestFileParseError(fmt::format("Autograder bundle {:?} is not a directory", bundle_dir.string()));
    }

    std::vector<fs::path> paths;

    for (const fs::directory_entry& entry : fs::directory_iterator{bundle_dir}) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            paths.push_back(entry.path());
        }
    }

    if (paths.empty()) {
        throw TestFileParseError(fmt::format("Autograder bundle {:?} contains no test files", bundle_dir.string()));
    }

    ranges::sort(paths);

    std::vector<TestFile> test_files;
    test_files.reserve(paths.size());

    for (const fs::path& path : paths) {
        test_files.push_back(load_test_file(path));

        // Test file names become score columns
        const std::string& name = test_files.back().get_name();
        if (name.empty()) {
            throw TestFileParseError(fmt::format("{}: test file has an empty name", path.string()));
        }
        if (is_key_column(name)) {
            throw TestFileParseError(
                fmt::format("{}: test file name {:?} is reserved for the key column", path.string(), name));
        }
    }

    auto names = test_files | ranges::views::transform(&TestFile::get_name) | ranges::to<std::vector<std::string>>();
    ranges::sort(names);

    if (auto dup = ranges::adjacent_find(names); dup != names.end()) {
        throw TestFileParseError(fmt::format("Autograder bundle {:?} has more than one test file named {:?}",
                                             bundle_dir.string(), *dup));
    }

    LOG_INFO("Loaded {} test file(s) from {:?}", test_files.size(), bundle_dir.string());

    return test_files;
}

} // namespace batchgrader
