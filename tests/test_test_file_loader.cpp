#include "catch2_custom.hpp"

#include <batchgrader/exceptions.hpp>
#include <batchgrader/grading/test_case.hpp>
#include <batchgrader/grading/test_file.hpp>
#include <batchgrader/grading/test_file_loader.hpp>

#include "test_helpers.hpp"

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

using namespace batchgrader;
using path = std::filesystem::path;

TEST_CASE("Load the resources bundle") {
    std::vector<TestFile> files = load_bundle(path{RESOURCES_DIR} / "bundle");

    // README.txt is skipped; files are in filename order
    REQUIRE(files.size() == 2);

    const TestFile& hello = files[0];
    REQUIRE(hello.get_name() == "hello");
    REQUIRE(hello.get_format() == TestFileFormat::Command);
    REQUIRE(hello.get_total_value() == 2.0);
    REQUIRE_FALSE(hello.is_all_or_nothing());
    REQUIRE(hello.get_cases().size() == 2);
    REQUIRE(hello.get_weight(0) == 1.5);
    REQUIRE(hello.get_weight(1) == Catch::Approx(0.5));
    REQUIRE(hello.get_cases()[0].failure_message == "The submission never says hello");
    REQUIRE(hello.get_cases()[1].hidden);

    // Defaults: name from the filename, 1 point, all or nothing
    const TestFile& answer = files[1];
    REQUIRE(answer.get_name() == "q2_answer");
    REQUIRE(answer.get_total_value() == 1.0);
    REQUIRE(answer.is_all_or_nothing());
    REQUIRE(answer.get_cases()[0].success_message == "Correct answer");

    const auto& body = std::get<CommandBody>(answer.get_cases()[1].body);
    REQUIRE(body.timeout == std::chrono::milliseconds{5000});
    REQUIRE_FALSE(body.expected_output);
}

TEST_CASE("Malformed test files are rejected") {
    const path file{"q.json"};

    REQUIRE_THROWS_AS(parse_command_test_file("{ not json", file), TestFileParseError);
    REQUIRE_THROWS_AS(parse_command_test_file(R"({"name": "q"})", file), TestFileParseError);
    REQUIRE_THROWS_AS(parse_command_test_file(R"({"cases": [{"name": "no command"}]})", file), TestFileParseError);
    REQUIRE_THROWS_AS(parse_command_test_file(R"({"cases": [{"name": "a", "command": "true", "points": "two"}]})", file),
                      TestFileParseError);
}

TEST_CASE("Point allocation problems surface while loading") {
    REQUIRE_THROWS_AS(parse_command_test_file(
                          R"({"points": 1, "cases": [{"name": "a", "command": "true", "points": 2}]})", "q.json"),
                      AllocationError);
}

TEST_CASE("Null points mean an unspecified weight") {
    TestFile file = parse_command_test_file(
        R"({"points": 3, "cases": [{"name": "a", "command": "true", "points": null},
                                   {"name": "b", "command": "true", "points": 2}]})",
        "q.json");

    REQUIRE(file.get_weight(0) == Catch::Approx(1.0));
}

TEST_CASE("Bundles without test files are rejected") {
    test::TempDir dir;

    REQUIRE_THROWS_AS(load_bundle(dir.path()), TestFileParseError);
    REQUIRE_THROWS_AS(load_bundle(dir / "missing"), TestFileParseError);
}

TEST_CASE("Test file names must be unique within a bundle") {
    test::TempDir dir;
    test::write_file(dir / "a.json", R"({"name": "same", "cases": [{"name": "x", "command": "true"}]})");
    test::write_file(dir / "b.json", R"({"name": "same", "cases": [{"name": "y", "command": "true"}]})");

    REQUIRE_THROWS_WITH(load_bundle(dir.path()), Catch::Matchers::ContainsSubstring("\"same\""));
}

TEST_CASE("Test file names may not take a key column's name") {
    auto name = GENERATE(as<std::string>{}, "file", "identifier", "");

    test::TempDir dir;
    test::write_file(dir / "a.json", R"({"name": "ok", "cases": [{"name": "x", "command": "true"}]})");
    test::write_file(dir / "b.json",
                     fmt::format(R"({{"name": "{}", "cases": [{{"name": "y", "command": "true"}}]}})", name));

    REQUIRE_THROWS_AS(load_bundle(dir.path()), TestFileParseError);
}

TEST_CASE("Test file names with separators are allowed") {
    test::TempDir dir;
    test::write_file(dir / "a.json", R"({"name": "q1, part \"a\"", "cases": [{"name": "x", "command": "true"}]})");

    std::vector<TestFile> files = load_bundle(dir.path());

    REQUIRE(files.size() == 1);
    REQUIRE(files[0].get_name() == "q1, part \"a\"");
}

TEST_CASE("Native test files have no on-disk form") {
    REQUIRE_THROWS_AS(load_test_file(path{RESOURCES_DIR} / "bundle" / "q1_hello.json", TestFileFormat::Native),
                      TestFileParseError);
}
