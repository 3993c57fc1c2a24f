#include "catch2_custom.hpp"

#include <batchgrader/exceptions.hpp>
#include <batchgrader/results/identifier_resolver.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <tuple>
#include <utility>

using namespace batchgrader;
using path = std::filesystem::path;

TEST_CASE("Read identifier map") {
    auto res = load_identifier_map(path{RESOURCES_DIR} / "ids.csv");

    REQUIRE(res);

    // Header and empty lines are skipped
    REQUIRE(res->size() == 3);
    REQUIRE(res->file_to_id("alice.txt") == "a1001");
    REQUIRE(res->file_to_id("bob.txt") == "b2002");
    REQUIRE(res->file_to_id("carol.txt") == "c3003");
}

TEST_CASE("Read an identifier map with CRLF line breaks") {
    auto res = load_identifier_map(path{RESOURCES_DIR} / "crlf_ids.csv");

    REQUIRE(res);
    REQUIRE(res->file_to_id("bob.txt") == "b2002");
}

TEST_CASE("Read an identifier map with quoted filenames") {
    auto res = load_identifier_map(path{RESOURCES_DIR} / "quoted_ids.csv");

    REQUIRE(res);
    REQUIRE(res->size() == 2);
    REQUIRE(res->file_to_id("smith, john.txt") == "s4004");
    REQUIRE(res->file_to_id("o\"brien.txt") == "o5005");
}

TEST_CASE("Read bad identifier maps; ensure error") {
    REQUIRE_FALSE(load_identifier_map(path{RESOURCES_DIR} / "bad_field_ids.csv"));
    REQUIRE_FALSE(load_identifier_map(path{RESOURCES_DIR} / "duplicate_ids.csv"));
    REQUIRE_FALSE(load_identifier_map(path{RESOURCES_DIR} / "i-do-not-exist.csv"));
}

TEST_CASE("Unknown filenames cannot be resolved") {
    std::map<std::string, std::string, std::less<>> ids{{"alice.txt", "a1001"}};
    const MapIdentifierResolver resolver{std::move(ids)};

    REQUIRE(resolver.file_to_id("alice.txt") == "a1001");

    try {
        std::ignore = resolver.file_to_id("mallory.txt");
        FAIL("file_to_id did not throw");
    } catch (const IdentifierResolutionError& ex) {
        REQUIRE(ex.get_filename() == "mallory.txt");
    }
}
