#include "catch2_custom.hpp"

#include <batchgrader/common/error_types.hpp>
#include <batchgrader/common/expected.hpp>

#include <fmt/format.h>

#include <string>

using namespace std::literals;
using batchgrader::ErrorKind;
using batchgrader::Expected;
using batchgrader::Result;

using Et = Expected<int, std::string>;

namespace {

Result<int> halve(int n) {
    if (n % 2 != 0) {
        return ErrorKind::BadOutput;
    }
    return n / 2;
}

Result<int> quarter(int n) {
    int half = TRY(halve(n));
    return TRY(halve(half));
}

Result<int> quarter_or_timeout(int n) {
    int half = TRYE(halve(n), TimedOut);
    return TRYE(halve(half), TimedOut);
}

} // namespace

TEST_CASE("Simple construction and value checks") {
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());
    REQUIRE(Et{"Hello"}.error() == "Hello");
}

TEST_CASE("Equality with values and errors") {
    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});

    REQUIRE(Et{123} == 123);
    REQUIRE(Et{123} != "123");
    REQUIRE(Et{"Unexpected!"} == "Unexpected!");
    REQUIRE(Et{"Unexpected!"} != 12345);
}

TEST_CASE("value_or and transform") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{"A"}.value_or(456) == 456);

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{12}.transform(square) == 144);
    REQUIRE(Et{"no"}.transform(square) == "no");
}

TEST_CASE("TRY propagates the first error") {
    REQUIRE(quarter(12) == 3);
    REQUIRE(quarter(6) == ErrorKind::BadOutput);
    REQUIRE(quarter(7) == ErrorKind::BadOutput);
}

TEST_CASE("TRYE replaces the propagated error") {
    REQUIRE(quarter_or_timeout(8) == 2);
    REQUIRE(quarter_or_timeout(10) == ErrorKind::TimedOut);
}

TEST_CASE("Expected is formattable") {
    REQUIRE(fmt::format("{}", Result<int>{ErrorKind::Crashed}) == "Error(Crashed)");
}
