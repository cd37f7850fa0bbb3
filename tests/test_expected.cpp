#include "catch2_custom.hpp"

#include <refcheck/common/expected.hpp>

#include <string>
#include <system_error>

using namespace std::literals;
using refcheck::Expected;

// Simple types
using Et = Expected<int, std::string>;

namespace {

Et parse_digit(char chr) {
    if (chr < '0' || chr > '9') {
        return "not a digit"s;
    }
    return chr - '0';
}

Et add_digits(char lhs, char rhs) {
    int first = TRY(parse_digit(lhs));
    int second = TRYE(parse_digit(rhs), "bad second digit"s);

    return first + second;
}

Expected<> check_positive(int num) {
    if (num <= 0) {
        return std::make_error_code(std::errc::invalid_argument);
    }
    return {};
}

Expected<int> doubled_if_positive(int num) {
    TRY(check_positive(num));
    return num * 2;
}

} // namespace

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());
    REQUIRE(*Et{123} == 123);

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());
    REQUIRE(Et{"Hello"}.error() == "Hello");
}

TEST_CASE("Comparison against the error type") {
    REQUIRE(Et{"Unexpected!"} == "Unexpected!"s);
    REQUIRE_FALSE(Et{"Unexpected!"} == "Exp!"s);
    REQUIRE_FALSE(Et{123} == "123"s);
}

TEST_CASE("value_or") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{"A"}.value_or(456) == 456);
}

TEST_CASE("TRY and TRYE propagate the first error") {
    REQUIRE(*add_digits('3', '4') == 7);
    REQUIRE(add_digits('x', '4').error() == "not a digit");
    REQUIRE(add_digits('3', 'y').error() == "bad second digit");
}

TEST_CASE("TRY works with void-typed expected and error codes") {
    REQUIRE(*doubled_if_positive(21) == 42);

    auto res = doubled_if_positive(-1);
    REQUIRE(res.has_error());
    REQUIRE(res.error() == std::errc::invalid_argument);
}

TEST_CASE("Formatting") {
    REQUIRE(fmt::format("{}", Et{5}) == "Expected(5)");
    REQUIRE(fmt::format("{}", Et{"oops"}) == "Error(oops)");
    REQUIRE(fmt::format("{}", Expected<>{}) == "Expected(void)");
}
