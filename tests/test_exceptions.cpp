#include "catch2_custom.hpp"

#include <refcheck/common/error_types.hpp>
#include <refcheck/exceptions.hpp>

#include <chrono>
#include <concepts>
#include <string>

using namespace std::literals;
using namespace refcheck;

TEST_CASE("Exit codes are rendered with signal names") {
    REQUIRE(format_exit_code(0) == "0");
    REQUIRE(format_exit_code(3) == "3");
    REQUIRE(format_exit_code(-9) == "-9 (SIGKILL)");
    REQUIRE(format_exit_code(-15) == "-15 (SIGTERM)");
}

TEST_CASE("Captured output is only escaped when it contains control bytes") {
    REQUIRE(decode_or_escape("hello\nworld\t!") == "hello\nworld\t!");
    REQUIRE(decode_or_escape("") == "");
    REQUIRE(decode_or_escape("a\x01z") == R"("a\x01z")");
}

TEST_CASE("Error kinds round-trip through their names") {
    using enum ErrorKind;

    for (ErrorKind kind : {Harness, Timeout, ExecutionFailure, Validation, WrongOutput, Configuration, Internal,
                           Interrupted, Unexpected}) {
        REQUIRE(error_kind_from_string(to_string(kind)) == kind);
    }

    REQUIRE_FALSE(error_kind_from_string("harness").has_value());
    REQUIRE_FALSE(error_kind_from_string("").has_value());

    REQUIRE(fmt::format("{}", ExecutionFailure) == "ExecutionFailure");
    REQUIRE(to_string(static_cast<ErrorKind>(42)) == "<invalid>");
}

TEST_CASE("Classified errors carry their kind and message") {
    TimeoutError timeout{"sleep 5", 1s};
    REQUIRE(timeout.get_kind() == ErrorKind::Timeout);
    REQUIRE(timeout.what() == "[!] Timeout error for: sleep 5 (after 1s)"s);

    ExecutionError exec{"./a.out", -11, "partial", ""};
    REQUIRE(exec.get_kind() == ErrorKind::ExecutionFailure);
    REQUIRE_THAT(exec.what(), Catch::Matchers::StartsWith("[!] Execution of ./a.out failed with exitcode -11 (SIGSEGV)."));
    REQUIRE_THAT(exec.what(), Catch::Matchers::ContainsSubstring("partial"));

    WrongOutputError wrong{"nope"};
    REQUIRE(wrong.get_kind() == ErrorKind::WrongOutput);
    REQUIRE(wrong.what() == "[!] Wrong output: nope"s);

    // Only the submission-check call site absorbs these
    STATIC_REQUIRE(std::derived_from<WrongOutputError, HarnessError>);
    STATIC_REQUIRE(std::derived_from<TimeoutError, HarnessError>);
    STATIC_REQUIRE_FALSE(std::derived_from<ConfigurationError, HarnessError>);
    STATIC_REQUIRE_FALSE(std::derived_from<InternalFailure, HarnessError>);
    STATIC_REQUIRE_FALSE(std::derived_from<UserInterrupt, HarnessError>);
}
