#include "catch2_custom.hpp"

#include "output/plaintext_serializer.hpp"

#include <refcheck/grading_session.hpp>

#include <string>

using namespace refcheck;

TEST_CASE("Progress of a single group") {
    StringSink sink;
    PlainTextSerializer serializer{sink, false};

    serializer.on_run_begin(1);
    serializer.on_group_begin("default");
    serializer.on_environment_begin();
    serializer.on_environment_check(1, 2);
    serializer.on_environment_check(2, 2);
    serializer.on_environment_passed();
    serializer.on_submission_begin();
    serializer.on_group_result({.name = "default", .success = true, .score = std::nullopt});
    serializer.on_run_result({.groups = {{.name = "default", .success = true, .score = std::nullopt}}});
    serializer.finalize();

    REQUIRE(sink.get_contents() == "[+] Running tests..\n"
                                   "[+] Testing environment..\n"
                                   "[+] Environment test 1 of 2\n"
                                   "[+] Environment test 2 of 2\n"
                                   "[+] Environment tests passed :-)\n\n"
                                   "[+] Testing submission...\n");
}

TEST_CASE("Scores and failures of several groups") {
    StringSink sink;
    PlainTextSerializer serializer{sink, false};

    RunResult result{.groups = {{.name = "A", .success = false, .score = std::nullopt},
                                {.name = "B", .success = true, .score = 0.5}}};

    serializer.on_run_begin(2);
    serializer.on_group_begin("A");
    serializer.on_group_result(result.groups[0]);
    serializer.on_group_begin("B");
    serializer.on_group_result(result.groups[1]);
    serializer.on_run_result(result);

    REQUIRE(sink.get_contents() ==
            "[+] Running tests..\n"
            "[+] Running group A..\n"
            "[+] Running group B..\n"
            "[+] Score of B: 0.5\n"
            "[!] Tests of group A failed\n"
            "[!] Some tests failed! Please review your submission to avoid penalties during grading.\n");
}

TEST_CASE("Errors and warnings are passed through") {
    StringSink sink;
    PlainTextSerializer serializer{sink, false};

    serializer.on_warning("[-] careful");
    serializer.on_error("[!] broken");

    REQUIRE(sink.get_contents() == "[-] careful\n[!] broken\n");
}

TEST_CASE("Every line is flushed immediately") {
    StringSink sink;
    PlainTextSerializer serializer{sink, false};

    serializer.on_run_begin(1);
    serializer.on_environment_begin();

    REQUIRE(sink.get_num_flushes() == 2);
}

TEST_CASE("Colorized output wraps lines in escape sequences") {
    StringSink sink;
    PlainTextSerializer serializer{sink, true};

    serializer.on_error("[!] broken");

    REQUIRE_THAT(sink.get_contents(), Catch::Matchers::StartsWith("\x1b["));
    REQUIRE_THAT(sink.get_contents(), Catch::Matchers::ContainsSubstring("[!] broken"));
    REQUIRE_THAT(sink.get_contents(), Catch::Matchers::EndsWith("\x1b[0m\n"));
}
