#include "catch2_custom.hpp"

#include "output/plaintext_serializer.hpp"
#include "output/result_file.hpp"
#include "test_runner.hpp"

#include <refcheck/exceptions.hpp>
#include <refcheck/grading_session.hpp>
#include <refcheck/registrars/check_registry.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

using namespace refcheck;

namespace {

/// Runs a registry against a scratch result file and a string sink
class RunnerFixture
{
public:
    RunResult run(const CheckRegistry& registry) {
        TestRunner runner{registry, std::make_shared<PlainTextSerializer>(sink_, false), ResultFile{result_path()}};
        return runner.run_all();
    }

    std::filesystem::path result_path() const { return dir_ / "results.json"; }

    std::string read_result_file() const {
        std::ifstream in_file{result_path(), std::ios::binary};
        return {std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};
    }

    const std::string& get_output() const { return sink_.get_contents(); }

private:
    TempDir dir_;
    StringSink sink_;
};

} // namespace

TEST_CASE_METHOD(RunnerFixture, "A failing environment check fails its group without running the submission check") {
    CheckRegistry registry;
    bool submission_ran = false;

    registry.add_environment_check([] { return false; }, "A");
    registry.add_submission_check(
        [&submission_ran] {
            submission_ran = true;
            return true;
        },
        "A");

    RunResult result = run(registry);

    REQUIRE_FALSE(result.success());
    REQUIRE_FALSE(submission_ran);
    REQUIRE(read_result_file() == R"([{"name":"A","success":false,"score":null}])");
    REQUIRE_THAT(get_output(), Catch::Matchers::ContainsSubstring("[!] Some tests failed!"));
}

TEST_CASE_METHOD(RunnerFixture, "A failing environment check with no submission check is just a failure") {
    CheckRegistry registry;
    registry.add_environment_check([] { return false; }, "A");

    RunResult result = run(registry);

    REQUIRE_FALSE(result.success());
    REQUIRE(read_result_file() == R"([{"name":"A","success":false,"score":null}])");
}

TEST_CASE_METHOD(RunnerFixture, "Scored and unscored groups are recorded in order") {
    CheckRegistry registry;

    registry.add_environment_check([] { return true; }, "A");
    registry.add_submission_check([] { return true; }, "A");
    registry.add_submission_check([] { return CheckOutcome{.success = true, .score = 0.5}; }, "B");

    RunResult result = run(registry);

    REQUIRE(result.success());
    REQUIRE(read_result_file() ==
            R"([{"name":"A","success":true,"score":null},{"name":"B","success":true,"score":0.5}])");
    REQUIRE_THAT(get_output(), !Catch::Matchers::ContainsSubstring("[!]"));
}

TEST_CASE_METHOD(RunnerFixture, "Environment checks stop at the first failure") {
    CheckRegistry registry;
    int calls = 0;

    registry.add_environment_check([&calls] {
        ++calls;
        return true;
    });
    registry.add_environment_check([&calls] {
        ++calls;
        return false;
    });
    registry.add_environment_check([&calls] {
        ++calls;
        return true;
    });
    registry.add_submission_check([] { return true; });

    REQUIRE_FALSE(run(registry).success());
    REQUIRE(calls == 2);
}

TEST_CASE_METHOD(RunnerFixture, "An empty registry succeeds with an empty record") {
    CheckRegistry registry;

    REQUIRE(run(registry).success());
    REQUIRE(read_result_file() == "[]");
}

TEST_CASE_METHOD(RunnerFixture, "Passing environment checks without a submission check are a configuration error") {
    CheckRegistry registry;
    registry.add_environment_check([] { return true; }, "A");

    REQUIRE_THROWS_MATCHES(run(registry), ConfigurationError,
                           Catch::Matchers::Message(R"([!] Group "A" has environment checks but no submission check)"));
}

TEST_CASE_METHOD(RunnerFixture, "Harness errors only fail their own group") {
    CheckRegistry registry;

    registry.add_submission_check([]() -> bool { throw TimeoutError("sleep 100", std::chrono::seconds{10}); }, "A");
    registry.add_submission_check([]() -> bool { throw WrongOutputError("nope"); }, "B");
    registry.add_submission_check([] { return true; }, "C");

    RunResult result = run(registry);

    REQUIRE(result.groups.size() == 3);
    REQUIRE_FALSE(result.groups[0].success);
    REQUIRE_FALSE(result.groups[1].success);
    REQUIRE(result.groups[2].success);

    REQUIRE_THAT(get_output(), Catch::Matchers::ContainsSubstring("[!] Timeout error for: sleep 100 (after 10s)"));
    REQUIRE_THAT(get_output(), Catch::Matchers::ContainsSubstring("[!] Wrong output: nope"));
    REQUIRE_THAT(get_output(), Catch::Matchers::ContainsSubstring("[!] Tests of group A failed"));
    REQUIRE_THAT(get_output(), Catch::Matchers::ContainsSubstring("[!] Tests of group B failed"));
    REQUIRE_THAT(get_output(), !Catch::Matchers::ContainsSubstring("[!] Tests of group C failed"));
}

TEST_CASE_METHOD(RunnerFixture, "Other errors end the run") {
    CheckRegistry registry;

    registry.add_submission_check([]() -> bool { throw std::logic_error("bug in the check"); }, "A");
    registry.add_submission_check([] { return true; }, "B");

    REQUIRE_THROWS_AS(run(registry), std::logic_error);
}

TEST_CASE_METHOD(RunnerFixture, "Internal failures are never absorbed") {
    CheckRegistry registry;
    registry.add_submission_check([]() -> bool { throw InternalFailure("[!] rejected"); });

    REQUIRE_THROWS_AS(run(registry), InternalFailure);
}

TEST_CASE_METHOD(RunnerFixture, "An interrupted submission check fails its group and the run goes on") {
    CheckRegistry registry;

    registry.add_submission_check(
        [] {
            std::raise(SIGINT);
            return true;
        },
        "A");
    registry.add_submission_check([]() -> bool { throw UserInterrupt{}; }, "B");
    registry.add_submission_check([] { return true; }, "C");

    RunResult result = run(registry);

    REQUIRE_FALSE(result.groups[0].success);
    REQUIRE_FALSE(result.groups[1].success);
    REQUIRE(result.groups[2].success);
    REQUIRE_THAT(get_output(), Catch::Matchers::ContainsSubstring("[-] Keyboard Interrupt"));
}
