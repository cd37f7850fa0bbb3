#include "catch2_custom.hpp"

#include <refcheck/harness_options.hpp>
#include <refcheck/output/console.hpp>
#include <refcheck/privilege/credentials.hpp>

#include <gsl/util>

#include <cstdlib>
#include <filesystem>
#include <string>

using namespace refcheck;

namespace {

/// Sets an environment variable for the current scope
auto scoped_env(const char* name, const char* value) {
    ::setenv(name, value, /*overwrite=*/1);
    return gsl::finally([name] { ::unsetenv(name); });
}

} // namespace

TEST_CASE("Defaults apply when nothing is overridden") {
    auto opts = HarnessOptions::from_env();

    REQUIRE(opts.has_value());
    REQUIRE(opts->result_path.string() == HarnessOptions::DEFAULT_RESULT_PATH);
    REQUIRE(opts->environ_path.string() == DEFAULT_ENVIRON_PATH);
    REQUIRE(opts->drop_credentials == Credentials{.uid = 9999, .gid = 9999});
    REQUIRE(opts->color_mode == ColorMode::Auto);
    REQUIRE(opts->validate().has_value());
}

TEST_CASE("Environment variables override the defaults") {
    auto result_path = scoped_env(HarnessOptions::ENV_RESULT_PATH, "/tmp/out/results.json");
    auto environ_path = scoped_env(HarnessOptions::ENV_ENVIRON_PATH, "/tmp/env_snapshot");
    auto uid = scoped_env(HarnessOptions::ENV_DROP_UID, "1234");
    auto gid = scoped_env(HarnessOptions::ENV_DROP_GID, "5678");
    auto color = scoped_env(HarnessOptions::ENV_COLOR, "never");

    auto opts = HarnessOptions::from_env();

    REQUIRE(opts.has_value());
    REQUIRE(opts->result_path.string() == "/tmp/out/results.json");
    REQUIRE(opts->environ_path.string() == "/tmp/env_snapshot");
    REQUIRE(opts->drop_credentials == Credentials{.uid = 1234, .gid = 5678});
    REQUIRE(opts->color_mode == ColorMode::Never);
}

TEST_CASE("Unparsable overrides are reported by name") {
    SECTION("Negative id") {
        auto uid = scoped_env(HarnessOptions::ENV_DROP_UID, "-1");
        auto opts = HarnessOptions::from_env();

        REQUIRE(opts.has_error());
        REQUIRE_THAT(opts.error(), Catch::Matchers::StartsWith("REFCHECK_DROP_UID="));
    }

    SECTION("Not a number") {
        auto gid = scoped_env(HarnessOptions::ENV_DROP_GID, "staff");
        REQUIRE_THAT(HarnessOptions::from_env().error(), Catch::Matchers::StartsWith("REFCHECK_DROP_GID="));
    }

    SECTION("Out of range") {
        auto uid = scoped_env(HarnessOptions::ENV_DROP_UID, "99999999999");
        REQUIRE(HarnessOptions::from_env().has_error());
    }

    SECTION("Unknown colour mode") {
        auto color = scoped_env(HarnessOptions::ENV_COLOR, "sometimes");
        REQUIRE_THAT(HarnessOptions::from_env().error(), Catch::Matchers::ContainsSubstring("never, auto, always"));
    }
}

TEST_CASE("Validation") {
    HarnessOptions opts;

    SECTION("Workers never run as root") {
        opts.drop_credentials = {.uid = 0, .gid = 9999};
        REQUIRE(opts.validate().has_error());

        opts.drop_credentials = {.uid = 9999, .gid = 0};
        REQUIRE(opts.validate().has_error());
    }

    SECTION("The result path must name a file") {
        opts.result_path = "/var/lib/refcheck/";
        REQUIRE(opts.validate().has_error());

        opts.result_path = std::filesystem::temp_directory_path();
        REQUIRE(opts.validate().has_error());
    }

    SECTION("The snapshot path must be set") {
        opts.environ_path.clear();
        REQUIRE(opts.validate().has_error());
    }
}

TEST_CASE("Command options inherit the drop identity and the snapshot path") {
    HarnessOptions opts;
    opts.drop_credentials = {.uid = 4242, .gid = 4343};
    opts.environ_path = "/run/snapshot";

    ExecOptions exec_opts = opts.make_exec_options();

    REQUIRE(exec_opts.credentials == opts.drop_credentials);
    REQUIRE(exec_opts.environ_path.string() == "/run/snapshot");
    REQUIRE(exec_opts.timeout == ExecOptions::DEFAULT_TIMEOUT);
    REQUIRE_FALSE(exec_opts.env.has_value());
}
