#include "catch2_custom.hpp"

#include <refcheck/exceptions.hpp>
#include <refcheck/privilege/credentials.hpp>
#include <refcheck/privilege/drop.hpp>
#include <refcheck/process/command.hpp>

#include <range/v3/algorithm/contains.hpp>

#include <csignal>
#include <stdexcept>
#include <string>

#include <unistd.h>

using namespace std::literals;
using namespace refcheck;

namespace {

constexpr uid_t NOBODY_UID = 65534;
constexpr gid_t NOGROUP_GID = 65534;

CommandResult make_result(int code, std::string out) {
    return {.exit_code = code, .stdout_bytes = std::move(out), .stderr_bytes = ""};
}

CommandResult report_own_pid() {
    return make_result(0, std::to_string(::getpid()));
}

CommandResult throw_classified() {
    throw WrongOutputError("missing marker");
}

CommandResult throw_unclassified() {
    throw std::out_of_range("index 7 out of range");
}

CommandResult exit_without_result() {
    ::_exit(3);
}

CommandResult die_by_signal() {
    ::kill(::getpid(), SIGKILL);
    return make_result(0, "unreachable");
}

CommandResult flood_channel() {
    return make_result(0, std::string(MAX_PAYLOAD_SIZE, 'x'));
}

} // namespace

TEST_CASE("Results come back from the worker") {
    CommandResult result = run_privileged(Credentials::current(), make_result, 42, "forty-two"s);

    REQUIRE(result == make_result(42, "forty-two"));
}

TEST_CASE("The worker is a separate process") {
    CommandResult result = run_privileged(Credentials::current(), report_own_pid);

    REQUIRE(result.stdout_bytes != std::to_string(::getpid()));
}

TEST_CASE("Classified errors keep their type across the channel") {
    REQUIRE_THROWS_MATCHES(run_privileged(Credentials::current(), throw_classified), WrongOutputError,
                           Catch::Matchers::Message("[!] Wrong output: missing marker"));
}

TEST_CASE("Unclassified errors come back as WorkerError with their message") {
    REQUIRE_THROWS_MATCHES(run_privileged(Credentials::current(), throw_unclassified), WorkerError,
                           Catch::Matchers::Message("index 7 out of range"));
}

TEST_CASE("Dropping to the caller's own identity keeps it") {
    Credentials self = Credentials::current();
    ProcessIdentity identity = get_worker_identity(self);

    REQUIRE(identity.ruid == self.uid);
    REQUIRE(identity.euid == self.uid);
    REQUIRE(identity.suid == self.uid);
    REQUIRE(identity.rgid == self.gid);
    REQUIRE(identity.egid == self.gid);
    REQUIRE(identity.sgid == self.gid);
}

TEST_CASE("Root workers drop every id and the root group") {
    if (::geteuid() != 0) {
        SKIP("dropping to another identity needs root");
    }

    ProcessIdentity identity = get_worker_identity({.uid = NOBODY_UID, .gid = NOGROUP_GID});

    REQUIRE(identity.ruid == NOBODY_UID);
    REQUIRE(identity.euid == NOBODY_UID);
    REQUIRE(identity.suid == NOBODY_UID);
    REQUIRE(identity.rgid == NOGROUP_GID);
    REQUIRE(identity.egid == NOGROUP_GID);
    REQUIRE(identity.sgid == NOGROUP_GID);
    REQUIRE_FALSE(ranges::contains(identity.groups, gid_t{0}));

    // The caller is untouched
    REQUIRE(::geteuid() == 0);
}

TEST_CASE("A worker that cannot drop privileges reports an internal failure") {
    if (::geteuid() == 0) {
        SKIP("root may switch to any identity");
    }

    Credentials other = Credentials::current();
    other.uid += 1;

    REQUIRE_THROWS_AS(get_worker_identity(other), InternalFailure);
}

TEST_CASE("A worker that dies before reporting is an internal failure") {
    SECTION("Exits") {
        REQUIRE_THROWS_MATCHES(
            run_privileged(Credentials::current(), exit_without_result), InternalFailure,
            Catch::Matchers::Message("[!] Privilege-dropped worker exited without sending a result (exit code 3)"));
    }

    SECTION("Killed by a signal") {
        REQUIRE_THROWS_MATCHES(run_privileged(Credentials::current(), die_by_signal), InternalFailure,
                               Catch::Matchers::ContainsSubstring("killed by signal -9 (SIGKILL)"));
    }
}

TEST_CASE("A worker flooding the channel is killed and rejected") {
    REQUIRE_THROWS_MATCHES(run_privileged(Credentials::current(), flood_channel), InternalFailure,
                           Catch::Matchers::ContainsSubstring("sent more than"));
}
