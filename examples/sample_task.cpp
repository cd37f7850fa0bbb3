// Submission test for a small exploitation task: the person being graded writes a program
// whose output, fed to a vulnerable target, makes the target print its flag.

#include <refcheck/refcheck.hpp>

#include <filesystem>
#include <string>
#include <utility>

namespace {

const std::filesystem::path EXPLOIT_PATH = "/home/user/exploit";
const std::filesystem::path TARGET_PATH = "/home/user/vulnerable";
constexpr std::string_view FLAG = "FLAG{refcheck-sample}";

void register_checks(refcheck::CheckRegistry& registry, const refcheck::HarnessOptions& options) {
    using namespace refcheck;

    registry.add_environment_check([] {
        if (!std::filesystem::exists(EXPLOIT_PATH)) {
            print_err(fmt::format("[!] {} does not exist", EXPLOIT_PATH.string()));
            return false;
        }
        return true;
    });

    registry.add_environment_check([options] {
        auto [exit_code, output] = run_capture_output({TARGET_PATH, "--selftest"}, options.make_exec_options());

        if (exit_code != 0) {
            print_err(fmt::format("[!] The target does not work as expected:\n{}", output));
            return false;
        }
        return true;
    });

    registry.add_submission_check([options] {
        auto [exit_code, payload] = get_payload_from_executable({EXPLOIT_PATH}, options.make_exec_options());

        run_with_payload({TARGET_PATH}, std::move(payload), FLAG, options.make_exec_options());
        print_ok("[+] The target printed its flag");

        return true;
    });

    // Bonus: a shorter payload is worth more
    registry.add_extended_submission_check(
        [options] {
            auto [exit_code, payload] =
                get_payload_from_executable({EXPLOIT_PATH}, options.make_exec_options(), /*verbose=*/false);

            constexpr std::size_t MAX_BONUS_SIZE = 128;
            bool short_enough = payload.size() <= MAX_BONUS_SIZE;

            return CheckOutcome{.success = short_enough, .score = short_enough ? 1.0 : 0.0};
        },
        "bonus");

    // Helper scripts written in Python have to be clean
    registry.add_submission_check(
        [options] { return check_all_python_files(DEFAULT_SUBMISSION_DIR, options.make_exec_options()); }, "style");
}

} // namespace

int main() {
    return refcheck::run_harness([] {
        auto options = refcheck::HarnessOptions::from_env();

        if (!options) {
            throw refcheck::ConfigurationError(fmt::format("[!] {}", options.error()));
        }

        refcheck::CheckRegistry registry;
        register_checks(registry, *options);

        refcheck::run_tests_and_exit(registry, *options);
    });
}
