#include <refcheck/process/run.hpp>

#include "process/subprocess.hpp"

#include <refcheck/common/linux.hpp>
#include <refcheck/exceptions.hpp>
#include <refcheck/logging.hpp>
#include <refcheck/output/console.hpp>
#include <refcheck/privilege/drop.hpp>
#include <refcheck/process/command.hpp>

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <csignal>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace refcheck {

namespace {

constexpr std::string_view SHELL = "/bin/sh";
constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

/// Runs inside the worker
CommandResult run_command(const Command& command) {
    // A child that stops reading its input must not take the worker down with it
    std::ignore = linux::sigaction(SIGPIPE, SIG_IGN);

    Subprocess process{command};
    process.start();

    CommandResult result = process.communicate();
    const ExecOptions& opts = command.get_options();

    bool signal_failure = opts.check_signal.value_or(false) && result.terminated_by_signal();
    bool exit_failure = opts.check_exit_code.value_or(false) && result.exit_code != 0;

    if (signal_failure || exit_failure) {
        throw ExecutionError(command.to_string(), result.exit_code, std::move(result.stdout_bytes),
                             std::move(result.stderr_bytes));
    }

    return result;
}

std::string to_command_string(const CommandArgs& args) {
    return join_args(args | ranges::views::transform(&CommandArg::str) | ranges::to<std::vector<std::string>>);
}

std::string_view trim(std::string_view str) {
    auto first = str.find_first_not_of(WHITESPACE);

    if (first == std::string_view::npos) {
        return {};
    }

    auto last = str.find_last_not_of(WHITESPACE);

    return str.substr(first, last - first + 1);
}

/// Trimmed, merged output; timeouts and failed checks are printed and yield nullopt.
/// ``shown`` is how the command appears in those messages.
std::optional<std::string> run_reporting_failures(const CommandArgs& args, std::string_view shown, ExecOptions opts) {
    opts.stdout_policy = StreamPolicy::Capture;
    opts.stderr_policy = StreamPolicy::ToStdout;

    try {
        CommandResult result = execute(args, opts);

        return std::string{trim(result.stdout_bytes)};
    } catch (const TimeoutError& err) {
        print_err(fmt::format("[!] Unexpected timeout for: {} (after {}s)", shown, err.get_timeout().count()));
    } catch (const ExecutionError& err) {
        print_err(fmt::format("[!] Unexpected error: {}", err.what()));
    }

    return std::nullopt;
}

} // namespace

CommandResult execute(const CommandArgs& args, const ExecOptions& opts) {
    Command command = Command::build(args, opts);

    LOG_DEBUG("Executing {:?} as {} (timeout {}s)", command.to_string(), opts.credentials, opts.timeout.count());

    return run_privileged(opts.credentials, run_command, command);
}

std::pair<int, std::string> run_capture_output(const CommandArgs& args, ExecOptions opts) {
    opts.stdout_policy = StreamPolicy::Capture;
    opts.stderr_policy = StreamPolicy::ToStdout;
    opts.check_signal = opts.check_signal.value_or(true);

    CommandResult result = execute(args, opts);

    return {result.exit_code, std::move(result.stdout_bytes)};
}

std::pair<int, std::string> get_payload_from_executable(const CommandArgs& args, ExecOptions opts, bool verbose) {
    if (verbose) {
        print_ok(fmt::format("[+] Executing {} and using its output as payload for the target..",
                             to_command_string(args)));
    }

    opts.check_exit_code = opts.check_exit_code.value_or(true);

    return run_capture_output(args, std::move(opts));
}

std::pair<int, std::string> run_with_payload(const CommandArgs& args, std::optional<std::string> input,
                                             std::optional<std::string_view> marker, ExecOptions opts) {
    if (input) {
        opts.input = std::move(input);
    }

    auto [exit_code, output] = run_capture_output(args, std::move(opts));

    if (marker && output.find(*marker) == std::string::npos) {
        throw WrongOutputError(std::move(output));
    }

    return {exit_code, std::move(output)};
}

std::optional<std::string> run_output(const CommandArgs& args, ExecOptions opts) {
    return run_reporting_failures(args, to_command_string(args), std::move(opts));
}

std::optional<std::string> run_shell(const CommandArgs& args, ExecOptions opts) {
    std::string script = to_command_string(args);

    return run_reporting_failures({SHELL, "-c", script}, script, std::move(opts));
}

} // namespace refcheck
