#include <refcheck/exceptions.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include <string.h> // sigabbrev_np

namespace refcheck {

namespace {

bool is_displayable(unsigned char chr) {
    return chr == '\n' || chr == '\t' || chr == '\r' || (chr >= 0x20 && chr != 0x7f);
}

constexpr std::string_view OUTPUT_DIVIDER_STDOUT = "--------------------- STDOUT ---------------------";
constexpr std::string_view OUTPUT_DIVIDER_STDERR = "--------------------- STDERR ---------------------";

} // namespace

std::string format_exit_code(int exit_code) {
    if (exit_code >= 0) {
        return std::to_string(exit_code);
    }

    const char* abbrev = ::sigabbrev_np(-exit_code);

    if (abbrev == nullptr) {
        return fmt::format("{} (unknown signal)", exit_code);
    }

    return fmt::format("{} (SIG{})", exit_code, abbrev);
}

std::string decode_or_escape(std::string_view bytes) {
    if (ranges::all_of(bytes, [](char chr) { return is_displayable(static_cast<unsigned char>(chr)); })) {
        return std::string{bytes};
    }

    return fmt::format("{:?}", bytes);
}

TimeoutError::TimeoutError(std::string command, std::chrono::seconds timeout)
    : HarnessError{ErrorKind::Timeout,
                   fmt::format("[!] Timeout error for: {} (after {}s)", command, timeout.count())}
    , command_{std::move(command)}
    , timeout_{timeout} {}

ExecutionError::ExecutionError(std::string command, int exit_code, std::string stdout_bytes,
                               std::string stderr_bytes)
    : HarnessError{ErrorKind::ExecutionFailure,
                   fmt::format("[!] Execution of {} failed with exitcode {}.\n{}\n{}\n{}\n{}", command,
                               format_exit_code(exit_code), OUTPUT_DIVIDER_STDOUT, decode_or_escape(stdout_bytes),
                               OUTPUT_DIVIDER_STDERR, decode_or_escape(stderr_bytes))}
    , command_{std::move(command)}
    , exit_code_{exit_code}
    , stdout_{std::move(stdout_bytes)}
    , stderr_{std::move(stderr_bytes)} {}

WrongOutputError::WrongOutputError(std::string output)
    : ValidationError{ErrorKind::WrongOutput, fmt::format("[!] Wrong output: {}", decode_or_escape(output))}
    , output_{std::move(output)} {}

} // namespace refcheck
