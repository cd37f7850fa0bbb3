#pragma once

#include <refcheck/privilege/credentials.hpp>
#include <refcheck/process/user_environment.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace refcheck {

/// One element of an argument vector.
///
/// Accepts text, raw bytes and paths; everything ends up as the POSIX string handed to execve.
class CommandArg
{
public:
    CommandArg(std::string str) // NOLINT(*-explicit-*)
        : value_{std::move(str)} {}

    CommandArg(std::string_view str) // NOLINT(*-explicit-*)
        : value_{str} {}

    CommandArg(const char* str) // NOLINT(*-explicit-*)
        : value_{str} {}

    CommandArg(const std::filesystem::path& path) // NOLINT(*-explicit-*)
        : value_{path.generic_string()} {}

    static CommandArg from_bytes(std::span<const std::byte> bytes) {
        return CommandArg{std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()}}; // NOLINT
    }

    const std::string& str() const noexcept { return value_; }

private:
    std::string value_;
};

using CommandArgs = std::vector<CommandArg>;

/// What a command's stdin is connected to when no input bytes are given
enum class StdinPolicy {
    Null,   ///< /dev/null
    Inherit ///< the harness' own stdin
};

/// What a command's stdout/stderr is connected to
enum class StreamPolicy {
    Capture,  ///< collected into the CommandResult
    Inherit,  ///< the harness' own stream
    Null,     ///< /dev/null
    ToStdout, ///< stderr only: merged into whatever stdout is connected to
};

struct CommandResult
{
    /// Negative values are the negated number of the signal that terminated the process
    int exit_code;
    std::string stdout_bytes;
    std::string stderr_bytes;

    bool terminated_by_signal() const noexcept { return exit_code < 0; }

    bool operator==(const CommandResult& rhs) const = default;
};

/// Overrides for a single command execution. Every field has the harness default.
struct ExecOptions
{
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{10};

    std::chrono::seconds timeout = DEFAULT_TIMEOUT;

    /// Environment of the command. Defaults to the user-environment snapshot at
    /// ``environ_path``, with ``_`` set to the command name.
    std::optional<Environment> env = std::nullopt;
    std::filesystem::path environ_path = DEFAULT_ENVIRON_PATH;

    /// Bytes fed to the command's stdin. Takes precedence over ``stdin_policy``.
    std::optional<std::string> input = std::nullopt;
    StdinPolicy stdin_policy = StdinPolicy::Null;
    StreamPolicy stdout_policy = StreamPolicy::Capture;
    StreamPolicy stderr_policy = StreamPolicy::Capture;

    /// Raise ExecutionError if the command is terminated by a signal.
    /// Unset means the default of the function the options are passed to (off for ``execute``).
    std::optional<bool> check_signal = std::nullopt;
    /// Raise ExecutionError if the command exits with a non-zero code. Unset means the default,
    /// as for ``check_signal``.
    std::optional<bool> check_exit_code = std::nullopt;

    /// Identity the command runs as
    Credentials credentials{};
};

/// A validated invocation, ready to be spawned.
///
/// Building one normalizes the arguments, rejects anything that execve cannot represent
/// and resolves the environment and the executable search path.
class Command
{
public:
    /// Throws ``ValidationError`` for an empty argument vector, embedded null bytes or bad
    /// stream policies; ``HarnessError`` if the environment snapshot cannot be loaded.
    static Command build(const CommandArgs& args, const ExecOptions& opts);

    const std::vector<std::string>& get_args() const noexcept { return args_; }

    /// ``KEY=VALUE`` strings, as handed to execve
    const std::vector<std::string>& get_envp() const noexcept { return envp_; }

    /// Paths to try execve on, in order
    const std::vector<std::string>& get_exec_candidates() const noexcept { return exec_candidates_; }

    const ExecOptions& get_options() const noexcept { return opts_; }

    /// The arguments joined by spaces, for messages
    std::string to_string() const;

private:
    Command() = default;

    std::vector<std::string> args_;
    std::vector<std::string> envp_;
    std::vector<std::string> exec_candidates_;
    ExecOptions opts_;
};

/// Throws ``ValidationError`` for the first argument that contains a null byte,
/// naming the argument and the byte offset
void validate_args(std::span<const std::string> args);

/// Space-separated rendering of an argument vector
std::string join_args(std::span<const std::string> args);

} // namespace refcheck
