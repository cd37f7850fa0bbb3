#pragma once

#include <refcheck/common/error_types.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>

namespace refcheck {

/// Base class of all errors raised on purpose by the harness.
///
/// Lets the orchestration layer tell errors it raised deliberately apart from
/// unexpected ones, and lets the global handler print only the message for the former.
class ClassifiedError : public std::runtime_error
{
public:
    ClassifiedError(ErrorKind kind, const std::string& msg)
        : std::runtime_error{msg}
        , kind_{kind} {}

    ErrorKind get_kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// Errors that a submission check may raise and that only fail the check's group
class HarnessError : public ClassifiedError
{
public:
    explicit HarnessError(const std::string& msg)
        : ClassifiedError{ErrorKind::Harness, msg} {}

protected:
    HarnessError(ErrorKind kind, const std::string& msg)
        : ClassifiedError{kind, msg} {}
};

class TimeoutError : public HarnessError
{
public:
    TimeoutError(std::string command, std::chrono::seconds timeout);

    const std::string& get_command() const noexcept { return command_; }

    std::chrono::seconds get_timeout() const noexcept { return timeout_; }

private:
    std::string command_;
    std::chrono::seconds timeout_;
};

/// A command was terminated by a signal, or exited non-zero when that was checked for
class ExecutionError : public HarnessError
{
public:
    ExecutionError(std::string command, int exit_code, std::string stdout_bytes, std::string stderr_bytes);

    const std::string& get_command() const noexcept { return command_; }

    /// Negative values are the negated number of the signal that terminated the process
    int get_exit_code() const noexcept { return exit_code_; }

    const std::string& get_stdout() const noexcept { return stdout_; }

    const std::string& get_stderr() const noexcept { return stderr_; }

private:
    std::string command_;
    int exit_code_;
    std::string stdout_;
    std::string stderr_;
};

class ValidationError : public HarnessError
{
public:
    explicit ValidationError(const std::string& msg)
        : HarnessError{ErrorKind::Validation, msg} {}

protected:
    ValidationError(ErrorKind kind, const std::string& msg)
        : HarnessError{kind, msg} {}
};

/// A required marker was absent from a command's output
class WrongOutputError : public ValidationError
{
public:
    explicit WrongOutputError(std::string output);

    const std::string& get_output() const noexcept { return output_; }

private:
    std::string output_;
};

/// Misuse of the registration surface. Always fatal.
class ConfigurationError : public ClassifiedError
{
public:
    explicit ConfigurationError(const std::string& msg)
        : ClassifiedError{ErrorKind::Configuration, msg} {}
};

/// Something that should never happen did: a rejected channel payload, a worker that died
/// without reporting. Possibly security relevant, so it is always surfaced and never absorbed.
class InternalFailure : public ClassifiedError
{
public:
    explicit InternalFailure(const std::string& msg)
        : ClassifiedError{ErrorKind::Internal, msg} {}
};

/// An unclassified exception escaped the operation run inside a worker.
/// Only its message survives the trip back to the caller.
class WorkerError : public ClassifiedError
{
public:
    explicit WorkerError(const std::string& msg)
        : ClassifiedError{ErrorKind::Unexpected, msg} {}
};

class UserInterrupt : public ClassifiedError
{
public:
    UserInterrupt()
        : ClassifiedError{ErrorKind::Interrupted, "[-] Keyboard Interrupt"} {}
};

/// Render an exit code the way error messages show it: "1", or "-9 (SIGKILL)" for signal deaths
std::string format_exit_code(int exit_code);

/// Captured process output as text. Printable output is returned as-is,
/// anything with control bytes is escaped so it cannot mess with the terminal.
std::string decode_or_escape(std::string_view bytes);

} // namespace refcheck
