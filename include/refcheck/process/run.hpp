#pragma once

#include <refcheck/process/command.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace refcheck {

/// Run a command to completion in a worker dropped to ``opts.credentials``.
///
/// Building the command happens in the caller, so validation errors are raised before
/// anything is spawned. Everything else (exec failures, timeouts, signal and exit-code checks)
/// happens in the worker and is re-thrown here.
///
/// ``check_signal`` and ``check_exit_code`` default to off.
CommandResult execute(const CommandArgs& args, const ExecOptions& opts = {});

/// Run a command with stderr merged into stdout. Returns ``(exit_code, output)``.
///
/// ``check_signal`` defaults to on.
std::pair<int, std::string> run_capture_output(const CommandArgs& args, ExecOptions opts = {});

/// Run a helper program whose output is used as input for a later step.
/// Returns ``(exit_code, output)``, stderr merged into stdout.
///
/// ``check_signal`` and ``check_exit_code`` default to on. With ``verbose``, announces what is
/// being run.
std::pair<int, std::string> get_payload_from_executable(const CommandArgs& args, ExecOptions opts = {},
                                                        bool verbose = true);

/// Feed ``input`` to a command and, if ``marker`` is given, require it in the output.
/// Returns ``(exit_code, output)``, stderr merged into stdout.
///
/// Throws ``WrongOutputError`` if the marker is missing. ``check_signal`` defaults to on,
/// ``check_exit_code`` to off.
std::pair<int, std::string> run_with_payload(const CommandArgs& args, std::optional<std::string> input = std::nullopt,
                                             std::optional<std::string_view> marker = std::nullopt,
                                             ExecOptions opts = {});

/// Run a command with stderr merged into stdout. Returns the output with surrounding
/// whitespace trimmed.
///
/// A timeout or a failing command (see ``check_exit_code``) is reported on the console and
/// yields ``std::nullopt`` instead of an exception.
std::optional<std::string> run_output(const CommandArgs& args, ExecOptions opts = {});

/// Run the arguments, joined by spaces, through ``/bin/sh -c``. Returns the output with
/// surrounding whitespace trimmed and stderr merged into stdout.
///
/// Failures are handled as in ``run_output``.
std::optional<std::string> run_shell(const CommandArgs& args, ExecOptions opts = {});

} // namespace refcheck
