#pragma once

#include <refcheck/grading_session.hpp>
#include <refcheck/harness_options.hpp>
#include <refcheck/registrars/check_registry.hpp>

#include <functional>

namespace refcheck {

/// Exit status understood by the grading pipeline
enum class ExitCode : int {
    Success = 0,
    TestsFailed = 1,
    HarnessFailure = 2,
};

/// Run every check of ``registry``, print the summary to stdout and write the result file.
///
/// Throws ``ConfigurationError`` if ``options`` are invalid or a group is misconfigured.
RunResult run_tests(const CheckRegistry& registry, const HarnessOptions& options = {});

/// ``run_tests``, then terminate the process with ``ExitCode::Success`` if all groups passed
/// and ``ExitCode::TestsFailed`` otherwise
[[noreturn]] void run_tests_and_exit(const CheckRegistry& registry, const HarnessOptions& options = {});

/// Global handler for a harness' ``main``. Initializes logging and runs ``body``.
///
/// Classified errors print only their message; anything else, ``WorkerError`` included,
/// prints its message and a stack trace. Returns the exit status for ``main`` to return.
int run_harness(const std::function<void()>& body);

} // namespace refcheck
