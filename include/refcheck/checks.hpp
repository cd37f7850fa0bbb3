#pragma once

#include <refcheck/process/command.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace refcheck {

/// Where submissions are placed in the task container
inline const std::filesystem::path DEFAULT_SUBMISSION_DIR = "/home/user";

/// Programs the ready-made checks run. The files under test are appended to each.
struct CheckTools
{
    CommandArgs interpreter{"python3"};
    CommandArgs pylint{"pylint", "--exit-zero", "--rcfile", "/etc/pylintrc"};
    CommandArgs mypy{"mypy", "--config-file", "/etc/mypyrc"};
};

/// Run ``script`` with the interpreter and look for ``flag`` in its output.
///
/// The script must exit with 0. Unless ``silent``, the verdict is printed.
bool contains_flag(std::string_view flag, const std::filesystem::path& script, bool silent = false,
                   ExecOptions opts = {}, const CheckTools& tools = {});

/// Lint ``python_files``; any output from the linter is printed as a warning and fails the check.
/// Passes trivially when there is nothing to lint.
bool run_pylint(const std::vector<std::filesystem::path>& python_files, ExecOptions opts = {},
                const CheckTools& tools = {});

/// Type-check ``python_files``, with the same rules as ``run_pylint``
bool run_mypy(const std::vector<std::filesystem::path>& python_files, ExecOptions opts = {},
              const CheckTools& tools = {});

/// ``.py`` files below ``root``, except hidden ones, in path order
std::vector<std::filesystem::path> find_python_files(const std::filesystem::path& root);

/// ``run_pylint`` and ``run_mypy`` on every Python file of the submission. Both always run.
bool check_all_python_files(const std::filesystem::path& root = DEFAULT_SUBMISSION_DIR, ExecOptions opts = {},
                            const CheckTools& tools = {});

} // namespace refcheck
