#include <refcheck/checks.hpp>

#include <refcheck/logging.hpp>
#include <refcheck/output/console.hpp>
#include <refcheck/process/command.hpp>
#include <refcheck/process/run.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace refcheck {

namespace {

/// ``tool`` followed by the absolute paths of ``files``
CommandArgs with_files(const CommandArgs& tool, const std::vector<std::filesystem::path>& files) {
    CommandArgs args = tool;

    for (const auto& file : files) {
        args.emplace_back(std::filesystem::absolute(file));
    }

    return args;
}

/// Print each line of ``output`` indented, as a warning
void warn_indented(std::string_view output) {
    for (const std::string& line : output | ranges::views::split('\n') | ranges::to<std::vector<std::string>>) {
        print_warn(fmt::format("    {}", line));
    }
}

/// Shared by the linters: silence passes, anything printed fails
bool run_linter(std::string_view name, std::string_view what, const CommandArgs& tool,
                const std::vector<std::filesystem::path>& python_files, ExecOptions opts) {
    if (python_files.empty()) {
        return true;
    }

    std::optional<std::string> output = run_output(with_files(tool, python_files), std::move(opts));

    if (!output) {
        return false;
    }

    if (!output->empty()) {
        print_warn(fmt::format("[!] {}'s {} failed:", name, what));
        warn_indented(*output);
        return false;
    }

    print_ok(fmt::format("[+] {}'s {} passed", name, what));
    return true;
}

} // namespace

bool contains_flag(std::string_view flag, const std::filesystem::path& script, bool silent, ExecOptions opts,
                   const CheckTools& tools) {
    opts.check_exit_code = true;

    std::optional<std::string> output = run_output(with_files(tools.interpreter, {script}), std::move(opts));

    if (!output) {
        return false;
    }

    if (output->find(flag) == std::string::npos) {
        if (!silent) {
            print_err("[!] Failed to find flag");
        }
        return false;
    }

    if (!silent) {
        print_ok("[+] Correct flag found");
    }
    return true;
}

bool run_pylint(const std::vector<std::filesystem::path>& python_files, ExecOptions opts, const CheckTools& tools) {
    return run_linter("pylint", "syntax and coding style checks", tools.pylint, python_files, std::move(opts));
}

bool run_mypy(const std::vector<std::filesystem::path>& python_files, ExecOptions opts, const CheckTools& tools) {
    return run_linter("mypy", "type checks", tools.mypy, python_files, std::move(opts));
}

std::vector<std::filesystem::path> find_python_files(const std::filesystem::path& root) {
    std::vector<std::filesystem::path> found;

    std::error_code err;
    std::filesystem::recursive_directory_iterator iter{
        root, std::filesystem::directory_options::skip_permission_denied, err};

    if (err) {
        LOG_DEBUG("Not searching {} for Python files: {}", root.string(), err.message());
        return found;
    }

    for (; iter != std::filesystem::recursive_directory_iterator{}; iter.increment(err)) {
        if (err) {
            LOG_WARN("Stopped searching {} for Python files: {}", root.string(), err.message());
            break;
        }

        if (!iter->is_regular_file(err)) {
            continue;
        }

        const auto& path = iter->path();

        if (path.extension() == ".py" && !path.filename().string().starts_with('.')) {
            found.push_back(path);
        }
    }

    ranges::sort(found);

    return found;
}

bool check_all_python_files(const std::filesystem::path& root, ExecOptions opts, const CheckTools& tools) {
    std::vector<std::filesystem::path> python_files = find_python_files(root);

    if (python_files.empty()) {
        return true;
    }

    print_ok(fmt::format("[+] Testing {} Python source code files", python_files.size()));

    bool lint_passed = run_pylint(python_files, opts, tools);
    bool types_passed = run_mypy(python_files, std::move(opts), tools);

    return lint_passed && types_passed;
}

} // namespace refcheck
