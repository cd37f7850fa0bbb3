#include <refcheck/process/command.hpp>

#include <refcheck/exceptions.hpp>
#include <refcheck/logging.hpp>
#include <refcheck/process/user_environment.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/transform.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace refcheck {

namespace {

constexpr std::string_view DEFAULT_SEARCH_PATH = "/usr/local/bin:/usr/bin:/bin";

/// Mirrors execvp(3): a name with a slash is used verbatim, anything else is looked up in PATH
std::vector<std::string> resolve_exec_candidates(const std::string& name, const Environment& env) {
    if (name.find('/') != std::string::npos) {
        return {name};
    }

    std::string_view search_path = DEFAULT_SEARCH_PATH;
    if (auto iter = env.find("PATH"); iter != env.end()) {
        search_path = iter->second;
    }

    std::vector<std::string> candidates;

    for (std::string dir : search_path | ranges::views::split(':') | ranges::to<std::vector<std::string>>) {
        // An empty PATH element means the current directory
        if (dir.empty()) {
            dir = ".";
        }
        candidates.push_back((std::filesystem::path{dir} / name).string());
    }

    return candidates;
}

void validate_environment(const Environment& env) {
    for (const auto& [key, value] : env) {
        if (key.find('\0') != std::string::npos || value.find('\0') != std::string::npos) {
            throw ValidationError(fmt::format("[!] Environment entry {:?} contains a null byte", key));
        }
    }
}

} // namespace

void validate_args(std::span<const std::string> args) {
    for (const std::string& arg : args) {
        if (auto offset = arg.find('\0'); offset != std::string::npos) {
            throw ValidationError(fmt::format("[!] Argument {:?} contains a null byte at offset {}", arg, offset));
        }
    }
}

std::string join_args(std::span<const std::string> args) {
    return fmt::format("{}", fmt::join(args, " "));
}

Command Command::build(const CommandArgs& args, const ExecOptions& opts) {
    if (args.empty()) {
        throw ValidationError("[!] Cannot execute an empty command");
    }

    if (opts.stdout_policy == StreamPolicy::ToStdout) {
        throw ValidationError("[!] stdout cannot be redirected to itself");
    }

    Command command;
    command.opts_ = opts;
    command.args_ = args | ranges::views::transform(&CommandArg::str) | ranges::to<std::vector<std::string>>;

    validate_args(command.args_);

    Environment env;

    if (opts.env) {
        env = *opts.env;
    } else {
        auto snapshot = UserEnvironmentReader{opts.environ_path}.read();

        if (!snapshot) {
            throw HarnessError(fmt::format("[!] Failed to load the user environment: {}", snapshot.error()));
        }

        env = std::move(*snapshot);
        env.insert_or_assign("_", command.args_.front());
    }

    validate_environment(env);

    command.envp_ = env | ranges::views::transform([](const auto& entry) {
                        return fmt::format("{}={}", entry.first, entry.second);
                    }) |
                    ranges::to<std::vector<std::string>>;

    command.exec_candidates_ = resolve_exec_candidates(command.args_.front(), env);

    LOG_DEBUG("Built command {:?} (candidates: {})", command.to_string(), command.exec_candidates_);

    return command;
}

std::string Command::to_string() const {
    return join_args(args_);
}

} // namespace refcheck
