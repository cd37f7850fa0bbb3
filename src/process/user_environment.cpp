#include <refcheck/process/user_environment.hpp>

#include <refcheck/common/expected.hpp>
#include <refcheck/logging.hpp>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace refcheck {

UserEnvironmentReader::UserEnvironmentReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<Environment, std::string> UserEnvironmentReader::read() const {
    std::ifstream in_file{path_, std::ios::binary};

    if (not in_file.is_open()) {
        return fmt::format("Failed to open {}", path_.string());
    }

    std::string contents{std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};

    if (in_file.bad()) {
        return fmt::format("IO error in reading {}", path_.string());
    }

    return parse(contents);
}

Environment UserEnvironmentReader::parse(std::string_view contents) {
    Environment result;

    for (std::string entry : contents | ranges::views::split('\0') | ranges::to<std::vector<std::string>>) {
        // Snapshots taken with printenv-like tools leave the line break on the value
        if (entry.ends_with('\n')) {
            entry.pop_back();
        }

        if (entry.empty()) {
            continue;
        }

        auto sep_pos = entry.find('=');

        if (sep_pos == std::string::npos || sep_pos == 0) {
            LOG_WARN("Skipping malformed environment entry {:?}", entry);
            continue;
        }

        result.insert_or_assign(entry.substr(0, sep_pos), entry.substr(sep_pos + 1));
    }

    return result;
}

} // namespace refcheck
