#pragma once

#include <refcheck/common/expected.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace refcheck {

using Environment = std::map<std::string, std::string>;

/// Where the trusted setup step dumps the environment of the user whose submission is graded
inline constexpr std::string_view DEFAULT_ENVIRON_PATH = "/tmp/.user_environ";

/// Reads a user-environment snapshot: null-delimited ``KEY=VALUE`` entries.
///
/// Malformed entries (no ``=``, or an empty key) are logged and skipped; only failing to
/// read the file at all is an error.
class UserEnvironmentReader
{
public:
    explicit UserEnvironmentReader(std::filesystem::path path);

    Expected<Environment, std::string> read() const;

    /// Parse the raw contents of a snapshot
    static Environment parse(std::string_view contents);

private:
    std::filesystem::path path_;
};

} // namespace refcheck
