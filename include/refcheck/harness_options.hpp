#pragma once

#include <refcheck/common/expected.hpp>
#include <refcheck/output/console.hpp>
#include <refcheck/privilege/credentials.hpp>
#include <refcheck/process/command.hpp>
#include <refcheck/process/user_environment.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace refcheck {

struct HarnessOptions
{

    // ###### Option fields

    /// Where the record of the run is written
    std::filesystem::path result_path = DEFAULT_RESULT_PATH;

    /// User-environment snapshot used as the default environment of commands
    std::filesystem::path environ_path = DEFAULT_ENVIRON_PATH;

    /// Identity that workers (and the commands they run) drop to
    Credentials drop_credentials{.uid = DEFAULT_UID, .gid = DEFAULT_GID};

    ColorMode color_mode = DEFAULT_COLOR_MODE;

    // ###### Option defaults

    static constexpr std::string_view DEFAULT_RESULT_PATH = "/var/lib/refcheck/test_results.json";
    static constexpr uid_t DEFAULT_UID = Credentials::DEFAULT_UID;
    static constexpr gid_t DEFAULT_GID = Credentials::DEFAULT_GID;
    static constexpr ColorMode DEFAULT_COLOR_MODE = ColorMode::Auto;

    // ###### Environment overrides

    static constexpr const char* ENV_RESULT_PATH = "REFCHECK_RESULT_PATH";
    static constexpr const char* ENV_ENVIRON_PATH = "REFCHECK_ENVIRON_PATH";
    static constexpr const char* ENV_DROP_UID = "REFCHECK_DROP_UID";
    static constexpr const char* ENV_DROP_GID = "REFCHECK_DROP_GID";
    static constexpr const char* ENV_COLOR = "REFCHECK_COLOR";

    /// Defaults, overridden by whichever ``REFCHECK_*`` environment variables are set.
    /// Returns an error naming the variable if one of them cannot be parsed.
    static Expected<HarnessOptions, std::string> from_env();

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const;

    /// Command options that run as ``drop_credentials`` with the environment at ``environ_path``
    ExecOptions make_exec_options() const {
        ExecOptions opts;
        opts.credentials = drop_credentials;
        opts.environ_path = environ_path;
        return opts;
    }
};

} // namespace refcheck
