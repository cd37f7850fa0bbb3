#include <refcheck/harness_options.hpp>

#include <refcheck/common/enum_names.hpp>
#include <refcheck/common/expected.hpp>
#include <refcheck/output/console.hpp>

#include <boost/lexical_cast.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace refcheck {

namespace {

std::optional<std::string_view> get_env(const char* name) {
    const char* value = std::getenv(name);

    if (value == nullptr) {
        return std::nullopt;
    }

    return value;
}

template <typename T>
Expected<T, std::string> parse_id(const char* name, std::string_view text) {
    // lexical_cast wraps negative numbers around for unsigned types
    if (text.starts_with('-')) {
        return fmt::format("{}={:?} is not a valid id", name, text);
    }

    try {
        return boost::lexical_cast<T>(text);
    } catch (const boost::bad_lexical_cast&) {
        return fmt::format("{}={:?} is not a valid id", name, text);
    }
}

std::string lowercase(std::string_view text) {
    return text | ranges::views::transform([](char chr) {
               return static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
           }) |
           ranges::to<std::string>;
}

/// Colour modes are spelled as their lowercase enumerator names
Expected<ColorMode, std::string> parse_color_mode(const char* name, std::string_view text) {
    auto mode = enum_from_string<ColorMode>(
        text, [](std::string_view enumerator, std::string_view given) { return lowercase(enumerator) == given; });

    if (mode) {
        return *mode;
    }

    auto spellings = enum_names<ColorMode>() | ranges::views::transform(lowercase) | ranges::to<std::vector>;

    return fmt::format("{}={:?} must be one of {}", name, text, fmt::join(spellings, ", "));
}

} // namespace

Expected<HarnessOptions, std::string> HarnessOptions::from_env() {
    HarnessOptions opts;

    if (auto value = get_env(ENV_RESULT_PATH)) {
        opts.result_path = *value;
    }

    if (auto value = get_env(ENV_ENVIRON_PATH)) {
        opts.environ_path = *value;
    }

    if (auto value = get_env(ENV_DROP_UID)) {
        opts.drop_credentials.uid = TRY(parse_id<uid_t>(ENV_DROP_UID, *value));
    }

    if (auto value = get_env(ENV_DROP_GID)) {
        opts.drop_credentials.gid = TRY(parse_id<gid_t>(ENV_DROP_GID, *value));
    }

    if (auto value = get_env(ENV_COLOR)) {
        opts.color_mode = TRY(parse_color_mode(ENV_COLOR, *value));
    }

    return opts;
}

Expected<void, std::string> HarnessOptions::validate() const {
    if (result_path.empty() || !result_path.has_filename()) {
        return fmt::format("Result path {:?} does not name a file", result_path.string());
    }

    if (std::filesystem::is_directory(result_path)) {
        return fmt::format("Result path {:?} is a directory", result_path.string());
    }

    if (environ_path.empty()) {
        return std::string{"Environment snapshot path is empty"};
    }

    // Workers must never keep root
    if (drop_credentials.uid == 0 || drop_credentials.gid == 0) {
        return fmt::format("Refusing to drop privileges to root ({})", drop_credentials);
    }

    return {};
}

} // namespace refcheck
