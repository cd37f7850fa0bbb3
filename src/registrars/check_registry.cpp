#include <refcheck/registrars/check_registry.hpp>

#include <refcheck/exceptions.hpp>
#include <refcheck/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>

#include <string>
#include <string_view>

namespace refcheck {

CheckGroup& CheckRegistry::find_or_create_group(std::string_view name) {
    auto name_matcher = [name](const CheckGroup& group) { return group.name == name; };

    if (auto iter = ranges::find_if(groups_, name_matcher); iter != groups_.end()) {
        return *iter;
    }

    LOG_DEBUG("Registering check group {:?}", name);

    groups_.push_back(CheckGroup{.name = std::string{name}});

    return groups_.back();
}

void CheckRegistry::ensure_no_gated_check(const CheckGroup& group) {
    if (group.submission_check) {
        throw ConfigurationError(fmt::format("[!] Group {:?} already has a submission check", group.name));
    }

    if (group.extended_submission_check) {
        throw ConfigurationError(fmt::format("[!] Group {:?} already has an extended submission check", group.name));
    }
}

} // namespace refcheck
