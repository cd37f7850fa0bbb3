#pragma once

#include <refcheck/common/class_traits.hpp>
#include <refcheck/exceptions.hpp>
#include <refcheck/grading_session.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace refcheck {

/// Group that checks registered without an explicit group end up in
inline constexpr std::string_view DEFAULT_GROUP = "default";

using EnvironmentCheck = std::function<bool()>;
using SubmissionCheck = std::function<CheckOutcome()>;

/// Environment checks gating at most one submission check, evaluated as a unit
struct CheckGroup
{
    std::string name;

    /// In registration order
    std::vector<EnvironmentCheck> environment_checks;

    /// At most one of these is set
    SubmissionCheck submission_check;
    SubmissionCheck extended_submission_check;

    bool has_gated_check() const noexcept {
        return static_cast<bool>(submission_check) || static_cast<bool>(extended_submission_check);
    }

    const SubmissionCheck& get_gated_check() const noexcept {
        return submission_check ? submission_check : extended_submission_check;
    }
};

/// Collects the checks of one harness, grouped by name.
///
/// Populated before the run starts, and only read from afterwards. Every ``add_*`` function
/// returns the callable it was given, so registration can wrap a definition:
///
///     auto check_build = registry.add_environment_check([] { ... return true; });
class CheckRegistry : NonCopyable
{
public:
    /// ``func`` is called with no arguments and must return exactly ``bool``
    template <typename Func>
        requires std::invocable<Func&>
    Func add_environment_check(Func func, std::string_view group = DEFAULT_GROUP);

    /// ``func`` is called with no arguments and must return ``bool`` or ``CheckOutcome``.
    ///
    /// Throws ``ConfigurationError`` if the group already has a (regular or extended) submission check.
    template <typename Func>
        requires std::invocable<Func&>
    Func add_submission_check(Func func, std::string_view group = DEFAULT_GROUP);

    /// Like ``add_submission_check``, for checks that report a score. ``func`` must return ``CheckOutcome``.
    template <typename Func>
        requires std::invocable<Func&>
    Func add_extended_submission_check(Func func, std::string_view group = DEFAULT_GROUP);

    /// In registration order of each group's first check
    const std::vector<CheckGroup>& get_groups() const noexcept { return groups_; }

    std::size_t get_num_groups() const noexcept { return groups_.size(); }

private:
    /// Obtain the group named ``name``, or create a new one if nonexistent
    CheckGroup& find_or_create_group(std::string_view name);

    /// Throws ``ConfigurationError`` if ``group`` already has a gated check
    static void ensure_no_gated_check(const CheckGroup& group);

    std::vector<CheckGroup> groups_;
};

template <typename Func>
    requires std::invocable<Func&>
Func CheckRegistry::add_environment_check(Func func, std::string_view group) {
    static_assert(std::same_as<std::invoke_result_t<Func&>, bool>, "Environment checks must return bool");

    find_or_create_group(group).environment_checks.emplace_back(func);

    return func;
}

template <typename Func>
    requires std::invocable<Func&>
Func CheckRegistry::add_submission_check(Func func, std::string_view group) {
    using ResultT = std::invoke_result_t<Func&>;

    static_assert(std::same_as<ResultT, bool> || std::same_as<ResultT, CheckOutcome>,
                  "Submission checks must return bool or CheckOutcome");

    CheckGroup& target = find_or_create_group(group);
    ensure_no_gated_check(target);

    if constexpr (std::same_as<ResultT, bool>) {
        target.submission_check = [func]() mutable { return CheckOutcome{.success = func(), .score = std::nullopt}; };
    } else {
        target.submission_check = func;
    }

    return func;
}

template <typename Func>
    requires std::invocable<Func&>
Func CheckRegistry::add_extended_submission_check(Func func, std::string_view group) {
    static_assert(std::same_as<std::invoke_result_t<Func&>, CheckOutcome>,
                  "Extended submission checks must return CheckOutcome");

    CheckGroup& target = find_or_create_group(group);
    ensure_no_gated_check(target);

    target.extended_submission_check = func;

    return func;
}

} // namespace refcheck
