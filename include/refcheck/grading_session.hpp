/// \file
/// Defines data classes to store result data for the current run
#pragma once

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>

#include <optional>
#include <string>
#include <vector>

namespace refcheck {

/// What a submission check reports
struct CheckOutcome
{
    bool success;
    std::optional<double> score;

    bool operator==(const CheckOutcome& rhs) const = default;
};

/// Final state of one group; this is what ends up in the result file
struct GroupReport
{
    std::string name;
    bool success;
    std::optional<double> score;

    bool operator==(const GroupReport& rhs) const = default;
};

struct RunResult
{
    /// In registration order
    std::vector<GroupReport> groups;

    bool success() const {
        return ranges::all_of(groups, [](const GroupReport& report) { return report.success; });
    }
};

} // namespace refcheck

template <>
struct fmt::formatter<::refcheck::GroupReport> : fmt::formatter<std::string_view>
{
    auto format(const ::refcheck::GroupReport& from, fmt::format_context& ctx) const {
        if (from.score) {
            return fmt::format_to(ctx.out(), "{}: {} (score {})", from.name, from.success ? "passed" : "failed",
                                  *from.score);
        }

        return fmt::format_to(ctx.out(), "{}: {}", from.name, from.success ? "passed" : "failed");
    }
};
