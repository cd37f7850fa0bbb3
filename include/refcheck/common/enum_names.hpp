#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

namespace refcheck {

template <typename Enum>
concept DescribedEnum = std::is_enum_v<Enum> && boost::describe::has_describe_enumerators<Enum>::value;

// See: https://www.boost.org/doc/libs/1_81_0/libs/describe/doc/html/describe.html#example_printing_enums_ct
template <DescribedEnum Enum>
constexpr std::optional<std::string_view> enum_to_string(Enum enumerator) {
    std::optional<std::string_view> res;

    boost::mp11::mp_for_each<boost::describe::describe_enumerators<Enum>>([&](auto descriptor) {
        if (enumerator == descriptor.value) {
            res = descriptor.name;
        }
    });

    return res;
}

/// Inverse of ``enum_to_string``. ``equal(enumerator_name, name)`` decides what matches;
/// by default only the exact enumerator name does.
template <DescribedEnum Enum, typename Equal = std::equal_to<>>
constexpr std::optional<Enum> enum_from_string(std::string_view name, Equal equal = {}) {
    std::optional<Enum> res;

    boost::mp11::mp_for_each<boost::describe::describe_enumerators<Enum>>([&](auto descriptor) {
        if (!res && equal(std::string_view{descriptor.name}, name)) {
            res = descriptor.value;
        }
    });

    return res;
}

/// Enumerator names in declaration order
template <DescribedEnum Enum>
std::vector<std::string_view> enum_names() {
    std::vector<std::string_view> names;

    boost::mp11::mp_for_each<boost::describe::describe_enumerators<Enum>>(
        [&](auto descriptor) { names.emplace_back(descriptor.name); });

    return names;
}

} // namespace refcheck
