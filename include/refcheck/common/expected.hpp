#pragma once

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <concepts>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace refcheck {

template <typename T = void, typename E = std::error_code>
/**
 * @brief std::variant wrapper for a partial implementation of C++23's expected type
 *
 * @tparam T The expected value type
 * @tparam E The error type
 *
 * Note: types T and E must not be convertible between one another.
 */
class [[nodiscard]] Expected
{
public:
    using ExpectedT = T;
    using ErrT = E;

    constexpr Expected()
        : data_{} {}

    template <typename Tu>
    constexpr Expected(Tu&& value) // NOLINT(*-explicit-*)
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
        : data_{std::in_place_index<0>, std::forward<Tu>(value)} {}

    template <typename Eu>
    constexpr Expected(Eu&& error) // NOLINT(*-explicit-*)
        requires(std::convertible_to<Eu, E> && (std::is_void_v<T> || !std::is_convertible_v<Eu, T>))
        : data_{std::in_place_index<1>, std::forward<Eu>(error)} {}

    constexpr bool has_value() const { return data_.index() == 0; }

    constexpr bool has_error() const { return !has_value(); }

    constexpr explicit operator bool() const { return has_value(); }

    template <typename U = T>
    constexpr U& value()
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr const U& value() const
        requires(!std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
        return std::get<0>(data_);
    }

    template <typename U = T>
    constexpr void value() const
        requires(std::is_void_v<U>)
    {
        DEBUG_ASSERT(has_value());
    }

    template <typename U = T>
    constexpr U& operator*()
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr const U& operator*() const
        requires(!std::is_void_v<U>)
    {
        return value();
    }

    template <typename U = T>
    constexpr U* operator->()
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename U = T>
    constexpr const U* operator->() const
        requires(!std::is_void_v<U>)
    {
        return &value();
    }

    template <typename Tu>
    constexpr T value_or(Tu&& default_value) const
        requires(!std::is_void_v<T> && std::convertible_to<Tu, T>)
    {
        if (!has_value()) {
            return static_cast<T>(std::forward<Tu>(default_value));
        }
        return std::get<0>(data_);
    }

    constexpr const E& error() const {
        DEBUG_ASSERT(!has_value());
        return std::get<1>(data_);
    }

    template <typename Eu>
    constexpr bool operator==(const Eu& rhs) const
        requires(!std::same_as<Eu, Expected> && std::equality_comparable_with<Eu, E>)
    {
        return has_error() && error() == rhs;
    }

private:
    using ValueStorage = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::variant<ValueStorage, E> data_;
};

} // namespace refcheck

template <typename T, typename E>
struct fmt::formatter<::refcheck::Expected<T, E>> : fmt::formatter<std::string_view>
{
    auto format(const ::refcheck::Expected<T, E>& from, fmt::format_context& ctx) const {
        if (!from) {
            if constexpr (fmt::is_formattable<E>::value) {
                return fmt::format_to(ctx.out(), "Error({})", from.error());
            } else {
                return fmt::format_to(ctx.out(), "Error(<unformattable>)");
            }
        }

        if constexpr (std::is_void_v<T>) {
            return fmt::format_to(ctx.out(), "Expected(void)");
        } else if constexpr (fmt::is_formattable<T>::value) {
            return fmt::format_to(ctx.out(), "Expected({})", from.value());
        } else {
            return fmt::format_to(ctx.out(), "Expected(<unformattable>)");
        }
    }
};

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
