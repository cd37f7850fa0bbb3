#include <refcheck/output/console.hpp>

#include "common/terminal_checks.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <string_view>

namespace refcheck {

namespace {

std::atomic<ColorMode> color_mode{ColorMode::Auto}; // NOLINT(*-avoid-non-const-global-variables)

constexpr auto OK_STYLE = fmt::fg(fmt::terminal_color::green);
constexpr auto WARN_STYLE = fmt::fg(fmt::terminal_color::yellow);
constexpr auto ERR_STYLE = fmt::fg(fmt::terminal_color::red);

void print_styled(std::string_view msg, fmt::text_style style) {
    if (console_colorized()) {
        fmt::print(stdout, style, "{}\n", msg);
    } else {
        fmt::print(stdout, "{}\n", msg);
    }

    std::fflush(stdout);
}

} // namespace

void set_color_mode(ColorMode mode) noexcept {
    color_mode = mode;
}

bool console_colorized() noexcept {
    switch (color_mode.load()) {
    case ColorMode::Never:
        return false;
    case ColorMode::Always:
        return true;
    case ColorMode::Auto:
        return in_terminal(stdout) && is_color_terminal();
    }

    return false;
}

void print_ok(std::string_view msg) {
    print_styled(msg, OK_STYLE);
}

void print_warn(std::string_view msg) {
    print_styled(msg, WARN_STYLE);
}

void print_err(std::string_view msg) {
    print_styled(msg, ERR_STYLE);
}

} // namespace refcheck
