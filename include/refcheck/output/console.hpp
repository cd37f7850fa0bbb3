#pragma once

#include <boost/describe/enum.hpp>

#include <string_view>

namespace refcheck {

enum class ColorMode {
    Never,
    Auto, ///< Only when stdout is a colour-capable terminal
    Always,
};

BOOST_DESCRIBE_ENUM(ColorMode, Never, Auto, Always);

/// Colour mode of the ``print_*`` functions. ``Auto`` unless set otherwise.
void set_color_mode(ColorMode mode) noexcept;

/// Whether console output is currently colourised, taking ``ColorMode::Auto`` into account
bool console_colorized() noexcept;

/// Print a line in green; for progress and success messages
void print_ok(std::string_view msg);

/// Print a line in yellow
void print_warn(std::string_view msg);

/// Print a line in red; for failures
void print_err(std::string_view msg);

} // namespace refcheck
