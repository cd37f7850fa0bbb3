#pragma once

#include <cstdio>

namespace refcheck {

bool is_color_terminal() noexcept;
bool in_terminal(FILE* file) noexcept;

} // namespace refcheck
