#pragma once

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <concepts>
#include <exception>
#include <iostream>
#include <string>

namespace refcheck {

/// Print ``exception`` and the stack trace it was thrown from to stderr.
/// Only valid inside a catch block.
template <typename T>
void trace_exception(const T& exception) {
    boost::stacktrace::stacktrace trace = boost::stacktrace::stacktrace::from_current_exception();

    std::string except_str;
    if constexpr (std::derived_from<T, std::exception>) {
        except_str = fmt::format("Unhandled exception: {}", exception.what());
    } else {
        except_str = fmt::format("Unhandled exception: {}", exception);
    }

    fmt::println(std::cerr, "{}", except_str);
    fmt::println(std::cerr, "{}", std::string(except_str.size(), '='));

    std::string stacktrace_str = fmt::to_string(fmt::streamed(trace));
    fmt::println(std::cerr, "Stacktrace:\n{}", stacktrace_str.empty() ? " <unavailable>" : stacktrace_str);
}

} // namespace refcheck
