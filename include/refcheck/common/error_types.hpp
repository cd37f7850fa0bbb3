#pragma once

#include <refcheck/common/enum_names.hpp>

#include <boost/describe/enum.hpp>

#include <optional>
#include <string_view>

namespace refcheck {

/// Every kind of classified error the harness knows how to raise.
///
/// This is also the closed set of error shapes that may cross the worker channel
/// (see `privilege/payload.hpp`); adding an enumerator means teaching the payload codec about it.
enum class ErrorKind {
    Harness,          ///< Generic harness error, e.g. an OS failure translated into an actionable hint
    Timeout,          ///< Command exceeded its deadline
    ExecutionFailure, ///< Command was killed by a signal or exited unsuccessfully
    Validation,       ///< Bad input to the harness, e.g. an embedded null byte in an argument
    WrongOutput,      ///< Expected marker missing from a command's output
    Configuration,    ///< Misuse of the registration surface
    Internal,         ///< Restricted-decode rejection or unexpected channel state
    Interrupted,      ///< User interruption (SIGINT) while waiting on a worker or child
    Unexpected,       ///< Unclassified error raised inside a worker
};

BOOST_DESCRIBE_ENUM(ErrorKind, Harness, Timeout, ExecutionFailure, Validation, WrongOutput, Configuration, Internal,
                    Interrupted, Unexpected);

constexpr std::string_view to_string(ErrorKind kind) {
    return enum_to_string(kind).value_or("<invalid>");
}

/// Inverse of `to_string`; nullopt for anything that is not exactly an enumerator name
constexpr std::optional<ErrorKind> error_kind_from_string(std::string_view name) {
    return enum_from_string<ErrorKind>(name);
}

inline std::string_view format_as(ErrorKind kind) {
    return to_string(kind);
}

} // namespace refcheck
