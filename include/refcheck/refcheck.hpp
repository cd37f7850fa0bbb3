#pragma once

#include <refcheck/checks.hpp>                    // IWYU pragma: export
#include <refcheck/exceptions.hpp>                // IWYU pragma: export
#include <refcheck/grading_session.hpp>           // IWYU pragma: export
#include <refcheck/harness.hpp>                   // IWYU pragma: export
#include <refcheck/harness_options.hpp>           // IWYU pragma: export
#include <refcheck/logging.hpp>                   // IWYU pragma: export
#include <refcheck/output/console.hpp>            // IWYU pragma: export
#include <refcheck/privilege/credentials.hpp>     // IWYU pragma: export
#include <refcheck/privilege/drop.hpp>            // IWYU pragma: export
#include <refcheck/process/command.hpp>           // IWYU pragma: export
#include <refcheck/process/run.hpp>               // IWYU pragma: export
#include <refcheck/registrars/check_registry.hpp> // IWYU pragma: export

#include <fmt/format.h> // IWYU pragma: export

#include <chrono>     // IWYU pragma: export
#include <filesystem> // IWYU pragma: export
#include <optional>   // IWYU pragma: export
#include <string>     // IWYU pragma: export
#include <utility>    // IWYU pragma: export
