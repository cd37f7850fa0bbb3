#include <refcheck/harness.hpp>

#include "app/trace_exception.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/result_file.hpp"
#include "output/stdout_sink.hpp"
#include "test_runner.hpp"

#include <refcheck/exceptions.hpp>
#include <refcheck/grading_session.hpp>
#include <refcheck/harness_options.hpp>
#include <refcheck/logging.hpp>
#include <refcheck/output/console.hpp>
#include <refcheck/registrars/check_registry.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>

namespace refcheck {

RunResult run_tests(const CheckRegistry& registry, const HarnessOptions& options) {
    if (auto valid = options.validate(); !valid) {
        throw ConfigurationError(fmt::format("[!] Invalid harness options: {}", valid.error()));
    }

    set_color_mode(options.color_mode);

    StdoutSink sink;
    auto serializer = std::make_shared<PlainTextSerializer>(sink, console_colorized());

    LOG_DEBUG("Running {} check groups; results go to {}", registry.get_num_groups(), options.result_path.string());

    TestRunner runner{registry, serializer, ResultFile{options.result_path}};

    return runner.run_all();
}

void run_tests_and_exit(const CheckRegistry& registry, const HarnessOptions& options) {
    RunResult result = run_tests(registry, options);

    ExitCode code = result.success() ? ExitCode::Success : ExitCode::TestsFailed;

    std::fflush(nullptr);
    std::exit(static_cast<int>(code));
}

int run_harness(const std::function<void()>& body) {
    init_loggers();

    try {
        body();
        return static_cast<int>(ExitCode::Success);
    } catch (const WorkerError& err) {
        // Unclassified, just thrown in another process
        trace_exception(fmt::format("{} (raised inside a privilege-dropped worker)", err.what()));
    } catch (const ClassifiedError& err) {
        LOG_DEBUG("Harness stopped by {} error", err.get_kind());
        print_err(err.what());
    } catch (const std::exception& err) {
        trace_exception(err);
    } catch (...) {
        trace_exception("<unknown - not derived from std::exception>");
    }

    return static_cast<int>(ExitCode::HarnessFailure);
}

} // namespace refcheck
