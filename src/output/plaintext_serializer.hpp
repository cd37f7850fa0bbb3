#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"

#include <refcheck/grading_session.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace refcheck {

/// The ``[+]``/``[!]`` console messages of the harness, one per line
class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, bool colorize);

    void on_run_begin(std::size_t num_groups) override;
    void on_group_begin(std::string_view group) override;

    void on_environment_begin() override;
    void on_environment_check(std::size_t index, std::size_t total) override;
    void on_environment_passed() override;

    void on_submission_begin() override;

    void on_group_result(const GroupReport& report) override;
    void on_run_result(const RunResult& result) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

private:
    void write_line(std::string_view line, fmt::text_style style);

    // Basic styles for different kinds of output:
    //   error    - failed checks, errors raised by checks
    //   warning  - things the person being graded should look at
    //   success  - progress and passing checks
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::terminal_color::red);
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::terminal_color::yellow);
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::terminal_color::green);

    bool do_colorize_;

    /// Group failures are only called out one by one if there is more than one group
    std::size_t num_groups_ = 0;
};

} // namespace refcheck
