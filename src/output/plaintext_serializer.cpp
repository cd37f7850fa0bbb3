#include "output/plaintext_serializer.hpp"

#include "output/serializer.hpp"
#include "output/sink.hpp"

#include <refcheck/grading_session.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace refcheck {

PlainTextSerializer::PlainTextSerializer(Sink& sink, bool colorize)
    : Serializer{sink}
    , do_colorize_{colorize} {}

void PlainTextSerializer::on_run_begin(std::size_t num_groups) {
    num_groups_ = num_groups;

    write_line("[+] Running tests..", SUCCESS_STYLE);
}

void PlainTextSerializer::on_group_begin(std::string_view group) {
    if (num_groups_ > 1) {
        write_line(fmt::format("[+] Running group {}..", group), SUCCESS_STYLE);
    }
}

void PlainTextSerializer::on_environment_begin() {
    write_line("[+] Testing environment..", SUCCESS_STYLE);
}

void PlainTextSerializer::on_environment_check(std::size_t index, std::size_t total) {
    write_line(fmt::format("[+] Environment test {} of {}", index, total), SUCCESS_STYLE);
}

void PlainTextSerializer::on_environment_passed() {
    // Extra newline to separate the environment tests from the submission test
    write_line("[+] Environment tests passed :-)\n", SUCCESS_STYLE);
}

void PlainTextSerializer::on_submission_begin() {
    write_line("[+] Testing submission...", SUCCESS_STYLE);
}

void PlainTextSerializer::on_group_result(const GroupReport& report) {
    if (report.score) {
        write_line(fmt::format("[+] Score of {}: {}", report.name, *report.score),
                   report.success ? SUCCESS_STYLE : ERROR_STYLE);
    }
}

void PlainTextSerializer::on_run_result(const RunResult& result) {
    if (result.success()) {
        return;
    }

    if (num_groups_ > 1) {
        for (const GroupReport& report : result.groups) {
            if (!report.success) {
                write_line(fmt::format("[!] Tests of group {} failed", report.name), ERROR_STYLE);
            }
        }
    }

    write_line("[!] Some tests failed! Please review your submission to avoid penalties during grading.", ERROR_STYLE);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    write_line(what, WARNING_STYLE);
}

void PlainTextSerializer::on_error(std::string_view what) {
    write_line(what, ERROR_STYLE);
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

void PlainTextSerializer::write_line(std::string_view line, fmt::text_style style) {
    if (do_colorize_) {
        sink_.write(fmt::format(style, "{}", line));
    } else {
        sink_.write(line);
    }

    sink_.write("\n");
    // Output of the commands run by checks goes straight to the terminal, so keep ordering intact
    sink_.flush();
}

} // namespace refcheck
