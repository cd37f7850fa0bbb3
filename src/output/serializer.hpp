#pragma once

#include "output/sink.hpp"

#include <refcheck/common/class_traits.hpp>
#include <refcheck/grading_session.hpp>

#include <cstddef>
#include <string_view>

namespace refcheck {

/// Turns the events of a run into output for the person being graded
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink)
        : sink_{sink} {}

    virtual ~Serializer() = default;

    virtual void on_run_begin(std::size_t num_groups) = 0;
    virtual void on_group_begin(std::string_view group) = 0;

    virtual void on_environment_begin() = 0;
    /// ``index`` is 1-based
    virtual void on_environment_check(std::size_t index, std::size_t total) = 0;
    virtual void on_environment_passed() = 0;

    virtual void on_submission_begin() = 0;

    virtual void on_group_result(const GroupReport& report) = 0;
    virtual void on_run_result(const RunResult& result) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
};

} // namespace refcheck
