#pragma once

#include <refcheck/common/class_traits.hpp>
#include <refcheck/common/linux.hpp>
#include <refcheck/exceptions.hpp>
#include <refcheck/process/command.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace refcheck {

/// A child process spawned from a built ``Command``, with its standard streams wired
/// according to the command's policies.
///
/// Owns the child: a still-running child is killed and reaped on destruction.
class Subprocess : NonMovable
{
public:
    explicit Subprocess(const Command& command);
    ~Subprocess();

    /// Fork and exec the command.
    /// Throws ``HarnessError`` (with a hint where one applies) if the command cannot be executed.
    void start();

    /// Feed the input, drain the captured streams and wait for the child to exit.
    ///
    /// Throws ``TimeoutError`` once the command's timeout has elapsed, and ``UserInterrupt`` if
    /// SIGINT arrives while waiting. In both cases the child is killed and reaped first.
    CommandResult communicate();

private:
    using Clock = std::chrono::steady_clock;

    struct StreamSetup
    {
        int child_fd = -1;  // dup2'd over the standard stream in the child; -1 to leave it alone
        int parent_fd = -1; // end kept by the parent; -1 if nothing is kept
    };

    StreamSetup setup_stdin();
    StreamSetup setup_output(StreamPolicy policy);

    [[noreturn]] void exec_child(const StreamSetup& in, const StreamSetup& out, const StreamSetup& err,
                                 int error_fd) const;

    void pump_streams(Clock::time_point deadline);
    int wait_for_exit(Clock::time_point deadline);

    /// SIGKILL + reap; used on timeout, interrupt and destruction
    void kill_and_reap() noexcept;

    [[noreturn]] void abort_with_timeout();
    [[noreturn]] void abort_with_interrupt();

    void close_fd(int& fd) noexcept;

    const Command& command_;

    pid_t child_pid_ = 0;
    bool reaped_ = false;

    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::string_view pending_input_;

    std::string stdout_buffer_;
    std::string stderr_buffer_;

    /// fds opened for the child only (/dev/null, pipe ends); closed in the parent after fork
    std::vector<int> child_only_fds_;
};

/// Turns the errno reported by a failed exec into a harness error with an actionable message
HarnessError make_exec_error(const std::string& exec, int err);

} // namespace refcheck
