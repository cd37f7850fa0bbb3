#include "process/subprocess.hpp"

#include "common/interrupt.hpp"

#include <refcheck/common/expected.hpp>
#include <refcheck/common/linux.hpp>
#include <refcheck/exceptions.hpp>
#include <refcheck/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace refcheck {

namespace {

using namespace std::chrono_literals;

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;
constexpr std::size_t WRITE_CHUNK_SIZE = 64 * 1024;
constexpr auto WAIT_POLL_INTERVAL = 5ms;

constexpr int EXEC_FAILURE_EXIT_CODE = 127;

// poll(2) takes an int; we add 1 to it below
constexpr std::chrono::milliseconds MAX_POLL_TIMEOUT{std::numeric_limits<int>::max() - 1};

/// ``now + timeout``, saturating at the clock's maximum instead of overflowing
std::chrono::steady_clock::time_point deadline_after(std::chrono::seconds timeout) {
    using Clock = std::chrono::steady_clock;

    const auto now = Clock::now();

    if (timeout >= std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now)) {
        return Clock::time_point::max();
    }

    return now + timeout;
}

template <typename T>
T check_io(Expected<T> res, const Command& command, std::string_view what) {
    if (!res) {
        throw HarnessError(
            fmt::format("[!] Failed to {} for {}: {}", what, command.to_string(), res.error().message()));
    }

    return std::move(res.value());
}

void check_io(Expected<> res, const Command& command, std::string_view what) {
    if (!res) {
        throw HarnessError(
            fmt::format("[!] Failed to {} for {}: {}", what, command.to_string(), res.error().message()));
    }
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }

    UNREACHABLE("waitpid reported a state change that is neither an exit nor a signal death", status);
}

/// Send the child's errno to the parent and leave. Only ever called in the child.
[[noreturn]] void report_exec_failure(int error_fd, int err) {
    std::ignore =
        linux::write(error_fd, std::string_view{reinterpret_cast<const char*>(&err), sizeof(err)}); // NOLINT
    ::_exit(EXEC_FAILURE_EXIT_CODE);
}

} // namespace

HarnessError make_exec_error(const std::string& exec, int err) {
    switch (err) {
    case EACCES:
        return HarnessError(fmt::format(
            "[!] Permission denied while executing {0}. Is the executable bit set (chmod +x {0})?", exec));
    case ENOEXEC:
        return HarnessError(fmt::format("[!] {} is not a valid executable. Does the script start with a shebang "
                                        "line (e.g. #!/bin/sh)?",
                                        exec));
    case ENOENT:
        return HarnessError(fmt::format("[!] Command not found: {}", exec));
    default:
        return HarnessError(fmt::format("[!] Failed to execute {}: {}", exec, get_err_msg(err)));
    }
}

Subprocess::Subprocess(const Command& command)
    : command_{command} {}

Subprocess::~Subprocess() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);

    for (int& fd : child_only_fds_) {
        close_fd(fd);
    }

    kill_and_reap();
}

void Subprocess::start() {
    StreamSetup in = setup_stdin();
    StreamSetup out = setup_output(command_.get_options().stdout_policy);
    StreamSetup err = setup_output(command_.get_options().stderr_policy);

    stdin_fd_ = in.parent_fd;
    stdout_fd_ = out.parent_fd;
    stderr_fd_ = err.parent_fd;

    // The write end is closed by a successful exec, so EOF without data means the exec went through
    linux::Pipe error_pipe = check_io(linux::pipe2(O_CLOEXEC), command_, "create the exec status pipe");
    auto close_error_read = gsl::finally([fd = error_pipe.read_fd] { std::ignore = linux::close(fd); });

    linux::Fork fork_res = check_io(linux::fork(), command_, "fork");

    if (fork_res.which == linux::Fork::Child) {
        exec_child(in, out, err, error_pipe.write_fd);
    }

    child_pid_ = fork_res.pid;
    std::ignore = linux::close(error_pipe.write_fd);

    for (int& fd : child_only_fds_) {
        close_fd(fd);
    }
    child_only_fds_.clear();

    std::string status;
    while (status.size() < sizeof(int)) {
        auto chunk = linux::read(error_pipe.read_fd, sizeof(int) - status.size());

        if (!chunk && chunk.error() == std::errc::interrupted) {
            continue;
        }

        if (!chunk || chunk->empty()) {
            break;
        }

        status += *chunk;
    }

    if (status.size() == sizeof(int)) {
        int exec_errno = 0;
        std::memcpy(&exec_errno, status.data(), sizeof(exec_errno));

        kill_and_reap();

        LOG_DEBUG("exec of {:?} failed in child: {}", command_.get_args().front(), get_err_msg(exec_errno));

        throw make_exec_error(command_.get_args().front(), exec_errno);
    }

    for (int fd : {stdin_fd_, stdout_fd_, stderr_fd_}) {
        if (fd == -1) {
            continue;
        }

        int pre_flags = check_io(linux::fcntl(fd, F_GETFL, 0), command_, "query pipe flags");
        check_io(linux::fcntl(fd, F_SETFL, pre_flags | O_NONBLOCK), command_, "make pipe non-blocking"); // NOLINT
    }

    LOG_DEBUG("Started {:?} as pid {}", command_.to_string(), child_pid_);
}

Subprocess::StreamSetup Subprocess::setup_stdin() {
    const ExecOptions& opts = command_.get_options();

    if (opts.input) {
        linux::Pipe pipe = check_io(linux::pipe2(O_CLOEXEC), command_, "create stdin pipe");
        child_only_fds_.push_back(pipe.read_fd);
        pending_input_ = *opts.input;

        return {.child_fd = pipe.read_fd, .parent_fd = pipe.write_fd};
    }

    if (opts.stdin_policy == StdinPolicy::Inherit) {
        return {};
    }

    int null_fd = check_io(linux::open("/dev/null", O_RDONLY | O_CLOEXEC), command_, "open /dev/null"); // NOLINT
    child_only_fds_.push_back(null_fd);

    return {.child_fd = null_fd, .parent_fd = -1};
}

Subprocess::StreamSetup Subprocess::setup_output(StreamPolicy policy) {
    switch (policy) {
    case StreamPolicy::Capture: {
        linux::Pipe pipe = check_io(linux::pipe2(O_CLOEXEC), command_, "create output pipe");
        child_only_fds_.push_back(pipe.write_fd);

        return {.child_fd = pipe.write_fd, .parent_fd = pipe.read_fd};
    }
    case StreamPolicy::Null: {
        int null_fd = check_io(linux::open("/dev/null", O_WRONLY | O_CLOEXEC), command_, "open /dev/null"); // NOLINT
        child_only_fds_.push_back(null_fd);

        return {.child_fd = null_fd, .parent_fd = -1};
    }
    case StreamPolicy::Inherit:
    case StreamPolicy::ToStdout:
        return {};
    }

    UNREACHABLE("Unknown stream policy");
}

void Subprocess::exec_child(const StreamSetup& in, const StreamSetup& out, const StreamSetup& err,
                            int error_fd) const {
    // Ignored dispositions survive execve, and the worker ignores SIGPIPE
    std::ignore = linux::sigaction(SIGPIPE, SIG_DFL);
    std::ignore = linux::sigaction(SIGINT, SIG_DFL);

    const std::array<std::pair<StreamSetup, int>, 3> redirections{
        {{in, STDIN_FILENO}, {out, STDOUT_FILENO}, {err, STDERR_FILENO}}};

    for (const auto& [setup, target] : redirections) {
        if (setup.child_fd == -1) {
            continue;
        }

        if (auto res = linux::dup2(setup.child_fd, target); !res) {
            report_exec_failure(error_fd, res.error().value());
        }
    }

    if (command_.get_options().stderr_policy == StreamPolicy::ToStdout) {
        if (auto res = linux::dup2(STDOUT_FILENO, STDERR_FILENO); !res) {
            report_exec_failure(error_fd, res.error().value());
        }
    }

    // Same search semantics as execvp(3): keep looking after ENOENT/ENOTDIR/EACCES,
    // and report EACCES if any candidate existed but was not executable
    bool saw_eacces = false;
    std::error_code last_err;

    for (const std::string& candidate : command_.get_exec_candidates()) {
        last_err = linux::execve(candidate, command_.get_args(), command_.get_envp());

        if (last_err == std::errc::permission_denied) {
            saw_eacces = true;
        } else if (last_err != std::errc::no_such_file_or_directory && last_err != std::errc::not_a_directory) {
            break;
        }
    }

    if (saw_eacces && (last_err == std::errc::no_such_file_or_directory || last_err == std::errc::not_a_directory)) {
        report_exec_failure(error_fd, EACCES);
    }

    report_exec_failure(error_fd, last_err ? last_err.value() : ENOENT);
}

CommandResult Subprocess::communicate() {
    ASSERT(child_pid_ != 0, "communicate() called before start()");

    const auto deadline = deadline_after(command_.get_options().timeout);

    pump_streams(deadline);
    int exit_code = wait_for_exit(deadline);

    LOG_DEBUG("{:?} exited with {} ({} bytes stdout, {} bytes stderr)", command_.to_string(),
              format_exit_code(exit_code), stdout_buffer_.size(), stderr_buffer_.size());

    return {.exit_code = exit_code, .stdout_bytes = std::move(stdout_buffer_), .stderr_bytes = std::move(stderr_buffer_)};
}

void Subprocess::pump_streams(Clock::time_point deadline) {
    auto drain = [this](int& fd, std::string& buffer) {
        auto chunk = linux::read(fd, READ_CHUNK_SIZE);

        if (!chunk) {
            if (chunk.error() != std::errc::interrupted && chunk.error() != std::errc::resource_unavailable_try_again) {
                close_fd(fd);
            }
            return;
        }

        // EOF
        if (chunk->empty()) {
            close_fd(fd);
            return;
        }

        buffer += *chunk;
    };

    auto feed = [this] {
        if (pending_input_.empty()) {
            close_fd(stdin_fd_);
            return;
        }

        auto written = linux::write(stdin_fd_, pending_input_.substr(0, WRITE_CHUNK_SIZE));

        if (!written) {
            if (written.error() != std::errc::interrupted &&
                written.error() != std::errc::resource_unavailable_try_again) {
                // Most likely EPIPE: the child is not reading its input (anymore)
                LOG_DEBUG("Giving up on feeding input to {:?}: {}", command_.to_string(), written.error().message());
                close_fd(stdin_fd_);
            }
            return;
        }

        pending_input_.remove_prefix(*written);

        if (pending_input_.empty()) {
            close_fd(stdin_fd_);
        }
    };

    while (stdin_fd_ != -1 || stdout_fd_ != -1 || stderr_fd_ != -1) {
        if (interrupt_requested()) {
            abort_with_interrupt();
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());

        if (remaining <= 0ms) {
            abort_with_timeout();
        }

        remaining = std::min(remaining, MAX_POLL_TIMEOUT);

        std::vector<pollfd> fds;
        if (stdin_fd_ != -1) {
            fds.push_back({.fd = stdin_fd_, .events = POLLOUT, .revents = 0});
        }
        if (stdout_fd_ != -1) {
            fds.push_back({.fd = stdout_fd_, .events = POLLIN, .revents = 0});
        }
        if (stderr_fd_ != -1) {
            fds.push_back({.fd = stderr_fd_, .events = POLLIN, .revents = 0});
        }

        // +1 so that we don't spin on sub-millisecond remainders
        auto poll_res = linux::poll(fds, gsl::narrow_cast<int>(remaining.count()) + 1);

        if (!poll_res) {
            if (poll_res.error() == std::errc::interrupted) {
                continue;
            }

            throw HarnessError(fmt::format("[!] Failed to wait for output of {}: {}", command_.to_string(),
                                           poll_res.error().message()));
        }

        for (const pollfd& pfd : fds) {
            if (pfd.revents == 0) {
                continue;
            }

            if (pfd.fd == stdin_fd_) {
                feed();
            } else if (pfd.fd == stdout_fd_) {
                drain(stdout_fd_, stdout_buffer_);
            } else if (pfd.fd == stderr_fd_) {
                drain(stderr_fd_, stderr_buffer_);
            }
        }
    }
}

int Subprocess::wait_for_exit(Clock::time_point deadline) {
    while (true) {
        auto res = linux::waitpid(child_pid_, WNOHANG);

        if (!res) {
            if (res.error() == std::errc::interrupted) {
                continue;
            }

            throw HarnessError(
                fmt::format("[!] Failed to wait for {}: {}", command_.to_string(), res.error().message()));
        }

        if (res->pid == child_pid_) {
            reaped_ = true;
            return decode_wait_status(res->status);
        }

        if (interrupt_requested()) {
            abort_with_interrupt();
        }

        if (Clock::now() >= deadline) {
            abort_with_timeout();
        }

        std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
    }
}

void Subprocess::kill_and_reap() noexcept {
    if (child_pid_ == 0 || reaped_) {
        return;
    }

    std::ignore = linux::kill(child_pid_, SIGKILL);

    while (true) {
        auto res = linux::waitpid(child_pid_);

        if (res || res.error() != std::errc::interrupted) {
            break;
        }
    }

    reaped_ = true;
}

void Subprocess::abort_with_timeout() {
    LOG_DEBUG("{:?} ran into its timeout; killing pid {}", command_.to_string(), child_pid_);

    kill_and_reap();

    throw TimeoutError(command_.to_string(), command_.get_options().timeout);
}

void Subprocess::abort_with_interrupt() {
    LOG_DEBUG("Interrupted while waiting on {:?}; killing pid {}", command_.to_string(), child_pid_);

    kill_and_reap();

    throw UserInterrupt{};
}

void Subprocess::close_fd(int& fd) noexcept {
    if (fd != -1) {
        std::ignore = linux::close(fd);
        fd = -1;
    }
}

} // namespace refcheck
