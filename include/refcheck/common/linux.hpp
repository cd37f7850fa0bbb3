#pragma once

#include <refcheck/common/expected.hpp>
#include <refcheck/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <gsl/util>
#include <range/v3/algorithm/transform.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace refcheck::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns the number of bytes written; logs failure at debug level
inline Expected<std::size_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err);
        return err;
    }

    return gsl::narrow_cast<std::size_t>(res);
}

/// reads fromm a file descriptor. See read(2)
/// an empty result means end of file; logs failure at debug level
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err);
        return err;
    }

    buffer.resize(gsl::narrow_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err);
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err);
        return err;
    }

    return {};
}

/// args and envp do NOT need to have an extra NULL element; this is added for you.
/// ``args`` includes argv[0].
/// see execve(2). Only returns on failure.
inline std::error_code execve(const std::string& exec, const std::vector<std::string>& args,
                              const std::vector<std::string>& envp) {
    // Reason: execve requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> cstr_arg_list(args.size() + 1, nullptr);
    std::vector<char*> cstr_envp_list(envp.size() + 1, nullptr);

    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    ranges::transform(args, cstr_arg_list.begin(), to_cstr);
    ranges::transform(envp, cstr_envp_list.begin(), to_cstr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    ::execve(exec.c_str(), cstr_arg_list.data(), cstr_envp_list.data());

    return make_error_code(errno);
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err);
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open failed: '{}'", err);
        return err;
    }

    return res;
}

/// see dup(2)
/// returns success/failure; logs failure at debug level
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        auto err = make_error_code(errno);

        LOG_DEBUG("dup2 failed: '{}'", err);

        return err;
    }

    return {};
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, int arg) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::fcntl(fd, cmd, arg);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err);

        return err;
    }

    return res;
}

/// see waitpid(2)
/// with WNOHANG, a returned pid of 0 means that the child has not changed state yet
struct WaitResult
{
    pid_t pid;
    int status;
};

inline Expected<WaitResult> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res = ::waitpid(pid, &status, options);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid failed: '{}'", err);

        return err;
    }

    return WaitResult{.pid = res, .status = status};
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err);

        return err;
    }

    return pipe;
}

/// see poll(2)
/// returns the number of ready fds (0 on timeout); logs failure at debug level
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        auto err = make_error_code(errno);

        // EINTR is routine here (SIGINT / SIGCHLD), don't bother logging it
        if (err != std::errc::interrupted) {
            LOG_DEBUG("poll failed: '{}'", err);
        }

        return err;
    }

    return res;
}

/// see setresgid(2)
inline Expected<> setresgid(gid_t rgid, gid_t egid, gid_t sgid) {
    if (::setresgid(rgid, egid, sgid) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setresgid({}, {}, {}) failed: '{}'", rgid, egid, sgid, err);

        return err;
    }

    return {};
}

/// see setresuid(2)
inline Expected<> setresuid(uid_t ruid, uid_t euid, uid_t suid) {
    if (::setresuid(ruid, euid, suid) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setresuid({}, {}, {}) failed: '{}'", ruid, euid, suid, err);

        return err;
    }

    return {};
}

struct ResIds
{
    unsigned int real;
    unsigned int effective;
    unsigned int saved;
};

/// see getresuid(2)
inline Expected<ResIds> getresuid() {
    uid_t ruid{};
    uid_t euid{};
    uid_t suid{};

    if (::getresuid(&ruid, &euid, &suid) == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("getresuid failed: '{}'", err);
        return err;
    }

    return ResIds{.real = ruid, .effective = euid, .saved = suid};
}

/// see getresgid(2)
inline Expected<ResIds> getresgid() {
    gid_t rgid{};
    gid_t egid{};
    gid_t sgid{};

    if (::getresgid(&rgid, &egid, &sgid) == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("getresgid failed: '{}'", err);
        return err;
    }

    return ResIds{.real = rgid, .effective = egid, .saved = sgid};
}

/// see getgroups(2)
inline Expected<std::vector<gid_t>> getgroups() {
    int count = ::getgroups(0, nullptr);

    if (count == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("getgroups failed: '{}'", err);
        return err;
    }

    std::vector<gid_t> groups(gsl::narrow_cast<std::size_t>(count));

    count = ::getgroups(count, groups.data());

    if (count == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("getgroups failed: '{}'", err);
        return err;
    }

    groups.resize(gsl::narrow_cast<std::size_t>(count));

    return groups;
}

/// see setgroups(2)
inline Expected<> setgroups(const std::vector<gid_t>& groups) {
    if (::setgroups(groups.size(), groups.data()) == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("setgroups({}) failed: '{}'", groups, err);
        return err;
    }

    return {};
}

using SignalHandlerT = void (*)(int);

/// see sigaction(2). ``flags`` lands in sa_flags verbatim.
/// returns the previous action so that it can be restored
inline Expected<struct sigaction> sigaction(int sig, SignalHandlerT handler, int flags = 0) {
    struct sigaction new_action{};
    struct sigaction old_action{};

    new_action.sa_handler = handler;
    new_action.sa_flags = flags;
    sigemptyset(&new_action.sa_mask);

    if (::sigaction(sig, &new_action, &old_action) == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("sigaction failed: '{}'", err);
        return err;
    }

    return old_action;
}

/// restore an action previously returned by ``sigaction``
inline Expected<> sigaction(int sig, const struct sigaction& action) {
    if (::sigaction(sig, &action, nullptr) == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("sigaction failed: '{}'", err);
        return err;
    }

    return {};
}

} // namespace refcheck::linux
