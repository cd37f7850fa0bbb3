#include <refcheck/privilege/drop.hpp>

#include <refcheck/common/expected.hpp>
#include <refcheck/common/linux.hpp>
#include <refcheck/exceptions.hpp>
#include <refcheck/logging.hpp>
#include <refcheck/privilege/credentials.hpp>
#include <refcheck/privilege/payload.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>

#include <csignal>
#include <cstdio>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace refcheck {

namespace {

constexpr std::size_t CHANNEL_READ_SIZE = 64 * 1024;

constexpr gid_t ROOT_GID = 0;

/// Irreversibly switch the calling process to ``creds``.
///
/// Group identity goes first, while we still have the authority to change it.
Expected<> drop_privileges(const Credentials& creds) {
    TRY(linux::setresgid(creds.gid, creds.gid, creds.gid));

    std::vector<gid_t> groups = TRY(linux::getgroups());
    auto kept = groups | ranges::views::filter([](gid_t gid) { return gid != ROOT_GID; }) |
                ranges::to<std::vector<gid_t>>;

    // Unprivileged callers may not call setgroups at all, even with their current set
    if (kept != groups) {
        TRY(linux::setgroups(kept));
    }

    TRY(linux::setresuid(creds.uid, creds.uid, creds.uid));

    return {};
}

void write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        auto written = linux::write(fd, data);

        if (!written) {
            if (written.error() == std::errc::interrupted) {
                continue;
            }
            return;
        }

        data.remove_prefix(*written);
    }
}

/// Everything that happens inside the worker, up to the payload it sends back
ChannelBytes worker_main(const Credentials& creds, const std::function<ChannelBytes()>& body) {
    if (auto res = drop_privileges(creds); !res) {
        return encode_error_payload(ErrorKind::Internal,
                                    fmt::format("[!] Failed to drop privileges to {}: {}", creds, res.error().message()));
    }

    LOG_DEBUG("Worker dropped privileges to {}", creds);

    try {
        return body();
    } catch (const ClassifiedError& err) {
        return encode_error_payload(err);
    } catch (const std::exception& err) {
        return encode_error_payload(ErrorKind::Unexpected, err.what());
    } catch (...) {
        return encode_error_payload(ErrorKind::Unexpected, "<unknown - not derived from std::exception>");
    }
}

std::string describe_wait_status(int status) {
    if (WIFEXITED(status)) {
        return fmt::format("exit code {}", WEXITSTATUS(status));
    }

    if (WIFSIGNALED(status)) {
        return fmt::format("killed by signal {}", format_exit_code(-WTERMSIG(status)));
    }

    return fmt::format("wait status {:#x}", status);
}

} // namespace

ChannelBytes detail::run_in_worker(const Credentials& creds, const std::function<ChannelBytes()>& body) {
    auto channel = linux::pipe2(O_CLOEXEC);

    if (!channel) {
        throw InternalFailure(fmt::format("[!] Failed to create the worker channel: {}", channel.error().message()));
    }

    // Buffered output would otherwise be written twice, once by each process
    std::fflush(nullptr);
    spdlog::default_logger_raw()->flush();

    auto fork_res = linux::fork();

    if (!fork_res) {
        std::ignore = linux::close(channel->read_fd);
        std::ignore = linux::close(channel->write_fd);
        throw InternalFailure(fmt::format("[!] Failed to spawn a worker: {}", fork_res.error().message()));
    }

    if (fork_res->which == linux::Fork::Child) {
        std::ignore = linux::close(channel->read_fd);

        ChannelBytes payload = worker_main(creds, body);
        write_all(channel->write_fd, {reinterpret_cast<const char*>(payload.data()), payload.size()}); // NOLINT
        std::ignore = linux::close(channel->write_fd);

        std::fflush(nullptr);
        spdlog::default_logger_raw()->flush();
        ::_exit(0);
    }

    const pid_t worker_pid = fork_res->pid;
    std::ignore = linux::close(channel->write_fd);
    auto close_channel = gsl::finally([fd = channel->read_fd] { std::ignore = linux::close(fd); });

    std::string received;
    std::error_code read_error;
    bool oversized = false;

    while (true) {
        auto chunk = linux::read(channel->read_fd, CHANNEL_READ_SIZE);

        if (!chunk) {
            // SIGINT without SA_RESTART; the worker sees it too and reports back on its own
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            read_error = chunk.error();
            std::ignore = linux::kill(worker_pid, SIGKILL);
            break;
        }

        if (chunk->empty()) {
            break;
        }

        received += *chunk;

        if (received.size() > MAX_PAYLOAD_SIZE) {
            oversized = true;
            std::ignore = linux::kill(worker_pid, SIGKILL);
            break;
        }
    }

    int status = 0;
    while (true) {
        auto res = linux::waitpid(worker_pid);

        if (res) {
            status = res->status;
            break;
        }

        if (res.error() != std::errc::interrupted) {
            throw InternalFailure(fmt::format("[!] Failed to reap worker {}: {}", worker_pid, res.error().message()));
        }
    }

    if (read_error) {
        throw InternalFailure(fmt::format("[!] Failed to read from the worker channel: {}", read_error.message()));
    }

    if (oversized) {
        LOG_FATAL("Privilege-dropped worker {} sent more than {} bytes ({})", worker_pid, MAX_PAYLOAD_SIZE,
                  describe_wait_status(status));
        throw InternalFailure(fmt::format("[!] Privilege-dropped worker sent more than {} bytes", MAX_PAYLOAD_SIZE));
    }

    if (received.empty()) {
        LOG_FATAL("Privilege-dropped worker {} exited without sending a result ({})", worker_pid,
                  describe_wait_status(status));
        throw InternalFailure(fmt::format("[!] Privilege-dropped worker exited without sending a result ({})",
                                          describe_wait_status(status)));
    }

    LOG_DEBUG("Received {} bytes from worker {} ({})", received.size(), worker_pid, describe_wait_status(status));

    return {received.begin(), received.end()};
}

ProcessIdentity current_identity() {
    auto uids = linux::getresuid();
    auto gids = linux::getresgid();
    auto groups = linux::getgroups();

    auto check = [](const auto& res) {
        if (!res) {
            throw HarnessError(fmt::format("[!] Failed to query process credentials: {}", res.error().message()));
        }
    };

    check(uids);
    check(gids);
    check(groups);

    return {.ruid = uids->real,
            .euid = uids->effective,
            .suid = uids->saved,
            .rgid = gids->real,
            .egid = gids->effective,
            .sgid = gids->saved,
            .groups = std::move(*groups)};
}

ProcessIdentity get_worker_identity(const Credentials& creds) {
    return run_privileged(creds, current_identity);
}

} // namespace refcheck
