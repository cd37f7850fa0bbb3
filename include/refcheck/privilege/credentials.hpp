#pragma once

#include <fmt/format.h>

#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace refcheck {

/// The identity a worker is downgraded to before it runs anything on the caller's behalf
struct Credentials
{
    static constexpr uid_t DEFAULT_UID = 9999;
    static constexpr gid_t DEFAULT_GID = 9999;

    uid_t uid = DEFAULT_UID;
    gid_t gid = DEFAULT_GID;

    /// The caller's own real identity. Dropping to it is a no-op credentials-wise,
    /// which is what unprivileged callers (and the tests) want.
    static Credentials current() noexcept { return {.uid = ::getuid(), .gid = ::getgid()}; }

    bool operator==(const Credentials& rhs) const = default;
};

/// Snapshot of the credentials of the process it was taken in
struct ProcessIdentity
{
    uid_t ruid;
    uid_t euid;
    uid_t suid;
    gid_t rgid;
    gid_t egid;
    gid_t sgid;
    std::vector<gid_t> groups;

    bool operator==(const ProcessIdentity& rhs) const = default;
};

/// Take a snapshot of the calling process' credentials.
/// Throws ``HarnessError`` if the kernel refuses to tell us.
ProcessIdentity current_identity();

} // namespace refcheck

template <>
struct fmt::formatter<::refcheck::Credentials> : fmt::formatter<std::string_view>
{
    auto format(const ::refcheck::Credentials& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}:{}", from.uid, from.gid);
    }
};
