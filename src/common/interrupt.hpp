#pragma once

#include <refcheck/common/class_traits.hpp>

#include <csignal>

namespace refcheck {

/// Routes SIGINT to a flag for as long as the guard is alive.
///
/// The handler is installed without ``SA_RESTART``, so blocking calls (``read``, ``poll``)
/// return with ``EINTR`` and callers get the chance to look at the flag.
/// Only one guard may be alive at a time.
class InterruptGuard : NonMovable
{
public:
    InterruptGuard();
    ~InterruptGuard();

    /// Whether SIGINT was received since this guard was installed
    bool triggered() const noexcept;

private:
    struct sigaction previous_action_{};
    bool installed_ = false;
};

/// Whether SIGINT was received while an ``InterruptGuard`` was alive.
/// The flag is inherited by forked processes.
bool interrupt_requested() noexcept;

} // namespace refcheck
