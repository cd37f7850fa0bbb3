#include "common/interrupt.hpp"

#include <refcheck/common/linux.hpp>
#include <refcheck/logging.hpp>

#include <csignal>
#include <tuple>

namespace refcheck {

namespace {

volatile std::sig_atomic_t interrupt_flag = 0; // NOLINT(*-avoid-non-const-global-variables)

void on_interrupt(int /*signum*/) {
    interrupt_flag = 1;
}

} // namespace

InterruptGuard::InterruptGuard() {
    interrupt_flag = 0;

    auto previous = linux::sigaction(SIGINT, on_interrupt, /*flags=*/0);

    if (!previous) {
        LOG_WARN("Could not install SIGINT handler: {}", previous.error().message());
        return;
    }

    previous_action_ = *previous;
    installed_ = true;
}

InterruptGuard::~InterruptGuard() {
    if (installed_) {
        std::ignore = linux::sigaction(SIGINT, previous_action_);
    }
    interrupt_flag = 0;
}

bool InterruptGuard::triggered() const noexcept {
    return interrupt_flag != 0;
}

bool interrupt_requested() noexcept {
    return interrupt_flag != 0;
}

} // namespace refcheck
