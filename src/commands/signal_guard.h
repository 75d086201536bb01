// =============================================================================
// railmr - Signal Guard
// =============================================================================
// Turns SIGINT/SIGTERM into a cooperative cancellation request. The signal
// handler only sets a flag; a watcher thread invokes the callback outside
// signal context. Once cancellation has started both signals get their default
// disposition back, so a second Ctrl-C terminates the process immediately.
// Previous handlers are restored on destruction.
// =============================================================================

#ifndef RAILMR_COMMANDS_SIGNAL_GUARD_H
#define RAILMR_COMMANDS_SIGNAL_GUARD_H

#include <csignal>
#include <functional>
#include <thread>

namespace railmr::commands {

class SignalGuard {
public:
    explicit SignalGuard(std::function<void()> onSignal);

    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;

    /// @brief Signal received, or 0.
    [[nodiscard]] static int received() noexcept;

private:
    std::function<void()> onSignal_;
    struct sigaction previousInt_{};
    struct sigaction previousTerm_{};
    std::jthread watcher_;
};

}  // namespace railmr::commands

#endif  // RAILMR_COMMANDS_SIGNAL_GUARD_H
