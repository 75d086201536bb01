// =============================================================================
// railmr - Cooperative Cancellation
// =============================================================================
// CancellationToken is shared between the orchestrator, backend adapters and
// task runners. WakeupSignal lets a backend tell the orchestrator that a task
// finished so the polling loop does not sleep out its full interval.
// =============================================================================

#ifndef RAILMR_COMMON_CANCELLATION_H
#define RAILMR_COMMON_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string_view>

namespace railmr {

/// @brief One-way cancellation flag with an interruptible wait.
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// @brief Request cancellation and wake every waiter. Thread-safe.
    void cancel();

    [[nodiscard]] bool isCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// @brief Sleep for up to @p timeout.
    /// @return true if cancellation was requested before or during the wait.
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// @brief Throw CancelledError if cancellation was requested.
    void throwIfCancelled(std::string_view what) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

/// @brief Auto-reset event used for completion notifications.
class WakeupSignal {
public:
    void notify();

    /// @brief Wait until notified or @p timeout elapses. Consumes the notification.
    /// @return true if a notification was pending or arrived.
    bool waitFor(std::chrono::milliseconds timeout);

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool signalled_ = false;
};

}  // namespace railmr

#endif  // RAILMR_COMMON_CANCELLATION_H
