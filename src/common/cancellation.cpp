// =============================================================================
// railmr - Cooperative Cancellation Implementation
// =============================================================================

#include "railmr/common/cancellation.h"

#include <string>

#include "railmr/common/error.h"

namespace railmr {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout,
                        [this] { return cancelled_.load(std::memory_order_acquire); });
}

void CancellationToken::throwIfCancelled(std::string_view what) const {
    if (isCancelled()) {
        throw CancelledError(std::string(what) + " cancelled");
    }
}

void WakeupSignal::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        signalled_ = true;
    }
    cv_.notify_all();
}

bool WakeupSignal::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool woke = cv_.wait_for(lock, timeout, [this] { return signalled_; });
    signalled_ = false;
    return woke;
}

}  // namespace railmr
