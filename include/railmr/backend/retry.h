// =============================================================================
// railmr - Retry with Exponential Backoff
// =============================================================================

#ifndef RAILMR_BACKEND_RETRY_H
#define RAILMR_BACKEND_RETRY_H

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <thread>

#include <fmt/format.h>

#include "railmr/common/cancellation.h"
#include "railmr/common/error.h"
#include "railmr/common/logger.h"

namespace railmr::backend {

/// @brief delay = initial * 2^(attempt-1), capped at @p maxDelay. Attempts start at 1.
[[nodiscard]] constexpr std::chrono::milliseconds backoffDelay(
    std::chrono::milliseconds initial, std::uint32_t attempt,
    std::chrono::milliseconds maxDelay) noexcept {
    auto delay = initial;
    for (std::uint32_t i = 1; i < attempt && delay < maxDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, maxDelay);
}

/// @brief How often an adapter retries an unavailable substrate.
struct RetryPolicy {
    std::uint32_t maxAttempts = 5;
    std::chrono::milliseconds initialDelay{200};
    std::chrono::milliseconds maxDelay{10'000};

    [[nodiscard]] VoidResult validate() const {
        if (maxAttempts == 0) {
            return makeVoidError(ErrorCode::kConfigurationError,
                                 "submit retry attempts must be positive");
        }
        if (initialDelay.count() < 0 || maxDelay < initialDelay) {
            return makeVoidError(ErrorCode::kConfigurationError,
                                 "submit retry delays must satisfy 0 <= initial <= max");
        }
        return makeVoidSuccess();
    }
};

/// @brief Run @p op until it succeeds, fails with something other than
///        kBackendUnavailable, or the policy is exhausted.
/// @return The last error, with kBackendUnavailable turned into kTaskExecutionError.
template <typename T, typename Op>
[[nodiscard]] Result<T> retryWithBackoff(const RetryPolicy& policy, std::string_view what,
                                         Op&& op, const CancellationToken* cancel = nullptr) {
    for (std::uint32_t attempt = 1;; ++attempt) {
        Result<T> result = op();
        if (result.has_value() || result.error().code() != ErrorCode::kBackendUnavailable) {
            return result;
        }
        if (attempt >= policy.maxAttempts) {
            return makeError<T>(ErrorCode::kTaskExecutionError,
                                fmt::format("{}: {} (gave up after {} attempts)", what,
                                            result.error().message(), attempt));
        }
        auto delay = backoffDelay(policy.initialDelay, attempt, policy.maxDelay);
        RAILMR_LOG_WARNING("{}: {}; retrying in {} ms", what, result.error().message(),
                           delay.count());
        if (cancel != nullptr) {
            if (cancel->waitFor(delay)) {
                return makeError<T>(ErrorCode::kCancelled, fmt::format("{} cancelled", what));
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
}

}  // namespace railmr::backend

#endif  // RAILMR_BACKEND_RETRY_H
