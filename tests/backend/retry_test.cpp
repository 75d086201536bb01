// =============================================================================
// railmr - Retry Policy Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "railmr/backend/retry.h"
#include "railmr/common/cancellation.h"

namespace railmr::backend::test {

using namespace std::chrono_literals;

TEST(BackoffDelayTest, DoublesUpToTheCap) {
    EXPECT_EQ(backoffDelay(100ms, 1, 10s), 100ms);
    EXPECT_EQ(backoffDelay(100ms, 2, 10s), 200ms);
    EXPECT_EQ(backoffDelay(100ms, 4, 10s), 800ms);
    EXPECT_EQ(backoffDelay(100ms, 40, 10s), 10s);
    EXPECT_EQ(backoffDelay(0ms, 5, 10s), 0ms);
    static_assert(backoffDelay(std::chrono::milliseconds{1}, 3,
                               std::chrono::milliseconds{100}) == std::chrono::milliseconds{4});
}

RC_GTEST_PROP(BackoffDelayProperty, MonotonicAndCapped, ()) {
    auto initial = std::chrono::milliseconds{*rc::gen::inRange<int>(0, 5'000)};
    auto cap = initial + std::chrono::milliseconds{*rc::gen::inRange<int>(0, 60'000)};
    auto attempt = *rc::gen::inRange<std::uint32_t>(1, 64);
    auto delay = backoffDelay(initial, attempt, cap);
    RC_ASSERT(delay <= cap);
    RC_ASSERT(delay >= std::min(initial, cap));
    RC_ASSERT(backoffDelay(initial, attempt + 1, cap) >= delay);
}

TEST(RetryWithBackoffTest, RetriesOnlyUnavailableSubstrate) {
    RetryPolicy policy{5, 0ms, 0ms};
    int calls = 0;
    auto result = retryWithBackoff<int>(policy, "squeue", [&]() -> Result<int> {
        if (++calls < 3) {
            return makeError<int>(ErrorCode::kBackendUnavailable, "scheduler down");
        }
        return 42;
    });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(calls, 3);

    calls = 0;
    auto hard = retryWithBackoff<int>(policy, "squeue", [&]() -> Result<int> {
        ++calls;
        return makeError<int>(ErrorCode::kInvalidArgument, "bad flag");
    });
    ASSERT_FALSE(hard.has_value());
    EXPECT_EQ(hard.error().code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(calls, 1);
}

TEST(RetryWithBackoffTest, ExhaustedRetriesBecomeTaskErrors) {
    RetryPolicy policy{3, 0ms, 0ms};
    int calls = 0;
    auto result = retryWithBackoff<std::string>(policy, "sbatch", [&]() -> Result<std::string> {
        ++calls;
        return makeError<std::string>(ErrorCode::kBackendUnavailable, "connection refused");
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(result.error().code(), ErrorCode::kTaskExecutionError);
    EXPECT_NE(result.error().message().find("sbatch: connection refused"), std::string::npos);
    EXPECT_NE(result.error().message().find("gave up after 3 attempts"), std::string::npos);
}

TEST(RetryWithBackoffTest, CancellationInterruptsTheWait) {
    RetryPolicy policy{10, 10s, 10s};
    CancellationToken cancel;
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(50ms);
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto result = retryWithBackoff<int>(
        policy, "squeue",
        []() -> Result<int> { return makeError<int>(ErrorCode::kBackendUnavailable, "down"); },
        &cancel);
    canceller.join();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(RetryPolicyTest, Validation) {
    EXPECT_TRUE(RetryPolicy{}.validate().has_value());
    EXPECT_FALSE((RetryPolicy{0, 0ms, 0ms}).validate().has_value());
    EXPECT_FALSE((RetryPolicy{3, 100ms, 10ms}).validate().has_value());
}

}  // namespace railmr::backend::test
