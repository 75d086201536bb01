// =============================================================================
// railmr - Redundancy-Elimination Cache Tests
// =============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "railmr/cache/dedup_cache.h"
#include "test_support.h"

namespace railmr::cache::test {

using namespace std::chrono_literals;
using railmr::test::TempDir;
using railmr::test::writeTextFile;

namespace {

const Fingerprint kFingerprint = fingerprintWorkUnit("body", "", "ACGT");

std::vector<Record> resultFor(const std::string& tag) {
    return {{"sig", tag}, {"sig2", tag + "-b"}};
}

}  // namespace

TEST(DedupCacheTest, FirstWriterWins) {
    TempDir dir;
    DedupCache cache(dir.path());
    EXPECT_FALSE(cache.get(kFingerprint).has_value());

    EXPECT_TRUE(cache.putIfAbsent(kFingerprint, resultFor("first")));
    EXPECT_FALSE(cache.putIfAbsent(kFingerprint, resultFor("second")));
    EXPECT_EQ(cache.get(kFingerprint), std::optional{resultFor("first")});

    auto hex = kFingerprint.toHex();
    EXPECT_EQ(cache.entryPath(kFingerprint), dir.path() / hex.substr(0, 2) / (hex + ".rec"));
}

TEST(DedupCacheTest, GetOrComputeCountsHitsAndMisses) {
    TempDir dir;
    DedupCache cache(dir.path());
    int computed = 0;
    auto compute = [&computed] {
        ++computed;
        return resultFor("value");
    };

    EXPECT_EQ(cache.getOrCompute(kFingerprint, compute), resultFor("value"));
    EXPECT_EQ(cache.getOrCompute(kFingerprint, compute), resultFor("value"));
    EXPECT_EQ(computed, 1);
    EXPECT_EQ(cache.stats().misses, 1u);
    EXPECT_EQ(cache.stats().hits, 1u);
    EXPECT_EQ(cache.stats().accepted, 1u);
    EXPECT_FALSE(std::filesystem::exists(cache.claimPath(kFingerprint)));
}

TEST(DedupCacheTest, LostRaceReturnsPublishedEntry) {
    TempDir dir;
    DedupCache winner(dir.path());
    DedupCache loser(dir.path(), DedupCacheOptions{false});

    auto result = loser.getOrCompute(kFingerprint, [&winner] {
        EXPECT_TRUE(winner.putIfAbsent(kFingerprint, resultFor("winner")));
        return resultFor("loser");
    });
    EXPECT_EQ(result, resultFor("winner"));
    EXPECT_EQ(loser.stats().raceLosses, 1u);
    EXPECT_EQ(loser.stats().accepted, 0u);
}

TEST(DedupCacheTest, ConcurrentTasksComputeOnce) {
    TempDir dir;
    std::atomic<int> computed{0};
    std::vector<std::vector<Record>> results(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            DedupCache cache(dir.path());
            results[i] = cache.getOrCompute(kFingerprint, [&computed, i] {
                ++computed;
                std::this_thread::sleep_for(20ms);
                return resultFor("task-" + std::to_string(i));
            });
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(computed.load(), 1);
    for (const auto& result : results) {
        EXPECT_EQ(result, results.front());
    }
}

TEST(DedupCacheTest, StaleClaimTimesOutAndComputesLocally) {
    TempDir dir;
    DedupCacheOptions options;
    options.claimTimeout = 50ms;
    DedupCache cache(dir.path(), options);
    writeTextFile(cache.claimPath(kFingerprint), "99999\n");

    auto result = cache.getOrCompute(kFingerprint, [] { return resultFor("local"); });
    EXPECT_EQ(result, resultFor("local"));
    EXPECT_EQ(cache.stats().claimWaits, 1u);
    EXPECT_EQ(cache.stats().accepted, 1u);
}

TEST(DedupCacheTest, CancelWhileWaitingOnClaim) {
    TempDir dir;
    DedupCache cache(dir.path());
    writeTextFile(cache.claimPath(kFingerprint), "99999\n");

    CancellationToken token;
    token.cancel();
    EXPECT_THROW((void)cache.getOrCompute(kFingerprint, [] { return resultFor("x"); }, &token),
                 CancelledError);
}

TEST(DedupCacheTest, EmptyResultIsCached) {
    TempDir dir;
    DedupCache cache(dir.path());
    (void)cache.getOrCompute(kFingerprint, [] { return std::vector<Record>{}; });
    auto cached = cache.get(kFingerprint);
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->empty());
}

}  // namespace railmr::cache::test
