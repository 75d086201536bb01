// =============================================================================
// railmr - Redundancy-Elimination Cache
// =============================================================================
// Content-addressed store of computed stage results on shared storage,
// reachable from every task of a job regardless of backend.
//
//   <root>/<first two hex digits>/<fingerprint>.rec     entry (record file)
//   <root>/<first two hex digits>/<fingerprint>.claim   computation in progress
//
// get() and putIfAbsent() are the only operations on entries. putIfAbsent()
// stages the entry in a unique file and publishes it with link(2), which fails
// with EEXIST if another writer got there first: the first writer wins and the
// entry is immutable for the rest of the job.
//
// getOrCompute() adds claim markers created with O_EXCL so concurrent tasks
// wait for the task already computing a fingerprint instead of computing it
// again. A waiter whose claim holder disappears takes over the claim; a waiter
// that times out computes on its own and relies on first-writer-wins.
//
// One DedupCache instance belongs to one task and is not thread-safe.
// =============================================================================

#ifndef RAILMR_CACHE_DEDUP_CACHE_H
#define RAILMR_CACHE_DEDUP_CACHE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "railmr/cache/fingerprint.h"
#include "railmr/common/cancellation.h"
#include "railmr/common/types.h"

namespace railmr::cache {

/// @brief Cache counters for one task (or summed over a stage or job).
struct CacheStats {
    /// @brief Results served from an existing entry.
    std::uint64_t hits = 0;

    /// @brief Results computed by this task.
    std::uint64_t misses = 0;

    /// @brief Entries this task published.
    std::uint64_t accepted = 0;

    /// @brief Publications lost to a concurrent writer (not an error).
    std::uint64_t raceLosses = 0;

    /// @brief Times this task waited on another task's claim.
    std::uint64_t claimWaits = 0;

    CacheStats& operator+=(const CacheStats& other) noexcept {
        hits += other.hits;
        misses += other.misses;
        accepted += other.accepted;
        raceLosses += other.raceLosses;
        claimWaits += other.claimWaits;
        return *this;
    }
};

struct DedupCacheOptions {
    /// @brief Use claim markers to avoid concurrent duplicate computation.
    bool useClaims = true;

    /// @brief Longest wait for another task's claimed entry.
    std::chrono::milliseconds claimTimeout = kDefaultClaimTimeout;

    std::chrono::milliseconds initialPollInterval{2};
    std::chrono::milliseconds maxPollInterval{200};
};

class DedupCache {
public:
    using ComputeFn = std::function<std::vector<Record>()>;

    explicit DedupCache(std::filesystem::path root, DedupCacheOptions options = {});

    /// @brief Look up a published entry.
    [[nodiscard]] std::optional<std::vector<Record>> get(const Fingerprint& fingerprint);

    /// @brief Publish an entry unless one exists.
    /// @return true if this call created the entry.
    /// @throws IOError on storage failure.
    bool putIfAbsent(const Fingerprint& fingerprint, std::span<const Record> result);

    /// @brief Return the cached result, computing and publishing it on a miss.
    /// @note The returned records are always the published entry when one exists,
    ///       so every consumer observes identical bytes.
    /// @throws CancelledError if @p cancel fires while waiting on a claim.
    [[nodiscard]] std::vector<Record> getOrCompute(const Fingerprint& fingerprint,
                                                   const ComputeFn& compute,
                                                   const CancellationToken* cancel = nullptr);

    [[nodiscard]] const CacheStats& stats() const noexcept { return stats_; }

    [[nodiscard]] std::filesystem::path entryPath(const Fingerprint& fingerprint) const;

    [[nodiscard]] std::filesystem::path claimPath(const Fingerprint& fingerprint) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    /// @brief Exclusive claim marker, removed on destruction.
    class Claim {
    public:
        explicit Claim(std::filesystem::path path) : path_(std::move(path)) {}
        ~Claim();

        Claim(Claim&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }
        Claim& operator=(Claim&&) = delete;
        Claim(const Claim&) = delete;
        Claim& operator=(const Claim&) = delete;

    private:
        std::filesystem::path path_;
    };

    [[nodiscard]] std::optional<Claim> tryClaim(const Fingerprint& fingerprint);

    [[nodiscard]] std::vector<Record> computeAndPublish(const Fingerprint& fingerprint,
                                                       const ComputeFn& compute);

    std::filesystem::path root_;
    DedupCacheOptions options_;
    CacheStats stats_;
};

}  // namespace railmr::cache

#endif  // RAILMR_CACHE_DEDUP_CACHE_H
