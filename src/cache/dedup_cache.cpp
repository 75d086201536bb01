// =============================================================================
// railmr - Redundancy-Elimination Cache Implementation
// =============================================================================

#include "railmr/cache/dedup_cache.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <thread>

#include <fmt/format.h>

#include "railmr/common/logger.h"
#include "railmr/format/partition_file.h"

namespace railmr::cache {

DedupCache::DedupCache(std::filesystem::path root, DedupCacheOptions options)
    : root_(std::move(root)), options_(options) {}

std::filesystem::path DedupCache::entryPath(const Fingerprint& fingerprint) const {
    const std::string hex = fingerprint.toHex();
    return root_ / hex.substr(0, 2) / (hex + ".rec");
}

std::filesystem::path DedupCache::claimPath(const Fingerprint& fingerprint) const {
    const std::string hex = fingerprint.toHex();
    return root_ / hex.substr(0, 2) / (hex + ".claim");
}

std::optional<std::vector<Record>> DedupCache::get(const Fingerprint& fingerprint) {
    const auto path = entryPath(fingerprint);
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }
    try {
        return format::readRecordFile(path);
    } catch (const FormatError& ex) {
        // Entries are published whole by link(2); a bad one points at storage trouble
        RAILMR_LOG_WARNING("Ignoring unreadable cache entry {}: {}", path.string(), ex.what());
        return std::nullopt;
    }
}

bool DedupCache::putIfAbsent(const Fingerprint& fingerprint, std::span<const Record> result) {
    const auto path = entryPath(fingerprint);
    const auto staged = format::uniqueTempPath(path);

    format::PartitionWriterOptions writerOptions;
    writerOptions.durable = true;
    format::writeRecordFile(staged, result, writerOptions);

    if (::link(staged.c_str(), path.c_str()) != 0) {
        const int err = errno;
        std::error_code ec;
        std::filesystem::remove(staged, ec);
        if (err == EEXIST) {
            return false;
        }
        throw IOError("Cannot publish cache entry", std::error_code(err, std::generic_category()),
                      ErrorContext{path.string()});
    }

    std::error_code ec;
    std::filesystem::remove(staged, ec);
    return true;
}

DedupCache::Claim::~Claim() {
    if (!path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
}

std::optional<DedupCache::Claim> DedupCache::tryClaim(const Fingerprint& fingerprint) {
    const auto path = claimPath(fingerprint);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw IOError("Cannot create cache directory", ec,
                      ErrorContext{path.parent_path().string()});
    }

    int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return std::nullopt;
        }
        throw IOError("Cannot create cache claim", std::error_code(errno, std::generic_category()),
                      ErrorContext{path.string()});
    }
    const std::string owner = fmt::format("{}\n", ::getpid());
    // The marker's content is informational; its existence is the claim
    [[maybe_unused]] auto written = ::write(fd, owner.data(), owner.size());
    ::close(fd);
    return Claim{path};
}

std::vector<Record> DedupCache::computeAndPublish(const Fingerprint& fingerprint,
                                                  const ComputeFn& compute) {
    ++stats_.misses;
    std::vector<Record> result = compute();
    if (putIfAbsent(fingerprint, result)) {
        ++stats_.accepted;
        return result;
    }

    ++stats_.raceLosses;
    RAILMR_LOG_DEBUG("Cache race lost for {}, using the published entry", fingerprint.toHex());
    if (auto winner = get(fingerprint)) {
        return std::move(*winner);
    }
    return result;
}

std::vector<Record> DedupCache::getOrCompute(const Fingerprint& fingerprint,
                                             const ComputeFn& compute,
                                             const CancellationToken* cancel) {
    if (auto hit = get(fingerprint)) {
        ++stats_.hits;
        return std::move(*hit);
    }
    if (!options_.useClaims) {
        return computeAndPublish(fingerprint, compute);
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.claimTimeout;
    auto interval = options_.initialPollInterval;
    bool waited = false;

    for (;;) {
        if (auto claim = tryClaim(fingerprint)) {
            // The previous holder may have published between our lookup and the claim
            if (auto hit = get(fingerprint)) {
                ++stats_.hits;
                return std::move(*hit);
            }
            return computeAndPublish(fingerprint, compute);
        }

        if (!waited) {
            ++stats_.claimWaits;
            waited = true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            RAILMR_LOG_WARNING("Cache claim on {} not released within {} ms, computing locally",
                               fingerprint.toHex(), options_.claimTimeout.count());
            return computeAndPublish(fingerprint, compute);
        }

        if (cancel != nullptr) {
            if (cancel->waitFor(interval)) {
                throw CancelledError("wait for cache entry cancelled");
            }
        } else {
            std::this_thread::sleep_for(interval);
        }
        interval = std::min(interval * 2, options_.maxPollInterval);

        if (auto hit = get(fingerprint)) {
            ++stats_.hits;
            return std::move(*hit);
        }
    }
}

}  // namespace railmr::cache
