// =============================================================================
// railmr - Shared Test Utilities
// =============================================================================
// Temporary directories, small file writers and read generators used across
// the test suites.
// =============================================================================

#ifndef RAILMR_TESTS_TEST_SUPPORT_H
#define RAILMR_TESTS_TEST_SUPPORT_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

#include "railmr/io/fastq_parser.h"

namespace railmr::test {

// =============================================================================
// Temporary Files
// =============================================================================

/// @brief Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(std::string_view prefix = "railmr-test") {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                (std::string(prefix) + "-" + std::to_string(::getpid()) + "-" +
                 std::to_string(counter++) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::filesystem::path operator/(std::string_view name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

/// @brief Write @p content to @p path, creating parent directories.
inline void writeTextFile(const std::filesystem::path& path, std::string_view content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

[[nodiscard]] inline std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

// =============================================================================
// FASTQ
// =============================================================================

[[nodiscard]] inline std::string formatFastq(const std::vector<io::FastqRecord>& records) {
    std::ostringstream oss;
    for (const auto& record : records) {
        oss << '@' << record.id;
        if (!record.comment.empty()) {
            oss << ' ' << record.comment;
        }
        oss << '\n' << record.sequence << "\n+\n" << record.quality << '\n';
    }
    return oss.str();
}

inline void writeFastq(const std::filesystem::path& path,
                       const std::vector<io::FastqRecord>& records) {
    writeTextFile(path, formatFastq(records));
}

/// @brief Read with a constant quality string.
[[nodiscard]] inline io::FastqRecord makeRead(std::string id, std::string sequence) {
    io::FastqRecord record;
    record.id = std::move(id);
    record.quality.assign(sequence.size(), 'I');
    record.sequence = std::move(sequence);
    return record;
}

[[nodiscard]] inline std::string randomSequence(std::mt19937& rng, std::size_t length) {
    static constexpr char kBases[] = {'A', 'C', 'G', 'T'};
    std::uniform_int_distribution<int> pick(0, 3);
    std::string sequence(length, 'A');
    for (auto& base : sequence) {
        base = kBases[pick(rng)];
    }
    return sequence;
}

// =============================================================================
// Waiting
// =============================================================================

/// @brief Poll @p condition until it holds or @p timeout elapses.
inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::seconds{10}) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return true;
}

}  // namespace railmr::test

#endif  // RAILMR_TESTS_TEST_SUPPORT_H
