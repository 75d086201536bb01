// =============================================================================
// railmr - Partition Files
// =============================================================================
// Durable, atomically published record files on shared storage.
//
// PartitionWriter writes to a unique temporary sibling of the destination,
// appends the codec trailer, fsyncs and renames into place on commit(). A
// writer destroyed without commit() removes its temporary file, so a cancelled
// or crashed task never leaves a visible partial partition.
//
// PartitionReader opens a published file (decompressing transparently) and
// validates the trailer, reporting truncation or corruption as kCorruptedData
// and absence as kMissingInput.
// =============================================================================

#ifndef RAILMR_FORMAT_PARTITION_FILE_H
#define RAILMR_FORMAT_PARTITION_FILE_H

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "railmr/common/error.h"
#include "railmr/common/types.h"
#include "railmr/format/record_codec.h"

namespace railmr::io {
class CompressedOutputStream;
}  // namespace railmr::io

namespace railmr::format {

struct PartitionWriterOptions {
    Compression compression = Compression::kNone;
    int compressionLevel = kDefaultCompressionLevel;

    /// @brief fsync the file and its directory before publishing.
    bool durable = true;

    /// @brief Replace an existing destination (false makes commit() fail with kFileExists).
    bool overwrite = true;
};

/// @brief Writer publishing one record file atomically.
class PartitionWriter {
public:
    /// @throws IOError if the temporary file cannot be created.
    explicit PartitionWriter(std::filesystem::path finalPath, PartitionWriterOptions options = {});

    ~PartitionWriter();

    PartitionWriter(const PartitionWriter&) = delete;
    PartitionWriter& operator=(const PartitionWriter&) = delete;

    void write(const Record& record);

    void write(std::string_view key, std::string_view value);

    /// @brief Finish the stream, make it durable and rename it into place.
    /// @throws IOError on any failure; the temporary file is removed.
    void commit();

    /// @brief Discard the temporary file. Safe to call repeatedly.
    void abort() noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return finalPath_; }

    [[nodiscard]] const std::filesystem::path& tempPath() const noexcept { return tempPath_; }

    [[nodiscard]] std::uint64_t recordCount() const noexcept;

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept;

    /// @brief Size of the published file as stored. Zero before commit().
    [[nodiscard]] std::uint64_t fileSize() const noexcept { return fileSize_; }

    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    std::filesystem::path finalPath_;
    std::filesystem::path tempPath_;
    PartitionWriterOptions options_;
    std::unique_ptr<io::CompressedOutputStream> stream_;
    std::unique_ptr<RecordWriter> writer_;
    std::uint64_t fileSize_ = 0;
    bool committed_ = false;
    bool aborted_ = false;
};

/// @brief Reader over one published record file.
class PartitionReader {
public:
    /// @throws IOError(kMissingInput) if the file does not exist.
    explicit PartitionReader(const std::filesystem::path& path, bool requireTrailer = true);

    ~PartitionReader();

    PartitionReader(const PartitionReader&) = delete;
    PartitionReader& operator=(const PartitionReader&) = delete;

    [[nodiscard]] std::optional<Record> next();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::uint64_t recordCount() const noexcept { return reader_->recordCount(); }

private:
    std::filesystem::path path_;
    std::unique_ptr<std::istream> stream_;
    std::unique_ptr<RecordReader> reader_;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/// @brief Write all records to @p path atomically.
void writeRecordFile(const std::filesystem::path& path, std::span<const Record> records,
                     const PartitionWriterOptions& options = {});

/// @brief Read every record of a published file.
[[nodiscard]] std::vector<Record> readRecordFile(const std::filesystem::path& path);

/// @brief Read and validate a whole file without keeping its records.
/// @return Record count, or the error that made the file unusable.
[[nodiscard]] Result<std::uint64_t> verifyRecordFile(const std::filesystem::path& path);

/// @brief Combined stored size of @p paths, from file metadata only.
/// @return Byte count, or kMissingInput naming the first absent file.
[[nodiscard]] Result<std::uint64_t> publishedBytes(
    std::span<const std::filesystem::path> paths);

/// @brief Temporary sibling path unique to this process, thread and call.
[[nodiscard]] std::filesystem::path uniqueTempPath(const std::filesystem::path& finalPath);

/// @brief fsync a file or directory.
/// @throws IOError on failure.
void syncPath(const std::filesystem::path& path);

}  // namespace railmr::format

#endif  // RAILMR_FORMAT_PARTITION_FILE_H
