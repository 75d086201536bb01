// =============================================================================
// railmr - Partition Files Implementation
// =============================================================================

#include "railmr/format/partition_file.h"

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <system_error>
#include <thread>

#include <fmt/format.h>

#include "railmr/common/logger.h"
#include "railmr/io/compressed_stream.h"

namespace railmr::format {

namespace {

std::atomic<std::uint64_t> gTempCounter{0};

}  // namespace

std::filesystem::path uniqueTempPath(const std::filesystem::path& finalPath) {
    const auto threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());
    auto name = fmt::format(".{}.tmp-{}-{:x}-{}", finalPath.filename().string(), ::getpid(),
                            threadHash & 0xffffff, gTempCounter.fetch_add(1));
    return finalPath.parent_path() / name;
}

void syncPath(const std::filesystem::path& path) {
    int flags = O_RDONLY;
#ifdef O_DIRECTORY
    if (std::filesystem::is_directory(path)) {
        flags |= O_DIRECTORY;
    }
#endif
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        throw IOError("Cannot open for fsync", std::error_code(errno, std::generic_category()),
                      ErrorContext{path.string()});
    }
    int rc = ::fsync(fd);
    int savedErrno = errno;
    ::close(fd);
    // Some shared filesystems reject fsync on directories
    if (rc != 0 && savedErrno != EINVAL && savedErrno != EROFS) {
        throw IOError("fsync failed", std::error_code(savedErrno, std::generic_category()),
                      ErrorContext{path.string()});
    }
}

// =============================================================================
// PartitionWriter
// =============================================================================

PartitionWriter::PartitionWriter(std::filesystem::path finalPath, PartitionWriterOptions options)
    : finalPath_(std::move(finalPath)), options_(options) {
    std::error_code ec;
    std::filesystem::create_directories(finalPath_.parent_path(), ec);
    if (ec) {
        throw IOError("Cannot create partition directory", ec,
                      ErrorContext{finalPath_.parent_path().string()});
    }
    tempPath_ = uniqueTempPath(finalPath_);
    stream_ = std::make_unique<io::CompressedOutputStream>(
        tempPath_, io::toCompressionFormat(options_.compression), options_.compressionLevel);
    writer_ = std::make_unique<RecordWriter>(*stream_);
}

PartitionWriter::~PartitionWriter() {
    if (!committed_) {
        abort();
    }
}

void PartitionWriter::write(const Record& record) {
    write(record.key, record.value);
}

void PartitionWriter::write(std::string_view key, std::string_view value) {
    if (committed_ || aborted_) {
        throw IOError(ErrorCode::kInvalidState, "Partition writer is closed",
                      ErrorContext{finalPath_.string()});
    }
    writer_->write(key, value);
}

std::uint64_t PartitionWriter::recordCount() const noexcept {
    return writer_ ? writer_->recordCount() : 0;
}

std::uint64_t PartitionWriter::bytesWritten() const noexcept {
    return writer_ ? writer_->bytesWritten() : 0;
}

void PartitionWriter::commit() {
    if (committed_) {
        return;
    }
    if (aborted_) {
        throw IOError(ErrorCode::kInvalidState, "Cannot commit an aborted partition writer",
                      ErrorContext{finalPath_.string()});
    }

    try {
        writer_->writeTrailer();
        stream_->finish();
        if (options_.durable) {
            syncPath(tempPath_);
        }

        if (!options_.overwrite && std::filesystem::exists(finalPath_)) {
            throw IOError(ErrorCode::kFileExists, "Destination already exists",
                          ErrorContext{finalPath_.string()});
        }

        std::error_code ec;
        fileSize_ = std::filesystem::file_size(tempPath_, ec);
        if (ec) {
            throw IOError("Cannot size partition file", ec, ErrorContext{tempPath_.string()});
        }
        std::filesystem::rename(tempPath_, finalPath_, ec);
        if (ec) {
            throw IOError("Failed to publish partition file", ec,
                          ErrorContext{finalPath_.string()});
        }
        if (options_.durable) {
            syncPath(finalPath_.parent_path());
        }
    } catch (...) {
        abort();
        throw;
    }

    committed_ = true;
    RAILMR_LOG_TRACE("Published {} ({} records)", finalPath_.string(), writer_->recordCount());
}

void PartitionWriter::abort() noexcept {
    if (committed_ || aborted_) {
        return;
    }
    aborted_ = true;
    writer_.reset();
    stream_.reset();
    std::error_code ec;
    std::filesystem::remove(tempPath_, ec);
}

// =============================================================================
// PartitionReader
// =============================================================================

PartitionReader::PartitionReader(const std::filesystem::path& path, bool requireTrailer)
    : path_(path) {
    if (!std::filesystem::exists(path_)) {
        throw IOError(ErrorCode::kMissingInput, "Input partition is missing",
                      ErrorContext{path_.string()});
    }
    stream_ = io::openCompressedFile(path_);
    RecordReaderOptions options;
    options.requireTrailer = requireTrailer;
    options.sourceName = path_.string();
    reader_ = std::make_unique<RecordReader>(*stream_, std::move(options));
}

PartitionReader::~PartitionReader() = default;

std::optional<Record> PartitionReader::next() {
    return reader_->next();
}

// =============================================================================
// Convenience Functions
// =============================================================================

void writeRecordFile(const std::filesystem::path& path, std::span<const Record> records,
                     const PartitionWriterOptions& options) {
    PartitionWriter writer(path, options);
    for (const auto& record : records) {
        writer.write(record);
    }
    writer.commit();
}

std::vector<Record> readRecordFile(const std::filesystem::path& path) {
    PartitionReader reader(path);
    std::vector<Record> records;
    while (auto record = reader.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

Result<std::uint64_t> verifyRecordFile(const std::filesystem::path& path) {
    return tryExecute([&]() -> std::uint64_t {
        PartitionReader reader(path);
        while (reader.next()) {
        }
        return reader.recordCount();
    });
}

Result<std::uint64_t> publishedBytes(std::span<const std::filesystem::path> paths) {
    std::uint64_t total = 0;
    for (const auto& path : paths) {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return makeError<std::uint64_t>(ErrorCode::kMissingInput,
                                            fmt::format("Partition {} is not readable: {}",
                                                        path.string(), ec.message()));
        }
        total += size;
    }
    return total;
}

}  // namespace railmr::format
