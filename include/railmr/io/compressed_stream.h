// =============================================================================
// railmr - Compressed Stream Support
// =============================================================================
// Transparent decompression of FASTQ inputs and partition files, and
// compression of intermediate partition files.
//
// This module provides:
// - Format detection from magic bytes (gzip, bzip2, xz, zstd)
// - DecompressingStreamBuf / CompressedInputStream for reading
// - CompressingStreamBuf / CompressedOutputStream for writing (gzip, zstd)
//
// Concatenated members (multi-member gzip, bzip2 and zstd frames, xz streams)
// are decoded as one continuous stream.
//
// Usage:
//   auto in = openInputFile("/data/sample_1.fastq.gz");
//   CompressedOutputStream out(path, CompressionFormat::kZstd, 3);
//   out << line; out.finish();
// =============================================================================

#ifndef RAILMR_IO_COMPRESSED_STREAM_H
#define RAILMR_IO_COMPRESSED_STREAM_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <span>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/common/error.h"
#include "railmr/common/types.h"

namespace railmr::io {

// =============================================================================
// Compression Format Detection
// =============================================================================

enum class CompressionFormat : std::uint8_t {
    kNone = 0,
    kGzip = 1,
    kBzip2 = 2,
    kXz = 3,
    kZstd = 4,
    kUnknown = 255
};

/// @brief Detect compression format from the first bytes of a file.
[[nodiscard]] CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data);

[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

/// @brief Map the intermediate compression setting onto a stream format.
[[nodiscard]] CompressionFormat toCompressionFormat(Compression compression) noexcept;

// =============================================================================
// DecompressingStreamBuf
// =============================================================================

/// @brief Input stream buffer decoding one compression format from a source stream.
class DecompressingStreamBuf : public std::streambuf {
public:
    /// @throws FormatError if the format cannot be decoded.
    DecompressingStreamBuf(std::istream& source, CompressionFormat format,
                           std::size_t bufferSize = 64 * 1024);

    ~DecompressingStreamBuf() override;

    DecompressingStreamBuf(const DecompressingStreamBuf&) = delete;
    DecompressingStreamBuf& operator=(const DecompressingStreamBuf&) = delete;

    /// @brief Decoder state for one format. Implemented per library.
    class Decoder;

protected:
    int_type underflow() override;

private:
    void refill();

    std::istream* source_;
    std::unique_ptr<Decoder> decoder_;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;
    std::size_t inputPos_ = 0;
    std::size_t inputLen_ = 0;
    bool sourceEof_ = false;

    /// @brief True between members, where end of input is a clean end of stream.
    bool atMemberBoundary_ = true;
    bool needsReset_ = false;
};

// =============================================================================
// CompressingStreamBuf
// =============================================================================

/// @brief Output stream buffer encoding into a sink stream.
class CompressingStreamBuf : public std::streambuf {
public:
    CompressingStreamBuf(std::ostream& sink, CompressionFormat format, int level,
                         std::size_t bufferSize = 64 * 1024);

    ~CompressingStreamBuf() override;

    CompressingStreamBuf(const CompressingStreamBuf&) = delete;
    CompressingStreamBuf& operator=(const CompressingStreamBuf&) = delete;

    /// @brief Flush buffered bytes and write the end-of-stream marker.
    /// @throws IOError if the sink fails.
    void finish();

    [[nodiscard]] bool finished() const noexcept { return finished_; }

    class Encoder;

protected:
    int_type overflow(int_type ch) override;
    int sync() override;

private:
    void drain();

    std::ostream* sink_;
    std::unique_ptr<Encoder> encoder_;
    std::vector<char> buffer_;
    bool finished_ = false;
};

// =============================================================================
// CompressedInputStream
// =============================================================================

/// @brief File input stream with transparent decompression.
class CompressedInputStream : public std::istream {
public:
    /// @throws IOError if the file cannot be opened.
    explicit CompressedInputStream(const std::filesystem::path& path);

    ~CompressedInputStream() override;

    CompressedInputStream(const CompressedInputStream&) = delete;
    CompressedInputStream& operator=(const CompressedInputStream&) = delete;

    [[nodiscard]] CompressionFormat format() const noexcept { return format_; }

private:
    std::unique_ptr<std::ifstream> fileStream_;
    std::unique_ptr<std::streambuf> decompressBuf_;
    CompressionFormat format_ = CompressionFormat::kUnknown;
};

// =============================================================================
// CompressedOutputStream
// =============================================================================

/// @brief File output stream with optional compression.
class CompressedOutputStream : public std::ostream {
public:
    /// @throws IOError if the file cannot be created.
    CompressedOutputStream(const std::filesystem::path& path, CompressionFormat format,
                           int level = kDefaultCompressionLevel);

    ~CompressedOutputStream() override;

    CompressedOutputStream(const CompressedOutputStream&) = delete;
    CompressedOutputStream& operator=(const CompressedOutputStream&) = delete;

    /// @brief Complete the compressed stream and close the file.
    /// @throws IOError on write failure.
    void finish();

private:
    std::filesystem::path path_;
    std::unique_ptr<std::ofstream> fileStream_;
    std::unique_ptr<CompressingStreamBuf> compressBuf_;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Open a file with automatic decompression.
/// @throws IOError if the file cannot be opened.
[[nodiscard]] std::unique_ptr<std::istream> openCompressedFile(const std::filesystem::path& path);

/// @brief Open a file or stdin ("-") with automatic decompression.
[[nodiscard]] std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path);

}  // namespace railmr::io

#endif  // RAILMR_IO_COMPRESSED_STREAM_H
