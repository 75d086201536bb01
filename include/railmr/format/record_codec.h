// =============================================================================
// railmr - Record Stream Codec
// =============================================================================
// Line-oriented encoding of (key, value) records used for every inter-stage
// partition file, cache entry, task descriptor and status file.
//
// Wire format:
//   escape(key) TAB escape(value) LF
//   ...
//   #railmr-eof <record-count> <xxh64-hex> LF
//
// Escaping maps '\' -> "\\", TAB -> "\t", LF -> "\n", CR -> "\r"; every other
// byte is written verbatim, so keys and values may hold arbitrary bytes. The
// trailer holds no TAB and therefore cannot collide with a record line. Its
// checksum covers the encoded bytes of all record lines.
// =============================================================================

#ifndef RAILMR_FORMAT_RECORD_CODEC_H
#define RAILMR_FORMAT_RECORD_CODEC_H

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "railmr/common/error.h"
#include "railmr/common/types.h"

namespace railmr::format {

inline constexpr char kFieldSeparator = '\t';
inline constexpr char kRecordTerminator = '\n';
inline constexpr char kEscapeChar = '\\';
inline constexpr std::string_view kTrailerTag = "#railmr-eof";

// =============================================================================
// Field and Record Encoding
// =============================================================================

/// @brief Append the escaped form of @p field to @p out.
void appendEscaped(std::string& out, std::string_view field);

[[nodiscard]] std::string escapeField(std::string_view field);

/// @brief Reverse escapeField().
/// @throws FormatError on an unknown escape sequence or a dangling backslash.
[[nodiscard]] std::string unescapeField(std::string_view encoded);

/// @brief Append one encoded record line, including the terminator.
void appendRecord(std::string& out, const Record& record);

[[nodiscard]] std::string encodeRecord(const Record& record);

/// @brief Decode one record line (without its terminator).
/// @throws FormatError if the line has no field separator or bad escapes.
[[nodiscard]] Record decodeRecord(std::string_view line);

// =============================================================================
// RecordWriter
// =============================================================================

/// @brief Streams encoded records to an output stream and tracks the trailer checksum.
class RecordWriter {
public:
    explicit RecordWriter(std::ostream& out);
    ~RecordWriter();

    RecordWriter(const RecordWriter&) = delete;
    RecordWriter& operator=(const RecordWriter&) = delete;

    void write(const Record& record);

    void write(std::string_view key, std::string_view value);

    /// @brief Write the end-of-stream trailer. No records may follow.
    void writeTrailer();

    [[nodiscard]] std::uint64_t recordCount() const noexcept { return count_; }

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytes_; }

    /// @brief Checksum of everything written so far.
    [[nodiscard]] Checksum checksum() const;

private:
    void emit(std::string_view encoded);

    std::ostream* out_;
    void* hashState_ = nullptr;
    std::string line_;
    std::uint64_t count_ = 0;
    std::uint64_t bytes_ = 0;
    bool trailerWritten_ = false;
};

// =============================================================================
// RecordReader
// =============================================================================

struct RecordReaderOptions {
    /// @brief Fail with kCorruptedData when the stream ends without a trailer.
    bool requireTrailer = true;

    /// @brief Name used in diagnostics.
    std::string sourceName = "<stream>";
};

/// @brief Decodes records from an input stream and validates the trailer.
class RecordReader {
public:
    explicit RecordReader(std::istream& in, RecordReaderOptions options = {});
    ~RecordReader();

    RecordReader(const RecordReader&) = delete;
    RecordReader& operator=(const RecordReader&) = delete;

    /// @brief Read the next record.
    /// @return The record, or nullopt once the trailer (or end of input) is reached.
    /// @throws FormatError on malformed lines, truncation or checksum mismatch.
    [[nodiscard]] std::optional<Record> next();

    [[nodiscard]] std::uint64_t recordCount() const noexcept { return count_; }

    [[nodiscard]] bool sawTrailer() const noexcept { return sawTrailer_; }

private:
    void verifyTrailer(std::string_view line);

    [[noreturn]] void corrupted(std::string_view what) const;

    std::istream* in_;
    RecordReaderOptions options_;
    void* hashState_ = nullptr;
    std::string line_;
    std::uint64_t count_ = 0;
    std::uint64_t lineNumber_ = 0;
    bool sawTrailer_ = false;
    bool finished_ = false;
};

}  // namespace railmr::format

#endif  // RAILMR_FORMAT_RECORD_CODEC_H
