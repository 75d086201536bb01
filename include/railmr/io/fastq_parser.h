// =============================================================================
// railmr - FASTQ Parser
// =============================================================================
// Streaming FASTQ parser used to ingest manifest entries into the first map
// stage. Inputs may be plain or compressed (see compressed_stream.h).
//
// This module provides:
// - FastqRecord: one read (id, comment, sequence, quality)
// - FastqParser: record-at-a-time reader with line-numbered diagnostics
// - Sequence helpers: reverse complement and canonical orientation
// =============================================================================

#ifndef RAILMR_IO_FASTQ_PARSER_H
#define RAILMR_IO_FASTQ_PARSER_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/common/error.h"

namespace railmr::io {

/// @brief A single FASTQ record.
struct FastqRecord {
    /// @brief Read name (without '@', up to the first space).
    std::string id;

    /// @brief Text after the first space of the header line, if any.
    std::string comment;

    std::string sequence;
    std::string quality;

    [[nodiscard]] std::size_t length() const noexcept { return sequence.size(); }

    void clear() noexcept {
        id.clear();
        comment.clear();
        sequence.clear();
        quality.clear();
    }
};

/// @brief Streaming FASTQ parser. Not thread-safe.
///
/// Sequences must use ACGTN (any case) and are upper-cased as they are read.
/// Quality characters must be Phred+33 ('!'..'~').
class FastqParser {
public:
    /// @brief Construct a parser for a file (or "-" for stdin).
    explicit FastqParser(std::filesystem::path filePath);

    /// @brief Construct a parser over an already opened stream.
    FastqParser(std::unique_ptr<std::istream> stream, std::string sourceName);

    ~FastqParser();

    FastqParser(const FastqParser&) = delete;
    FastqParser& operator=(const FastqParser&) = delete;
    FastqParser(FastqParser&&) noexcept;
    FastqParser& operator=(FastqParser&&) noexcept;

    /// @brief Open the file, decompressing transparently.
    /// @throws IOError if the file cannot be opened.
    void open();

    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return stream_ != nullptr; }

    [[nodiscard]] bool eof() const noexcept { return eof_; }

    /// @brief Read the next record.
    /// @return The record, or nullopt at end of input.
    /// @throws FormatError on malformed input (message carries the line number).
    [[nodiscard]] std::optional<FastqRecord> readRecord();

    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }

    [[nodiscard]] std::uint64_t recordCount() const noexcept { return recordCount_; }

    [[nodiscard]] const std::string& sourceName() const noexcept { return sourceName_; }

private:
    bool readLine(std::string& line);

    [[noreturn]] void fail(std::string_view what) const;

    std::filesystem::path filePath_;
    std::string sourceName_;
    std::unique_ptr<std::istream> stream_;
    bool eof_ = false;
    std::uint64_t lineNumber_ = 0;
    std::uint64_t recordCount_ = 0;
    std::string header_;
    std::string plus_;
};

// =============================================================================
// Sequence Utilities
// =============================================================================

[[nodiscard]] constexpr bool isValidBase(char c) noexcept {
    return c == 'A' || c == 'C' || c == 'G' || c == 'T' || c == 'N' || c == 'a' || c == 'c' ||
           c == 'g' || c == 't' || c == 'n';
}

[[nodiscard]] constexpr bool isValidQuality(char c) noexcept {
    return c >= '!' && c <= '~';
}

[[nodiscard]] constexpr char complementBase(char c) noexcept {
    switch (c) {
        case 'A':
            return 'T';
        case 'C':
            return 'G';
        case 'G':
            return 'C';
        case 'T':
            return 'A';
        case 'a':
            return 't';
        case 'c':
            return 'g';
        case 'g':
            return 'c';
        case 't':
            return 'a';
        default:
            return 'N';
    }
}

/// @brief Reverse complement of a nucleotide sequence.
[[nodiscard]] std::string reverseComplement(std::string_view sequence);

/// @brief Result of orienting a read so identical molecules share one key.
struct CanonicalRead {
    std::string sequence;
    std::string quality;

    /// @brief True if the reverse complement was chosen.
    bool reversed = false;
};

/// @brief Choose the lexicographically smaller of a read and its reverse complement.
/// @note The quality string is reversed along with the sequence.
[[nodiscard]] CanonicalRead canonicalize(std::string_view sequence, std::string_view quality);

}  // namespace railmr::io

#endif  // RAILMR_IO_FASTQ_PARSER_H
