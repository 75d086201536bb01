// =============================================================================
// railmr - FASTQ Parser Implementation
// =============================================================================

#include "railmr/io/fastq_parser.h"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "railmr/common/logger.h"
#include "railmr/io/compressed_stream.h"

namespace railmr::io {

namespace {

void trimRight(std::string& str) {
    auto it = std::find_if(str.rbegin(), str.rend(),
                           [](unsigned char c) { return !std::isspace(c); });
    str.erase(it.base(), str.end());
}

}  // namespace

FastqParser::FastqParser(std::filesystem::path filePath)
    : filePath_(std::move(filePath)), sourceName_(filePath_.string()) {}

FastqParser::FastqParser(std::unique_ptr<std::istream> stream, std::string sourceName)
    : sourceName_(std::move(sourceName)), stream_(std::move(stream)) {}

FastqParser::~FastqParser() { close(); }

FastqParser::FastqParser(FastqParser&&) noexcept = default;
FastqParser& FastqParser::operator=(FastqParser&&) noexcept = default;

void FastqParser::open() {
    if (stream_) {
        return;
    }
    stream_ = openInputFile(filePath_);
    eof_ = false;
    lineNumber_ = 0;
    recordCount_ = 0;
    RAILMR_LOG_DEBUG("Opened FASTQ input {}", sourceName_);
}

void FastqParser::close() noexcept {
    stream_.reset();
    eof_ = true;
}

bool FastqParser::readLine(std::string& line) {
    if (!stream_ || !std::getline(*stream_, line)) {
        if (stream_ && stream_->bad()) {
            throw IOError("Read failure", ErrorContext{sourceName_});
        }
        eof_ = true;
        return false;
    }
    ++lineNumber_;
    trimRight(line);
    return true;
}

void FastqParser::fail(std::string_view what) const {
    throw FormatError(fmt::format("Invalid FASTQ at line {}: {}", lineNumber_, what),
                      ErrorContext{sourceName_});
}

std::optional<FastqRecord> FastqParser::readRecord() {
    if (!stream_ || eof_) {
        return std::nullopt;
    }

    do {
        if (!readLine(header_)) {
            return std::nullopt;
        }
    } while (header_.empty());

    if (header_[0] != '@') {
        fail("expected '@' at start of header line");
    }

    FastqRecord record;
    std::string_view idView(header_);
    idView.remove_prefix(1);
    auto spacePos = idView.find_first_of(" \t");
    if (spacePos != std::string_view::npos) {
        record.id = std::string(idView.substr(0, spacePos));
        record.comment = std::string(idView.substr(spacePos + 1));
    } else {
        record.id = std::string(idView);
    }
    if (record.id.empty()) {
        fail("empty read name");
    }

    if (!readLine(record.sequence)) {
        fail("unexpected end of input, missing sequence line");
    }
    if (!std::all_of(record.sequence.begin(), record.sequence.end(), isValidBase)) {
        fail("invalid sequence characters");
    }
    std::transform(record.sequence.begin(), record.sequence.end(), record.sequence.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (!readLine(plus_)) {
        fail("unexpected end of input, missing '+' line");
    }
    if (plus_.empty() || plus_[0] != '+') {
        fail("expected '+' at start of separator line");
    }

    if (!readLine(record.quality)) {
        fail("unexpected end of input, missing quality line");
    }
    if (record.quality.size() != record.sequence.size()) {
        fail(fmt::format("quality length {} does not match sequence length {}",
                         record.quality.size(), record.sequence.size()));
    }
    if (!std::all_of(record.quality.begin(), record.quality.end(), isValidQuality)) {
        fail("invalid quality characters");
    }

    ++recordCount_;
    return record;
}

// =============================================================================
// Sequence Utilities
// =============================================================================

std::string reverseComplement(std::string_view sequence) {
    std::string result(sequence.size(), 'N');
    std::transform(sequence.rbegin(), sequence.rend(), result.begin(), complementBase);
    return result;
}

CanonicalRead canonicalize(std::string_view sequence, std::string_view quality) {
    std::string reversed = reverseComplement(sequence);
    if (reversed < sequence) {
        return {std::move(reversed), std::string(quality.rbegin(), quality.rend()), true};
    }
    return {std::string(sequence), std::string(quality), false};
}

}  // namespace railmr::io
