// =============================================================================
// railmr - Record Stream Codec Implementation
// =============================================================================

#include "railmr/format/record_codec.h"

#include <charconv>

#include <fmt/format.h>
#include <xxhash.h>

namespace railmr::format {

namespace {

XXH64_state_t* asState(void* state) {
    return static_cast<XXH64_state_t*>(state);
}

void* newHashState() {
    XXH64_state_t* state = XXH64_createState();
    if (state == nullptr) {
        throw std::bad_alloc();
    }
    XXH64_reset(state, 0);
    return state;
}

}  // namespace

// =============================================================================
// Field and Record Encoding
// =============================================================================

void appendEscaped(std::string& out, std::string_view field) {
    for (char c : field) {
        switch (c) {
            case '\\':
                out += "\\\\";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out += c;
                break;
        }
    }
}

std::string escapeField(std::string_view field) {
    std::string out;
    out.reserve(field.size());
    appendEscaped(out, field);
    return out;
}

std::string unescapeField(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c != kEscapeChar) {
            out += c;
            continue;
        }
        if (i + 1 == encoded.size()) {
            throw FormatError("dangling escape character at end of field");
        }
        switch (encoded[++i]) {
            case '\\':
                out += '\\';
                break;
            case 't':
                out += '\t';
                break;
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            default:
                throw FormatError(fmt::format("unknown escape sequence '\\{}'", encoded[i]));
        }
    }
    return out;
}

void appendRecord(std::string& out, const Record& record) {
    appendEscaped(out, record.key);
    out += kFieldSeparator;
    appendEscaped(out, record.value);
    out += kRecordTerminator;
}

std::string encodeRecord(const Record& record) {
    std::string out;
    out.reserve(record.key.size() + record.value.size() + 2);
    appendRecord(out, record);
    return out;
}

Record decodeRecord(std::string_view line) {
    auto sep = line.find(kFieldSeparator);
    if (sep == std::string_view::npos) {
        throw FormatError("record line has no field separator");
    }
    return Record{unescapeField(line.substr(0, sep)), unescapeField(line.substr(sep + 1))};
}

// =============================================================================
// RecordWriter
// =============================================================================

RecordWriter::RecordWriter(std::ostream& out) : out_(&out), hashState_(newHashState()) {}

RecordWriter::~RecordWriter() {
    XXH64_freeState(asState(hashState_));
}

void RecordWriter::emit(std::string_view encoded) {
    out_->write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
    if (!*out_) {
        throw IOError("Failed to write record stream");
    }
    bytes_ += encoded.size();
}

void RecordWriter::write(const Record& record) {
    write(record.key, record.value);
}

void RecordWriter::write(std::string_view key, std::string_view value) {
    if (trailerWritten_) {
        throw FormatError(ErrorCode::kInvalidState, "record written after trailer",
                          ErrorContext{});
    }
    line_.clear();
    appendEscaped(line_, key);
    line_ += kFieldSeparator;
    appendEscaped(line_, value);
    line_ += kRecordTerminator;
    XXH64_update(asState(hashState_), line_.data(), line_.size());
    emit(line_);
    ++count_;
}

Checksum RecordWriter::checksum() const {
    return XXH64_digest(asState(hashState_));
}

void RecordWriter::writeTrailer() {
    if (trailerWritten_) {
        return;
    }
    emit(fmt::format("{} {} {:016x}\n", kTrailerTag, count_, checksum()));
    trailerWritten_ = true;
}

// =============================================================================
// RecordReader
// =============================================================================

RecordReader::RecordReader(std::istream& in, RecordReaderOptions options)
    : in_(&in), options_(std::move(options)), hashState_(newHashState()) {}

RecordReader::~RecordReader() {
    XXH64_freeState(asState(hashState_));
}

void RecordReader::corrupted(std::string_view what) const {
    throw FormatError(ErrorCode::kCorruptedData,
                      fmt::format("{} (after {} records, line {})", what, count_, lineNumber_),
                      ErrorContext{options_.sourceName});
}

std::optional<Record> RecordReader::next() {
    if (finished_) {
        return std::nullopt;
    }

    if (!std::getline(*in_, line_)) {
        if (in_->bad()) {
            throw IOError("Read failure", ErrorContext{options_.sourceName});
        }
        finished_ = true;
        if (options_.requireTrailer && !sawTrailer_) {
            corrupted("stream ended without trailer, partition is truncated");
        }
        return std::nullopt;
    }
    ++lineNumber_;

    if (in_->eof()) {
        // Every complete line ends with LF; a final line without one was cut short
        corrupted("last line is not terminated");
    }

    if (line_.find(kFieldSeparator) == std::string::npos) {
        verifyTrailer(line_);
        // Nothing may follow the trailer
        if (in_->peek() != std::char_traits<char>::eof()) {
            corrupted("data after trailer");
        }
        finished_ = true;
        return std::nullopt;
    }

    XXH64_update(asState(hashState_), line_.data(), line_.size());
    XXH64_update(asState(hashState_), &kRecordTerminator, 1);
    ++count_;

    try {
        return decodeRecord(line_);
    } catch (const FormatError& ex) {
        throw FormatError(fmt::format("{} at line {}", ex.message(), lineNumber_),
                          ErrorContext{options_.sourceName});
    }
}

void RecordReader::verifyTrailer(std::string_view line) {
    if (!line.starts_with(kTrailerTag)) {
        throw FormatError(fmt::format("record line has no field separator at line {}",
                                      lineNumber_),
                          ErrorContext{options_.sourceName});
    }
    std::string_view rest = line.substr(kTrailerTag.size());
    if (rest.empty() || rest.front() != ' ') {
        corrupted("malformed trailer");
    }
    rest.remove_prefix(1);
    auto space = rest.find(' ');
    if (space == std::string_view::npos) {
        corrupted("malformed trailer");
    }

    std::uint64_t expectedCount = 0;
    std::uint64_t expectedChecksum = 0;
    auto countText = rest.substr(0, space);
    auto sumText = rest.substr(space + 1);
    auto countResult =
        std::from_chars(countText.data(), countText.data() + countText.size(), expectedCount);
    auto sumResult =
        std::from_chars(sumText.data(), sumText.data() + sumText.size(), expectedChecksum, 16);
    if (countResult.ec != std::errc{} || countResult.ptr != countText.data() + countText.size() ||
        sumResult.ec != std::errc{} || sumResult.ptr != sumText.data() + sumText.size()) {
        corrupted("malformed trailer");
    }

    if (expectedCount != count_) {
        corrupted(fmt::format("trailer declares {} records but {} were read", expectedCount,
                              count_));
    }
    Checksum actual = XXH64_digest(asState(hashState_));
    if (actual != expectedChecksum) {
        corrupted(fmt::format("checksum mismatch: expected {:016x}, got {:016x}",
                              expectedChecksum, actual));
    }
    sawTrailer_ = true;
}

}  // namespace railmr::format
