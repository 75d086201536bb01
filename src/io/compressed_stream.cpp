// =============================================================================
// railmr - Compressed Stream Implementation
// =============================================================================
// zlib (gzip), libbz2 (bzip2), liblzma (xz) and libzstd (zstd) codecs behind a
// common Decoder/Encoder interface.
// =============================================================================

#include "railmr/io/compressed_stream.h"

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>
#include <zstd.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <sstream>

#include <fmt/format.h>

#include "railmr/common/logger.h"

namespace railmr::io {

namespace {

// Gzip magic: 0x1f 0x8b
constexpr std::uint8_t kGzipMagic[] = {0x1f, 0x8b};

// Bzip2 magic: 'B' 'Z' 'h'
constexpr std::uint8_t kBzip2Magic[] = {0x42, 0x5a, 0x68};

// XZ magic: 0xfd '7' 'z' 'X' 'Z' 0x00
constexpr std::uint8_t kXzMagic[] = {0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00};

// Zstd magic: 0x28 0xb5 0x2f 0xfd
constexpr std::uint8_t kZstdMagic[] = {0x28, 0xb5, 0x2f, 0xfd};

template <std::size_t N>
bool hasMagic(std::span<const std::uint8_t> data, const std::uint8_t (&magic)[N]) {
    return data.size() >= N && std::memcmp(data.data(), magic, N) == 0;
}

[[noreturn]] void throwDecodeError(CompressionFormat format, std::string_view detail) {
    throw FormatError(ErrorCode::kDecompressionFailed,
                      fmt::format("{} decompression failed: {}", compressionFormatName(format),
                                  detail),
                      ErrorContext{});
}

[[noreturn]] void throwEncodeError(CompressionFormat format, std::string_view detail) {
    throw IOError(fmt::format("{} compression failed: {}", compressionFormatName(format), detail));
}

/// @brief Input stream owning both its source and its decompressing buffer.
class OwningInputStream : public std::istream {
public:
    OwningInputStream(std::unique_ptr<std::istream> source, CompressionFormat format)
        : std::istream(nullptr), source_(std::move(source)) {
        buf_ = std::make_unique<DecompressingStreamBuf>(*source_, format);
        rdbuf(buf_.get());
    }

private:
    std::unique_ptr<std::istream> source_;
    std::unique_ptr<DecompressingStreamBuf> buf_;
};

}  // namespace

// =============================================================================
// Format Detection
// =============================================================================

CompressionFormat detectCompressionFormat(std::span<const std::uint8_t> data) {
    if (hasMagic(data, kGzipMagic)) {
        return CompressionFormat::kGzip;
    }
    if (hasMagic(data, kBzip2Magic)) {
        return CompressionFormat::kBzip2;
    }
    if (hasMagic(data, kXzMagic)) {
        return CompressionFormat::kXz;
    }
    if (hasMagic(data, kZstdMagic)) {
        return CompressionFormat::kZstd;
    }
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kBzip2:
            return "bzip2";
        case CompressionFormat::kXz:
            return "xz";
        case CompressionFormat::kZstd:
            return "zstd";
        case CompressionFormat::kNone:
            return "none";
        default:
            return "unknown";
    }
}

CompressionFormat toCompressionFormat(Compression compression) noexcept {
    switch (compression) {
        case Compression::kGzip:
            return CompressionFormat::kGzip;
        case Compression::kZstd:
            return CompressionFormat::kZstd;
        case Compression::kNone:
            return CompressionFormat::kNone;
    }
    return CompressionFormat::kNone;
}

// =============================================================================
// Decoders
// =============================================================================

class DecompressingStreamBuf::Decoder {
public:
    struct Step {
        std::size_t consumed = 0;
        std::size_t produced = 0;
        bool memberEnd = false;
    };

    virtual ~Decoder() = default;

    virtual Step decode(const std::uint8_t* in, std::size_t inLen, char* out,
                        std::size_t outLen, bool inputDone) = 0;

    /// @brief Prepare for the next concatenated member.
    virtual void reset() = 0;
};

namespace {

class GzipDecoder final : public DecompressingStreamBuf::Decoder {
public:
    GzipDecoder() {
        std::memset(&stream_, 0, sizeof(stream_));
        // 16 + MAX_WBITS selects the gzip wrapper
        int ret = inflateInit2(&stream_, 16 + MAX_WBITS);
        if (ret != Z_OK) {
            throwDecodeError(CompressionFormat::kGzip, zError(ret));
        }
    }

    ~GzipDecoder() override { inflateEnd(&stream_); }

    Step decode(const std::uint8_t* in, std::size_t inLen, char* out, std::size_t outLen,
                bool /*inputDone*/) override {
        stream_.next_in = const_cast<Bytef*>(in);
        stream_.avail_in = static_cast<uInt>(inLen);
        stream_.next_out = reinterpret_cast<Bytef*>(out);
        stream_.avail_out = static_cast<uInt>(outLen);

        int ret = inflate(&stream_, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
            throwDecodeError(CompressionFormat::kGzip, stream_.msg ? stream_.msg : zError(ret));
        }
        return {inLen - stream_.avail_in, outLen - stream_.avail_out, ret == Z_STREAM_END};
    }

    void reset() override { inflateReset(&stream_); }

private:
    z_stream stream_;
};

class Bzip2Decoder final : public DecompressingStreamBuf::Decoder {
public:
    Bzip2Decoder() { init(); }

    ~Bzip2Decoder() override { BZ2_bzDecompressEnd(&stream_); }

    Step decode(const std::uint8_t* in, std::size_t inLen, char* out, std::size_t outLen,
                bool /*inputDone*/) override {
        stream_.next_in = const_cast<char*>(reinterpret_cast<const char*>(in));
        stream_.avail_in = static_cast<unsigned int>(inLen);
        stream_.next_out = out;
        stream_.avail_out = static_cast<unsigned int>(outLen);

        int ret = BZ2_bzDecompress(&stream_);
        if (ret != BZ_OK && ret != BZ_STREAM_END) {
            throwDecodeError(CompressionFormat::kBzip2, fmt::format("libbz2 error {}", ret));
        }
        return {inLen - stream_.avail_in, outLen - stream_.avail_out, ret == BZ_STREAM_END};
    }

    void reset() override {
        BZ2_bzDecompressEnd(&stream_);
        init();
    }

private:
    void init() {
        std::memset(&stream_, 0, sizeof(stream_));
        int ret = BZ2_bzDecompressInit(&stream_, 0, 0);
        if (ret != BZ_OK) {
            throwDecodeError(CompressionFormat::kBzip2, fmt::format("init error {}", ret));
        }
    }

    bz_stream stream_;
};

class XzDecoder final : public DecompressingStreamBuf::Decoder {
public:
    XzDecoder() {
        lzma_ret ret = lzma_stream_decoder(&stream_, UINT64_MAX, LZMA_CONCATENATED);
        if (ret != LZMA_OK) {
            throwDecodeError(CompressionFormat::kXz,
                             fmt::format("init error {}", static_cast<int>(ret)));
        }
    }

    ~XzDecoder() override { lzma_end(&stream_); }

    Step decode(const std::uint8_t* in, std::size_t inLen, char* out, std::size_t outLen,
                bool inputDone) override {
        stream_.next_in = in;
        stream_.avail_in = inLen;
        stream_.next_out = reinterpret_cast<std::uint8_t*>(out);
        stream_.avail_out = outLen;

        lzma_ret ret = lzma_code(&stream_, inputDone ? LZMA_FINISH : LZMA_RUN);
        if (ret != LZMA_OK && ret != LZMA_STREAM_END && ret != LZMA_BUF_ERROR) {
            throwDecodeError(CompressionFormat::kXz,
                             fmt::format("liblzma error {}", static_cast<int>(ret)));
        }
        return {inLen - stream_.avail_in, outLen - stream_.avail_out, ret == LZMA_STREAM_END};
    }

    // LZMA_CONCATENATED handles member boundaries internally
    void reset() override {}

private:
    lzma_stream stream_ = LZMA_STREAM_INIT;
};

class ZstdDecoder final : public DecompressingStreamBuf::Decoder {
public:
    ZstdDecoder() : dctx_(ZSTD_createDCtx()) {
        if (dctx_ == nullptr) {
            throwDecodeError(CompressionFormat::kZstd, "cannot allocate context");
        }
    }

    ~ZstdDecoder() override { ZSTD_freeDCtx(dctx_); }

    Step decode(const std::uint8_t* in, std::size_t inLen, char* out, std::size_t outLen,
                bool /*inputDone*/) override {
        ZSTD_inBuffer input{in, inLen, 0};
        ZSTD_outBuffer output{out, outLen, 0};
        std::size_t ret = ZSTD_decompressStream(dctx_, &output, &input);
        if (ZSTD_isError(ret)) {
            throwDecodeError(CompressionFormat::kZstd, ZSTD_getErrorName(ret));
        }
        return {input.pos, output.pos, ret == 0};
    }

    void reset() override {}

private:
    ZSTD_DCtx* dctx_;
};

/// @brief Pass-through decoder for uncompressed data read through the same buffer.
class PlainDecoder final : public DecompressingStreamBuf::Decoder {
public:
    Step decode(const std::uint8_t* in, std::size_t inLen, char* out, std::size_t outLen,
                bool /*inputDone*/) override {
        std::size_t n = std::min(inLen, outLen);
        std::memcpy(out, in, n);
        return {n, n, true};
    }

    void reset() override {}
};

std::unique_ptr<DecompressingStreamBuf::Decoder> makeDecoder(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kNone:
            return std::make_unique<PlainDecoder>();
        case CompressionFormat::kGzip:
            return std::make_unique<GzipDecoder>();
        case CompressionFormat::kBzip2:
            return std::make_unique<Bzip2Decoder>();
        case CompressionFormat::kXz:
            return std::make_unique<XzDecoder>();
        case CompressionFormat::kZstd:
            return std::make_unique<ZstdDecoder>();
        default:
            throw FormatError(ErrorCode::kUnsupportedFormat, "Unknown compression format",
                              ErrorContext{});
    }
}

}  // namespace

// =============================================================================
// DecompressingStreamBuf Implementation
// =============================================================================

DecompressingStreamBuf::DecompressingStreamBuf(std::istream& source, CompressionFormat format,
                                               std::size_t bufferSize)
    : source_(&source),
      decoder_(makeDecoder(format)),
      inputBuffer_(bufferSize),
      outputBuffer_(bufferSize) {}

DecompressingStreamBuf::~DecompressingStreamBuf() = default;

void DecompressingStreamBuf::refill() {
    source_->read(reinterpret_cast<char*>(inputBuffer_.data()),
                  static_cast<std::streamsize>(inputBuffer_.size()));
    inputLen_ = static_cast<std::size_t>(source_->gcount());
    inputPos_ = 0;
    if (inputLen_ == 0) {
        sourceEof_ = true;
    }
}

DecompressingStreamBuf::int_type DecompressingStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    for (;;) {
        if (inputPos_ == inputLen_ && !sourceEof_) {
            refill();
        }
        const bool inputDone = sourceEof_ && inputPos_ == inputLen_;
        if (inputDone && atMemberBoundary_) {
            return traits_type::eof();
        }

        if (needsReset_ && !inputDone) {
            decoder_->reset();
            needsReset_ = false;
        }

        auto step = decoder_->decode(inputBuffer_.data() + inputPos_, inputLen_ - inputPos_,
                                     outputBuffer_.data(), outputBuffer_.size(), inputDone);
        inputPos_ += step.consumed;

        if (step.memberEnd) {
            atMemberBoundary_ = true;
            needsReset_ = true;
        } else if (step.consumed > 0 || step.produced > 0) {
            atMemberBoundary_ = false;
        }

        if (step.produced > 0) {
            setg(outputBuffer_.data(), outputBuffer_.data(),
                 outputBuffer_.data() + step.produced);
            return traits_type::to_int_type(*gptr());
        }

        if (step.consumed == 0 && !step.memberEnd) {
            if (inputDone) {
                throw FormatError(ErrorCode::kCorruptedData, "compressed stream is truncated",
                                  ErrorContext{});
            }
            if (inputPos_ < inputLen_) {
                throw FormatError(ErrorCode::kDecompressionFailed,
                                  "decoder made no progress", ErrorContext{});
            }
        }
    }
}

// =============================================================================
// Encoders
// =============================================================================

class CompressingStreamBuf::Encoder {
public:
    virtual ~Encoder() = default;

    virtual void write(const char* data, std::size_t len, std::ostream& sink) = 0;

    virtual void finish(std::ostream& sink) = 0;
};

namespace {

constexpr std::size_t kEncodeChunk = 64 * 1024;

class PlainEncoder final : public CompressingStreamBuf::Encoder {
public:
    void write(const char* data, std::size_t len, std::ostream& sink) override {
        sink.write(data, static_cast<std::streamsize>(len));
    }

    void finish(std::ostream& /*sink*/) override {}
};

class GzipEncoder final : public CompressingStreamBuf::Encoder {
public:
    explicit GzipEncoder(int level) : chunk_(kEncodeChunk) {
        std::memset(&stream_, 0, sizeof(stream_));
        int ret = deflateInit2(&stream_, std::clamp(level, 1, 9), Z_DEFLATED, 16 + MAX_WBITS, 8,
                               Z_DEFAULT_STRATEGY);
        if (ret != Z_OK) {
            throwEncodeError(CompressionFormat::kGzip, zError(ret));
        }
    }

    ~GzipEncoder() override { deflateEnd(&stream_); }

    void write(const char* data, std::size_t len, std::ostream& sink) override {
        stream_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
        stream_.avail_in = static_cast<uInt>(len);
        run(Z_NO_FLUSH, sink);
    }

    void finish(std::ostream& sink) override {
        stream_.next_in = nullptr;
        stream_.avail_in = 0;
        run(Z_FINISH, sink);
    }

private:
    void run(int flush, std::ostream& sink) {
        int ret = Z_OK;
        do {
            stream_.next_out = reinterpret_cast<Bytef*>(chunk_.data());
            stream_.avail_out = static_cast<uInt>(chunk_.size());
            ret = deflate(&stream_, flush);
            if (ret == Z_STREAM_ERROR) {
                throwEncodeError(CompressionFormat::kGzip, zError(ret));
            }
            sink.write(chunk_.data(),
                       static_cast<std::streamsize>(chunk_.size() - stream_.avail_out));
        } while (stream_.avail_out == 0 || (flush == Z_FINISH && ret != Z_STREAM_END));
    }

    z_stream stream_;
    std::vector<char> chunk_;
};

class ZstdEncoder final : public CompressingStreamBuf::Encoder {
public:
    explicit ZstdEncoder(int level) : cctx_(ZSTD_createCCtx()), chunk_(ZSTD_CStreamOutSize()) {
        if (cctx_ == nullptr) {
            throwEncodeError(CompressionFormat::kZstd, "cannot allocate context");
        }
        std::size_t ret = ZSTD_CCtx_setParameter(cctx_, ZSTD_c_compressionLevel, level);
        if (ZSTD_isError(ret)) {
            ZSTD_freeCCtx(cctx_);
            throwEncodeError(CompressionFormat::kZstd, ZSTD_getErrorName(ret));
        }
    }

    ~ZstdEncoder() override { ZSTD_freeCCtx(cctx_); }

    void write(const char* data, std::size_t len, std::ostream& sink) override {
        ZSTD_inBuffer input{data, len, 0};
        while (input.pos < input.size) {
            ZSTD_outBuffer output{chunk_.data(), chunk_.size(), 0};
            std::size_t ret = ZSTD_compressStream2(cctx_, &output, &input, ZSTD_e_continue);
            if (ZSTD_isError(ret)) {
                throwEncodeError(CompressionFormat::kZstd, ZSTD_getErrorName(ret));
            }
            sink.write(chunk_.data(), static_cast<std::streamsize>(output.pos));
        }
    }

    void finish(std::ostream& sink) override {
        ZSTD_inBuffer input{nullptr, 0, 0};
        std::size_t remaining = 0;
        do {
            ZSTD_outBuffer output{chunk_.data(), chunk_.size(), 0};
            remaining = ZSTD_compressStream2(cctx_, &output, &input, ZSTD_e_end);
            if (ZSTD_isError(remaining)) {
                throwEncodeError(CompressionFormat::kZstd, ZSTD_getErrorName(remaining));
            }
            sink.write(chunk_.data(), static_cast<std::streamsize>(output.pos));
        } while (remaining != 0);
    }

private:
    ZSTD_CCtx* cctx_;
    std::vector<char> chunk_;
};

std::unique_ptr<CompressingStreamBuf::Encoder> makeEncoder(CompressionFormat format, int level) {
    switch (format) {
        case CompressionFormat::kNone:
            return std::make_unique<PlainEncoder>();
        case CompressionFormat::kGzip:
            return std::make_unique<GzipEncoder>(level);
        case CompressionFormat::kZstd:
            return std::make_unique<ZstdEncoder>(level);
        default:
            throw FormatError(ErrorCode::kUnsupportedFormat,
                              fmt::format("Writing {} is not supported",
                                          compressionFormatName(format)),
                              ErrorContext{});
    }
}

}  // namespace

// =============================================================================
// CompressingStreamBuf Implementation
// =============================================================================

CompressingStreamBuf::CompressingStreamBuf(std::ostream& sink, CompressionFormat format,
                                           int level, std::size_t bufferSize)
    : sink_(&sink), encoder_(makeEncoder(format, level)), buffer_(bufferSize) {
    setp(buffer_.data(), buffer_.data() + buffer_.size());
}

CompressingStreamBuf::~CompressingStreamBuf() = default;

void CompressingStreamBuf::drain() {
    const auto pending = static_cast<std::size_t>(pptr() - pbase());
    if (pending > 0) {
        encoder_->write(pbase(), pending, *sink_);
    }
    setp(buffer_.data(), buffer_.data() + buffer_.size());
}

CompressingStreamBuf::int_type CompressingStreamBuf::overflow(int_type ch) {
    if (finished_) {
        return traits_type::eof();
    }
    drain();
    if (!traits_type::eq_int_type(ch, traits_type::eof())) {
        *pptr() = traits_type::to_char_type(ch);
        pbump(1);
    }
    return sink_->good() ? traits_type::not_eof(ch) : traits_type::eof();
}

int CompressingStreamBuf::sync() {
    if (!finished_) {
        drain();
    }
    sink_->flush();
    return sink_->good() ? 0 : -1;
}

void CompressingStreamBuf::finish() {
    if (finished_) {
        return;
    }
    drain();
    encoder_->finish(*sink_);
    sink_->flush();
    finished_ = true;
    if (!sink_->good()) {
        throw IOError("Failed to write compressed stream");
    }
}

// =============================================================================
// CompressedInputStream Implementation
// =============================================================================

CompressedInputStream::CompressedInputStream(const std::filesystem::path& path)
    : std::istream(nullptr) {
    if (!std::filesystem::exists(path)) {
        throw IOError(ErrorCode::kFileNotFound, "File not found", ErrorContext{path.string()});
    }
    fileStream_ = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!fileStream_->is_open()) {
        throw IOError("Failed to open file: " + path.string());
    }

    std::uint8_t magic[8];
    fileStream_->read(reinterpret_cast<char*>(magic), sizeof(magic));
    auto bytesRead = static_cast<std::size_t>(fileStream_->gcount());
    fileStream_->clear();
    fileStream_->seekg(0, std::ios::beg);

    format_ = detectCompressionFormat({magic, bytesRead});

    if (format_ == CompressionFormat::kNone) {
        rdbuf(fileStream_->rdbuf());
    } else {
        decompressBuf_ = std::make_unique<DecompressingStreamBuf>(*fileStream_, format_);
        rdbuf(decompressBuf_.get());
        RAILMR_LOG_TRACE("Opened {} compressed stream {}", compressionFormatName(format_),
                         path.string());
    }
}

CompressedInputStream::~CompressedInputStream() = default;

// =============================================================================
// CompressedOutputStream Implementation
// =============================================================================

CompressedOutputStream::CompressedOutputStream(const std::filesystem::path& path,
                                               CompressionFormat format, int level)
    : std::ostream(nullptr), path_(path) {
    fileStream_ = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc);
    if (!fileStream_->is_open()) {
        throw IOError("Failed to create file: " + path.string());
    }
    compressBuf_ = std::make_unique<CompressingStreamBuf>(*fileStream_, format, level);
    rdbuf(compressBuf_.get());
}

CompressedOutputStream::~CompressedOutputStream() = default;

void CompressedOutputStream::finish() {
    if (!good()) {
        throw IOError("Write failed: " + path_.string());
    }
    compressBuf_->finish();
    fileStream_->close();
    if (fileStream_->fail()) {
        throw IOError("Failed to close file: " + path_.string());
    }
}

// =============================================================================
// Factory Functions
// =============================================================================

std::unique_ptr<std::istream> openCompressedFile(const std::filesystem::path& path) {
    return std::make_unique<CompressedInputStream>(path);
}

std::unique_ptr<std::istream> openInputFile(const std::filesystem::path& path) {
    if (path != "-") {
        return openCompressedFile(path);
    }

    // stdin cannot seek back, so buffer it before sniffing the magic bytes
    auto buffered = std::make_unique<std::stringstream>();
    *buffered << std::cin.rdbuf();
    const std::string& head = buffered->str();
    std::span<const std::uint8_t> magic(reinterpret_cast<const std::uint8_t*>(head.data()),
                                        std::min<std::size_t>(head.size(), 8));
    auto format = detectCompressionFormat(magic);
    if (format == CompressionFormat::kNone) {
        return buffered;
    }
    return std::make_unique<OwningInputStream>(std::move(buffered), format);
}

}  // namespace railmr::io
