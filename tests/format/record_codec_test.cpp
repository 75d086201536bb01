// =============================================================================
// railmr - Record Codec Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "railmr/format/record_codec.h"

namespace railmr::format::test {

namespace {

std::string encodeStream(const std::vector<Record>& records, bool withTrailer = true) {
    std::ostringstream out;
    RecordWriter writer(out);
    for (const auto& record : records) {
        writer.write(record);
    }
    if (withTrailer) {
        writer.writeTrailer();
    }
    return out.str();
}

std::vector<Record> decodeStream(const std::string& text, bool requireTrailer = true) {
    std::istringstream in(text);
    RecordReader reader(in, RecordReaderOptions{requireTrailer, "<test>"});
    std::vector<Record> records;
    while (auto record = reader.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

ErrorCode decodeError(const std::string& text) {
    try {
        (void)decodeStream(text);
    } catch (const FormatError& e) {
        return e.code();
    }
    return ErrorCode::kSuccess;
}

}  // namespace

RC_GTEST_PROP(RecordCodecProperty, ArbitraryBytesSurviveEscaping, (const std::string& field)) {
    auto escaped = escapeField(field);
    RC_ASSERT(escaped.find('\t') == std::string::npos);
    RC_ASSERT(escaped.find('\n') == std::string::npos);
    RC_ASSERT(unescapeField(escaped) == field);
}

TEST(RecordCodecTest, EscapesSeparatorsInsideFields) {
    Record record{"key\twith tab", "line1\nline2\\end\r"};
    auto encoded = encodeRecord(record);
    EXPECT_EQ(encoded, "key\\twith tab\tline1\\nline2\\\\end\\r\n");
    EXPECT_EQ(decodeRecord(encoded.substr(0, encoded.size() - 1)), record);
}

TEST(RecordCodecTest, RejectsBadEscapes) {
    EXPECT_THROW((void)unescapeField("abc\\"), FormatError);
    EXPECT_THROW((void)unescapeField("a\\qb"), FormatError);
    EXPECT_THROW((void)decodeRecord("no separator"), FormatError);
}

TEST(RecordStreamTest, TrailerCarriesCountAndChecksum) {
    std::vector<Record> records{{"a", "1"}, {"", ""}, {"b", "x\ty"}};
    auto text = encodeStream(records);

    EXPECT_NE(text.find("#railmr-eof 3 "), std::string::npos);
    EXPECT_EQ(decodeStream(text), records);
}

TEST(RecordStreamTest, EmptyStreamWithTrailerIsValid) {
    auto text = encodeStream({});
    EXPECT_TRUE(decodeStream(text).empty());
}

TEST(RecordStreamTest, MissingTrailerIsTruncation) {
    auto text = encodeStream({{"a", "1"}, {"b", "2"}}, false);
    EXPECT_EQ(decodeError(text), ErrorCode::kCorruptedData);
    EXPECT_EQ(decodeStream(text, false).size(), 2u);
}

TEST(RecordStreamTest, CutInsideALineIsTruncation) {
    auto text = encodeStream({{"alpha", "one"}, {"beta", "two"}});
    auto cut = text.substr(0, text.find("beta") + 2);
    EXPECT_EQ(decodeError(cut), ErrorCode::kCorruptedData);
}

TEST(RecordStreamTest, AlteredRecordFailsChecksum) {
    auto text = encodeStream({{"alpha", "one"}, {"beta", "two"}});
    text[text.find("one")] = 'O';
    EXPECT_EQ(decodeError(text), ErrorCode::kCorruptedData);
}

TEST(RecordStreamTest, WrongCountOrTrailingDataIsCorruption) {
    auto text = encodeStream({{"alpha", "one"}});
    auto dropped = text.substr(text.find('\n') + 1);
    EXPECT_EQ(decodeError(dropped), ErrorCode::kCorruptedData);

    EXPECT_EQ(decodeError(text + "extra\tline\n"), ErrorCode::kCorruptedData);
}

TEST(RecordStreamTest, WriteAfterTrailerIsRejected) {
    std::ostringstream out;
    RecordWriter writer(out);
    writer.write("k", "v");
    writer.writeTrailer();
    EXPECT_THROW(writer.write("k", "v"), FormatError);
    EXPECT_EQ(writer.recordCount(), 1u);
}

}  // namespace railmr::format::test
