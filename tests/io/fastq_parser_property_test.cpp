// =============================================================================
// railmr - FASTQ Parser Property Tests
// =============================================================================
// Parsing formatted records yields the same records; canonical orientation is
// independent of the strand a read was sequenced from.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cctype>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "railmr/io/compressed_stream.h"
#include "railmr/io/fastq_parser.h"
#include "test_support.h"

namespace railmr::io::test {

using railmr::test::formatFastq;
using railmr::test::TempDir;

[[nodiscard]] FastqParser parserFor(const std::string& text) {
    return FastqParser(std::make_unique<std::istringstream>(text), "<memory>");
}

[[nodiscard]] std::vector<FastqRecord> parseAll(const std::string& text) {
    auto parser = parserFor(text);
    std::vector<FastqRecord> records;
    while (auto record = parser.readRecord()) {
        records.push_back(std::move(*record));
    }
    return records;
}

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

[[nodiscard]] rc::Gen<std::string> validSequence(std::size_t minLen, std::size_t maxLen) {
    return rc::gen::container<std::string>(rc::gen::inRange(minLen, maxLen + 1),
                                           rc::gen::element('A', 'C', 'G', 'T', 'N'));
}

[[nodiscard]] rc::Gen<std::string> validQuality(std::size_t length) {
    return rc::gen::container<std::string>(
        length, rc::gen::map(rc::gen::inRange(0, 42),
                             [](int phred) { return static_cast<char>('!' + phred); }));
}

[[nodiscard]] rc::Gen<std::string> validReadId() {
    return rc::gen::map(
        rc::gen::container<std::string>(
            rc::gen::inRange(1, 40),
            rc::gen::oneOf(rc::gen::inRange('a', 'z' + 1), rc::gen::inRange('A', 'Z' + 1),
                           rc::gen::inRange('0', '9' + 1), rc::gen::element('_', '-', ':', '.'))),
        [](std::string s) {
            if (std::isdigit(static_cast<unsigned char>(s[0]))) {
                s[0] = 'R';
            }
            return s;
        });
}

[[nodiscard]] rc::Gen<FastqRecord> validFastqRecord() {
    return rc::gen::mapcat(
        rc::gen::tuple(validReadId(), rc::gen::inRange<std::size_t>(1, 200)),
        [](const std::tuple<std::string, std::size_t>& args) {
            const auto& [id, length] = args;
            return rc::gen::map(
                rc::gen::tuple(validSequence(length, length), validQuality(length)),
                [id](const std::tuple<std::string, std::string>& body) {
                    FastqRecord record;
                    record.id = id;
                    record.sequence = std::get<0>(body);
                    record.quality = std::get<1>(body);
                    return record;
                });
        });
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(FastqParserProperty, ParseFormattedRecordsRoundTrip, ()) {
    auto records = *rc::gen::container<std::vector<FastqRecord>>(gen::validFastqRecord());
    auto parsed = parseAll(formatFastq(records));

    RC_ASSERT(parsed.size() == records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        RC_ASSERT(parsed[i].id == records[i].id);
        RC_ASSERT(parsed[i].sequence == records[i].sequence);
        RC_ASSERT(parsed[i].quality == records[i].quality);
    }
}

RC_GTEST_PROP(FastqParserProperty, CanonicalFormIgnoresStrand, ()) {
    auto sequence = *gen::validSequence(1, 150);
    auto quality = *gen::validQuality(sequence.size());

    auto forward = canonicalize(sequence, quality);
    auto reverse = canonicalize(reverseComplement(sequence),
                                std::string(quality.rbegin(), quality.rend()));

    RC_ASSERT(forward.sequence == reverse.sequence);
    if (sequence != reverseComplement(sequence)) {
        RC_ASSERT(forward.quality == reverse.quality);
    }
    RC_ASSERT(forward.sequence <= sequence);
    RC_ASSERT(forward.sequence <= reverseComplement(sequence));
}

RC_GTEST_PROP(FastqParserProperty, ReverseComplementIsAnInvolution, ()) {
    auto sequence = *gen::validSequence(0, 200);
    RC_ASSERT(reverseComplement(reverseComplement(sequence)) == sequence);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(FastqParserTest, CommentsAndLowerCase) {
    auto records = parseAll("@read1 extra words\nacgtn\n+read1\nIIIII\n\n@read2\nTT\n+\n##\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].id, "read1");
    EXPECT_EQ(records[0].comment, "extra words");
    EXPECT_EQ(records[0].sequence, "ACGTN");
    EXPECT_EQ(records[1].quality, "##");
}

TEST(FastqParserTest, CrLfLineEndings) {
    auto records = parseAll("@r\r\nACGT\r\n+\r\nIIII\r\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].sequence, "ACGT");
}

TEST(FastqParserTest, MalformedInputReportsLineNumber) {
    auto parser = parserFor("@r1\nACGT\n+\nIIII\n@r2\nACGT\n+\nIII\n");
    ASSERT_TRUE(parser.readRecord().has_value());
    try {
        (void)parser.readRecord();
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_NE(std::string(e.what()).find("line 8"), std::string::npos);
    }
}

TEST(FastqParserTest, RejectsBadHeaderAndBases) {
    EXPECT_THROW(parseAll("r1\nACGT\n+\nIIII\n"), FormatError);
    EXPECT_THROW(parseAll("@r1\nACXT\n+\nIIII\n"), FormatError);
    EXPECT_THROW(parseAll("@r1\nACGT\n-\nIIII\n"), FormatError);
    EXPECT_THROW(parseAll("@r1\nACGT\n+\n"), FormatError);
}

TEST(FastqParserTest, UpperCasesBasesAndChecksQuality) {
    auto records = parseAll("@a\nacgtN\n+\nIIIII\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].sequence, "ACGTN");

    EXPECT_THROW(parseAll("@a\nACGT\n+\nII I\n"), FormatError);
    EXPECT_THROW(parseAll(std::string("@a\nACGT\n+\nII\x7fI\n")), FormatError);
}

TEST(FastqParserTest, ReadsGzipInputTransparently) {
    TempDir dir;
    auto path = dir / "reads.fastq.gz";
    {
        CompressedOutputStream out(path, CompressionFormat::kGzip, 6);
        out << "@g1\nACGTACGT\n+\nIIIIIIII\n";
        out.finish();
    }

    FastqParser parser(path);
    parser.open();
    auto record = parser.readRecord();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, "g1");
    EXPECT_EQ(record->sequence, "ACGTACGT");
    EXPECT_FALSE(parser.readRecord().has_value());
    EXPECT_EQ(parser.recordCount(), 1u);
}

TEST(FastqParserTest, MissingFileIsIOError) {
    FastqParser parser("/nonexistent/railmr/reads.fastq");
    EXPECT_THROW(parser.open(), IOError);
}

TEST(CanonicalizeTest, ChoosesSmallerStrand) {
    auto canonical = canonicalize("TTTT", "ABCD");
    EXPECT_EQ(canonical.sequence, "AAAA");
    EXPECT_EQ(canonical.quality, "DCBA");
    EXPECT_TRUE(canonical.reversed);

    auto unchanged = canonicalize("AACC", "ABCD");
    EXPECT_EQ(unchanged.sequence, "AACC");
    EXPECT_FALSE(unchanged.reversed);
}

}  // namespace railmr::io::test
