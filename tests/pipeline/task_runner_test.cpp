// =============================================================================
// railmr - Task Runner Tests
// =============================================================================

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "railmr/format/partition_file.h"
#include "railmr/format/storage_layout.h"
#include "railmr/pipeline/task_runner.h"
#include "test_support.h"

namespace railmr::pipeline::test {

using railmr::test::makeRead;
using railmr::test::readTextFile;
using railmr::test::TempDir;
using railmr::test::writeFastq;
using railmr::test::writeTextFile;

namespace {

class TaskRunnerTest : public ::testing::Test {
protected:
    format::TaskSpec specFor(const std::string& stageLine, StageIndex stageIndex,
                             TaskIndex task, PartitionIndex partitions) {
        format::TaskSpec spec;
        spec.runId = "test-run";
        spec.stageIndex = stageIndex;
        spec.stage = stage::parseStageLine(stageLine).value();
        spec.outputPartitions = partitions;
        spec.taskIndex = task;
        spec.outputDir = layout_.stageDir(stageIndex, spec.stage.name);
        spec.cacheDir = layout_.cacheDir();
        spec.scratchDir = layout_.taskScratchDir(stageIndex, task, 1);
        return spec;
    }

    format::ManifestEntry entryFor(const std::string& name,
                                   const std::vector<io::FastqRecord>& reads,
                                   const std::string& label) {
        auto path = dir_ / (name + ".fastq");
        writeFastq(path, reads);
        return format::parseManifestLine(path.string() + "\t0\t" + label).value();
    }

    std::vector<Record> readAllPartitions(const format::TaskSpec& spec) {
        std::vector<Record> records;
        for (const auto& file : spec.outputFiles()) {
            auto part = format::readRecordFile(file);
            records.insert(records.end(), part.begin(), part.end());
        }
        return records;
    }

    TempDir dir_;
    format::StorageLayout layout_{dir_.path(), "run"};
    stage::StageRegistry registry_ = stage::StageRegistry::withBuiltins();
    TaskRunner runner_{registry_};
    CancellationToken cancel_;
};

}  // namespace

TEST(ReadValueTest, LayoutOfFirstStageValues) {
    EXPECT_EQ(makeReadValue("liver-1-1", "r1", true, "IIJ"), "liver-1-1\tr1\t1\tIIJ");
}

TEST_F(TaskRunnerTest, IngestPairedEntryInLockstep) {
    writeFastq(dir_ / "a_1.fq", {makeRead("r1/1", "AAAA"), makeRead("r2/1", "CCCC")});
    writeFastq(dir_ / "a_2.fq", {makeRead("r1/2", "TTTT"), makeRead("r2/2", "GGGG")});
    auto entry = format::parseManifestLine((dir_ / "a_1.fq").string() + "\t0\t" +
                                           (dir_ / "a_2.fq").string() + "\t0\tg-1-1")
                     .value();

    std::vector<Record> records;
    auto reads = ingestManifestEntry(entry, [&](Record r) { records.push_back(std::move(r)); });
    ASSERT_EQ(reads, 4u);
    EXPECT_EQ(records[0].key, "AAAA");
    EXPECT_EQ(records[0].value, "g-1-1\tr1/1\t0\tIIII");
    EXPECT_EQ(records[1].key, "AAAA");
    EXPECT_EQ(records[1].value, "g-1-1\tr1/2\t1\tIIII");
    EXPECT_EQ(records[3].key, "CCCC");
}

TEST_F(TaskRunnerTest, UnevenMatesAreFormatError) {
    writeFastq(dir_ / "b_1.fq", {makeRead("r1", "AAAA"), makeRead("r2", "CCCC")});
    writeFastq(dir_ / "b_2.fq", {makeRead("r1", "TTTT")});
    auto entry = format::parseManifestLine((dir_ / "b_1.fq").string() + "\t0\t" +
                                           (dir_ / "b_2.fq").string() + "\t0\tg-1-1")
                     .value();
    EXPECT_THROW(ingestManifestEntry(entry, [](Record) {}), FormatError);
}

TEST_F(TaskRunnerTest, FirstStageMapPartitionsAndSorts) {
    auto spec = specFor("ingest map identity", 0, 0, 3);
    spec.manifestEntry = entryFor("s1", {makeRead("a", "GATTACA"), makeRead("b", "TTTTTTT"),
                                         makeRead("c", "CCCCAAA"), makeRead("d", "GATTACA")},
                                  "g-1-1");

    auto outcome = runner_.execute(spec, cancel_);
    ASSERT_TRUE(outcome.succeeded()) << outcome.reason;
    EXPECT_EQ(outcome.counters.recordsRead, 4u);
    EXPECT_EQ(outcome.counters.unitsProcessed, 4u);
    EXPECT_EQ(outcome.counters.recordsWritten, 4u);

    std::size_t total = 0;
    for (const auto& file : spec.outputFiles()) {
        auto records = format::readRecordFile(file);
        for (std::size_t i = 1; i < records.size(); ++i) {
            EXPECT_LE(records[i - 1].key, records[i].key);
        }
        total += records.size();
    }
    EXPECT_EQ(total, 4u);

    auto all = readAllPartitions(spec);
    bool sawCanonicalPolyA = false;
    for (const auto& record : all) {
        sawCanonicalPolyA = sawCanonicalPolyA || record.key == "AAAAAAA";
    }
    EXPECT_TRUE(sawCanonicalPolyA);
    EXPECT_FALSE(std::filesystem::exists(spec.scratchDir));
}

TEST_F(TaskRunnerTest, ReduceMergesUpstreamPartitionsByKey) {
    auto upstream = layout_.stageDir(0, "sig");
    format::writeRecordFile(format::StorageLayout::partitionFile(upstream, 0, 0),
                            std::vector<Record>{{"AT", "s1\t1"}, {"GC", "s1\t3"}});
    format::writeRecordFile(format::StorageLayout::partitionFile(upstream, 0, 1),
                            std::vector<Record>{{"AT", "s2\t1"}, {"AT", "s2\t7"}});

    auto spec = specFor("count reduce count_by_key", 1, 0, 1);
    spec.inputFiles = format::StorageLayout::partitionInputs(upstream, 0, 2);

    auto outcome = runner_.execute(spec, cancel_);
    ASSERT_TRUE(outcome.succeeded()) << outcome.reason;
    EXPECT_EQ(outcome.counters.recordsRead, 4u);
    EXPECT_EQ(outcome.counters.unitsProcessed, 2u);
    std::vector<Record> expected{{"AT", "3"}, {"GC", "1"}};
    EXPECT_EQ(readAllPartitions(spec), expected);
}

TEST_F(TaskRunnerTest, MissingUpstreamFileFailsWithoutPublishing) {
    auto upstream = layout_.stageDir(0, "sig");
    format::writeRecordFile(format::StorageLayout::partitionFile(upstream, 1, 0),
                            std::vector<Record>{{"AT", "x"}});

    auto spec = specFor("count reduce count_by_key", 1, 1, 2);
    spec.inputFiles = format::StorageLayout::partitionInputs(upstream, 1, 2);

    auto outcome = runner_.execute(spec, cancel_);
    EXPECT_EQ(outcome.state, TaskState::kFailed);
    EXPECT_EQ(outcome.code, ErrorCode::kMissingInput);
    EXPECT_NE(outcome.reason.find("from-00001.rec"), std::string::npos);
    for (const auto& file : spec.outputFiles()) {
        EXPECT_FALSE(std::filesystem::exists(file));
    }
}

TEST_F(TaskRunnerTest, TruncatedUpstreamFileIsCorruption) {
    auto upstream = layout_.stageDir(0, "sig");
    auto file = format::StorageLayout::partitionFile(upstream, 0, 0);
    format::writeRecordFile(file, std::vector<Record>{{"AT", "x"}, {"GC", "y"}});
    auto text = readTextFile(file);
    writeTextFile(file, text.substr(0, text.find("GC")));

    auto spec = specFor("count reduce count_by_key", 1, 0, 1);
    spec.inputFiles = {file};
    auto outcome = runner_.execute(spec, cancel_);
    EXPECT_EQ(outcome.code, ErrorCode::kCorruptedData);
}

TEST_F(TaskRunnerTest, ReplayingAnAttemptGivesIdenticalFiles) {
    auto spec = specFor("sig map sequence_signature partitions=2 k=3 w=2", 0, 0, 2);
    spec.manifestEntry = entryFor("s1", {makeRead("a", "GATTACAGATTACA"),
                                         makeRead("b", "CCGGTTAACCGG")},
                                  "g-1-1");
    spec.dedupEnabled = false;

    ASSERT_TRUE(runner_.execute(spec, cancel_).succeeded());
    std::vector<std::string> first;
    for (const auto& file : spec.outputFiles()) {
        first.push_back(readTextFile(file));
    }

    spec.attempt = 2;
    ASSERT_TRUE(runner_.execute(spec, cancel_).succeeded());
    for (std::size_t p = 0; p < first.size(); ++p) {
        EXPECT_EQ(readTextFile(spec.outputFiles()[p]), first[p]);
    }
}

TEST_F(TaskRunnerTest, DedupServesRepeatedSequencesFromCache) {
    auto spec = specFor("sig map sequence_signature dedup=yes k=3 w=2", 0, 0, 1);
    spec.manifestEntry = entryFor("s1", {makeRead("a", "GATTACAGG"), makeRead("b", "GATTACAGG"),
                                         makeRead("c", "CCTGTAATC"), makeRead("d", "TTTTGGGCC")},
                                  "g-1-1");

    auto outcome = runner_.execute(spec, cancel_);
    ASSERT_TRUE(outcome.succeeded()) << outcome.reason;
    EXPECT_EQ(outcome.counters.cache.misses, 2u);
    EXPECT_EQ(outcome.counters.cache.hits, 2u);

    auto withoutCache = specFor("sig map sequence_signature dedup=yes k=3 w=2", 0, 1, 1);
    withoutCache.manifestEntry = spec.manifestEntry;
    withoutCache.dedupEnabled = false;
    auto plain = runner_.execute(withoutCache, cancel_);
    ASSERT_TRUE(plain.succeeded());
    EXPECT_EQ(plain.counters.cache.hits + plain.counters.cache.misses, 0u);
    EXPECT_EQ(readAllPartitions(withoutCache), readAllPartitions(spec));
}

TEST_F(TaskRunnerTest, CancelledTaskPublishesNothing) {
    auto spec = specFor("ingest map identity", 0, 0, 2);
    spec.manifestEntry = entryFor("s1", {makeRead("a", "ACGT")}, "g-1-1");
    cancel_.cancel();

    auto outcome = runner_.execute(spec, cancel_);
    EXPECT_EQ(outcome.state, TaskState::kCancelled);
    EXPECT_EQ(outcome.code, ErrorCode::kCancelled);
    for (const auto& file : spec.outputFiles()) {
        EXPECT_FALSE(std::filesystem::exists(file));
    }
}

TEST_F(TaskRunnerTest, BadBodyParametersFailTheTask) {
    auto spec = specFor("sig map sequence_signature k=0", 0, 0, 1);
    spec.manifestEntry = entryFor("s1", {makeRead("a", "ACGT")}, "g-1-1");
    auto outcome = runner_.execute(spec, cancel_);
    EXPECT_EQ(outcome.state, TaskState::kFailed);
    EXPECT_EQ(outcome.code, ErrorCode::kConfigurationError);
}

}  // namespace railmr::pipeline::test
