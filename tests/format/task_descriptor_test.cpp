// =============================================================================
// railmr - Task Descriptor Tests
// =============================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "railmr/format/partition_file.h"
#include "railmr/format/task_descriptor.h"
#include "test_support.h"

namespace railmr::format::test {

using namespace std::chrono_literals;
using railmr::test::TempDir;

namespace {

TaskSpec sampleSpec(const std::filesystem::path& root) {
    auto stage = stage::parseStageLine(
        "count reduce count_by_key partitions=3 key-fields=1,2 label=\"two words\"");
    EXPECT_TRUE(stage.has_value());

    TaskSpec spec;
    spec.runId = "run-7";
    spec.stageIndex = 1;
    spec.stage = *stage;
    spec.outputPartitions = 3;
    spec.taskIndex = 2;
    spec.attempt = 4;
    spec.inputFiles = {root / "stages/00-map/part-00002/from-00000.rec",
                       root / "stages/00-map/part-00002/from-00001.rec"};
    spec.outputDir = root / "stages/01-count";
    spec.cacheDir = root / "cache";
    spec.scratchDir = root / "scratch/01-00002-a4";
    spec.statusPath = root / "tasks/01-00002-a4.status";
    spec.compression = Compression::kZstd;
    spec.compressionLevel = 9;
    spec.sortBufferBytes = 1 << 20;
    spec.claimTimeout = 1500ms;
    spec.dedupEnabled = false;
    return spec;
}

}  // namespace

TEST(TaskSpecTest, SaveLoadPreservesEveryField) {
    TempDir dir;
    auto spec = sampleSpec(dir.path());
    auto path = dir / "tasks" / "01-00002-a4.task";
    spec.save(path);

    EXPECT_EQ(TaskSpec::load(path), spec);
}

TEST(TaskSpecTest, ManifestEntrySurvivesWithLineNumber) {
    TempDir dir;
    auto spec = sampleSpec(dir.path());
    spec.stageIndex = 0;
    spec.inputFiles.clear();
    auto entry = parseManifestLine("/data/r1.fq\t0\t/data/r2.fq\t0\tliver-1-1");
    ASSERT_TRUE(entry.has_value());
    entry->lineNumber = 12;
    spec.manifestEntry = *entry;

    auto loaded = TaskSpec::fromRecords(spec.toRecords());
    ASSERT_TRUE(loaded.manifestEntry.has_value());
    EXPECT_EQ(*loaded.manifestEntry, *entry);
    EXPECT_EQ(loaded, spec);
}

TEST(TaskSpecTest, OutputFilesFollowLayout) {
    TempDir dir;
    auto spec = sampleSpec(dir.path());
    auto outputs = spec.outputFiles();
    ASSERT_EQ(outputs.size(), 3u);
    EXPECT_EQ(outputs[1], spec.outputDir / "part-00001" / "from-00002.rec");
    EXPECT_EQ(spec.describe(), "count/2/a4");
}

TEST(TaskSpecTest, RejectsUnknownAndIncompleteDescriptors) {
    TempDir dir;
    auto records = sampleSpec(dir.path()).toRecords();

    auto unknown = records;
    unknown.push_back({"colour", "blue"});
    EXPECT_THROW((void)TaskSpec::fromRecords(unknown), FormatError);

    std::vector<Record> incomplete;
    for (const auto& record : records) {
        if (record.key != "stage") {
            incomplete.push_back(record);
        }
    }
    EXPECT_THROW((void)TaskSpec::fromRecords(incomplete), FormatError);

    auto badNumber = records;
    for (auto& record : badNumber) {
        if (record.key == "attempt") {
            record.value = "two";
        }
    }
    EXPECT_THROW((void)TaskSpec::fromRecords(badNumber), FormatError);
}

TEST(TaskSpecTest, MissingDescriptorIsMissingInput) {
    TempDir dir;
    try {
        (void)TaskSpec::load(dir / "nope.task");
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kMissingInput);
    }
}

TEST(TaskOutcomeTest, SaveLoadKeepsCountersAndReason) {
    TempDir dir;
    TaskCounters counters;
    counters.unitsProcessed = 10;
    counters.recordsRead = 11;
    counters.recordsWritten = 12;
    counters.bytesWritten = 13;
    counters.fileBytes = 9;
    counters.cache.hits = 8;
    counters.cache.misses = 2;
    counters.cache.accepted = 2;
    counters.elapsed = 345ms;

    auto outcome = TaskOutcome::failure(ErrorCode::kMissingInput, "lost\tinput\nfile", counters);
    outcome.save(dir / "a.status");
    auto loaded = TaskOutcome::load(dir / "a.status");

    EXPECT_EQ(loaded.state, TaskState::kFailed);
    EXPECT_EQ(loaded.code, ErrorCode::kMissingInput);
    EXPECT_EQ(loaded.reason, "lost\tinput\nfile");
    EXPECT_EQ(loaded.counters.unitsProcessed, 10u);
    EXPECT_EQ(loaded.counters.fileBytes, 9u);
    EXPECT_EQ(loaded.counters.cache.hits, 8u);
    EXPECT_EQ(loaded.counters.elapsed, 345ms);
}

TEST(TaskOutcomeTest, CancelledFailureHasCancelledState) {
    EXPECT_EQ(TaskOutcome::failure(ErrorCode::kCancelled, "stop").state, TaskState::kCancelled);
    EXPECT_TRUE(TaskOutcome::success({}).succeeded());
}

TEST(TaskCountersTest, Accumulate) {
    TaskCounters total;
    TaskCounters part;
    part.recordsRead = 5;
    part.cache.misses = 1;
    total += part;
    total += part;
    EXPECT_EQ(total.recordsRead, 10u);
    EXPECT_EQ(total.cache.misses, 2u);
}

}  // namespace railmr::format::test
