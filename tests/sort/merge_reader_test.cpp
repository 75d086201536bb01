// =============================================================================
// railmr - External Merge Tests
// =============================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "railmr/format/partition_file.h"
#include "railmr/sort/merge_reader.h"
#include "test_support.h"

namespace railmr::sort::test {

using railmr::test::TempDir;

namespace {

std::vector<std::unique_ptr<RecordSource>> sources(std::vector<std::vector<Record>> inputs) {
    std::vector<std::unique_ptr<RecordSource>> result;
    for (auto& input : inputs) {
        result.push_back(std::make_unique<VectorSource>(std::move(input)));
    }
    return result;
}

std::vector<Record> drain(RecordSource& source) {
    std::vector<Record> records;
    while (auto record = source.next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

}  // namespace

TEST(MergeReaderTest, MergesSortedSources) {
    MergeReader merge(sources({{{"a", "0"}, {"d", "0"}}, {{"b", "1"}, {"c", "1"}}, {}}));
    auto merged = drain(merge);
    std::vector<Record> expected{{"a", "0"}, {"b", "1"}, {"c", "1"}, {"d", "0"}};
    EXPECT_EQ(merged, expected);
    EXPECT_EQ(merge.recordsRead(), 4u);
}

TEST(MergeReaderTest, EqualKeysKeepSourceThenArrivalOrder) {
    MergeReader merge(sources({{{"k", "t0-first"}, {"k", "t0-second"}},
                               {{"k", "t1-first"}},
                               {{"j", "t2"}, {"k", "t2-first"}}}));
    auto merged = drain(merge);
    ASSERT_EQ(merged.size(), 5u);
    EXPECT_EQ(merged[0].value, "t2");
    EXPECT_EQ(merged[1].value, "t0-first");
    EXPECT_EQ(merged[2].value, "t0-second");
    EXPECT_EQ(merged[3].value, "t1-first");
    EXPECT_EQ(merged[4].value, "t2-first");
}

TEST(MergeReaderTest, UnsortedSourceIsCorruption) {
    MergeReader merge(sources({{{"b", "1"}, {"a", "2"}}}));
    try {
        (void)drain(merge);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kCorruptedData);
    }
}

TEST(MergeReaderTest, MergesPublishedPartitionFiles) {
    TempDir dir;
    format::writeRecordFile(dir / "from-00000.rec", std::vector<Record>{{"a", "x"}, {"c", "x"}});
    format::writeRecordFile(dir / "from-00001.rec", std::vector<Record>{{"b", "y"}});

    MergeReader merge(openFileSources({dir / "from-00000.rec", dir / "from-00001.rec"}));
    auto merged = drain(merge);
    ASSERT_EQ(merged.size(), 3u);
    EXPECT_EQ(merged[1], (Record{"b", "y"}));
}

TEST(MergeReaderTest, MissingPartitionFileIsMissingInput) {
    TempDir dir;
    format::writeRecordFile(dir / "from-00000.rec", std::vector<Record>{{"a", "x"}});
    try {
        (void)openFileSources({dir / "from-00000.rec", dir / "from-00001.rec"});
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kMissingInput);
        EXPECT_NE(std::string(e.what()).find("from-00001.rec"), std::string::npos);
    }
}

TEST(GroupReaderTest, GroupsConsecutiveKeys) {
    VectorSource source({{"a", "1"}, {"a", "2"}, {"b", "3"}, {"c", "4"}, {"c", "5"}});
    GroupReader groups(source);

    auto first = groups.nextGroup();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->key, "a");
    EXPECT_EQ(first->values, (std::vector<std::string>{"1", "2"}));

    auto second = groups.nextGroup();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->values.size(), 1u);

    auto third = groups.nextGroup();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->key, "c");
    EXPECT_FALSE(groups.nextGroup().has_value());
}

TEST(GroupReaderTest, EmptyKeyIsAGroup) {
    VectorSource source({{"", "x"}, {"", "y"}});
    GroupReader groups(source);
    auto group = groups.nextGroup();
    ASSERT_TRUE(group.has_value());
    EXPECT_EQ(group->key, "");
    EXPECT_EQ(group->values.size(), 2u);
    EXPECT_FALSE(groups.nextGroup().has_value());
}

}  // namespace railmr::sort::test
