// =============================================================================
// railmr - Partitioner Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <set>
#include <string>

#include "railmr/sort/partitioner.h"

namespace railmr::sort::test {

RC_GTEST_PROP(PartitionerProperty, HashIsStableAndInRange, (const std::string& key)) {
    const auto partitions = *rc::gen::inRange<PartitionIndex>(1, 64);
    HashPartitioner partitioner;
    auto first = partitioner.partition(key, partitions);
    RC_ASSERT(first < partitions);
    RC_ASSERT(partitioner.partition(key, partitions) == first);
}

RC_GTEST_PROP(PartitionerProperty, SharedKeyPrefixMeetsInOnePartition,
              (const std::string& prefix, const std::string& suffixA,
               const std::string& suffixB)) {
    RC_PRE(prefix.find('\t') == std::string::npos);
    KeyFieldPartitioner partitioner(1, 1);
    RC_ASSERT(partitioner.partition(prefix + "\t" + suffixA, 13) ==
              partitioner.partition(prefix + "\t" + suffixB, 13));
}

TEST(HashPartitionerTest, SpreadsKeys) {
    HashPartitioner partitioner;
    std::set<PartitionIndex> used;
    for (int i = 0; i < 200; ++i) {
        used.insert(partitioner.partition("key-" + std::to_string(i), 4));
    }
    EXPECT_EQ(used.size(), 4u);
}

TEST(KeyFieldPartitionerTest, SelectsFieldRange) {
    KeyFieldPartitioner second(2, 2);
    EXPECT_EQ(second.partitionKey("a\tb\tc"), "b");
    KeyFieldPartitioner tail(2, 0);
    EXPECT_EQ(tail.partitionKey("a\tb\tc"), "b\tc");
    KeyFieldPartitioner firstTwo(1, 2);
    EXPECT_EQ(firstTwo.partitionKey("a\tb\tc"), "a\tb");
    EXPECT_EQ(firstTwo.partitionKey("only"), "only");
    KeyFieldPartitioner missing(3, 3);
    EXPECT_EQ(missing.partitionKey("a\tb"), "");
}

TEST(RangePartitionerTest, TotalOrder) {
    RangePartitioner partitioner({"m", "g"});
    EXPECT_EQ(partitioner.partition("a", 3), 0u);
    EXPECT_EQ(partitioner.partition("g", 3), 1u);
    EXPECT_EQ(partitioner.partition("k", 3), 1u);
    EXPECT_EQ(partitioner.partition("m", 3), 2u);
    EXPECT_EQ(partitioner.partition("zzz", 3), 2u);
}

TEST(PartitionerSpecTest, ParseForms) {
    auto hash = PartitionerSpec::parse("hash");
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(hash->kind, PartitionerSpec::Kind::kHash);

    auto fields = PartitionerSpec::parse("key-fields=2");
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ(fields->kind, PartitionerSpec::Kind::kKeyFields);
    EXPECT_EQ(fields->firstField, 2u);
    EXPECT_EQ(fields->lastField, 2u);

    auto shorthand = PartitionerSpec::parse("k1,3");
    ASSERT_TRUE(shorthand.has_value());
    EXPECT_EQ(shorthand->lastField, 3u);
    EXPECT_EQ(shorthand->toString(), "key-fields=1,3");

    auto range = PartitionerSpec::parse("range=m,c");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->toString(), "range=c,m");
    EXPECT_EQ(PartitionerSpec::parse(range->toString()).value(), *range);
}

TEST(PartitionerSpecTest, RejectsBadSpecs) {
    EXPECT_FALSE(PartitionerSpec::parse("random").has_value());
    EXPECT_FALSE(PartitionerSpec::parse("key-fields=0").has_value());
    EXPECT_FALSE(PartitionerSpec::parse("key-fields=3,2").has_value());
    EXPECT_FALSE(PartitionerSpec::parse("key-fields=1,2,3").has_value());
    EXPECT_FALSE(PartitionerSpec::parse("range=a,a").has_value());
}

TEST(PartitionerSpecTest, RangeNeedsMatchingPartitionCount) {
    auto range = PartitionerSpec::parse("range=c,m").value();
    EXPECT_TRUE(range.validate(3).has_value());
    EXPECT_FALSE(range.validate(4).has_value());
    EXPECT_FALSE(PartitionerSpec{}.validate(0).has_value());
}

TEST(PartitionerSpecTest, CreateMatchesKind) {
    auto spec = PartitionerSpec::parse("key-fields=1").value();
    auto partitioner = spec.create();
    EXPECT_EQ(partitioner->partition("x\ty", 7), partitioner->partition("x\tz", 7));
}

}  // namespace railmr::sort::test
