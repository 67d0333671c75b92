#include <gtest/gtest.h>
#include "../../src/partition/shard_assembler.h"

using namespace Fleetshard;

TEST(ShardAssemblerTest, MergesReservedAndSortsNumerically) {
    ReservationMap reservations = {{0, {"1"}}, {1, {"200"}}};
    PoolPartition partition = PartitionPool({"1", "2", "3", "10", "200"}, {}, reservations, 2);

    Buckets distributed = {{"10", "2"}, {"3"}};
    auto assignment = AssembleShards(distributed, partition);

    ASSERT_EQ(assignment.shards.size(), 2u);
    EXPECT_EQ(assignment.shards[0], (Bucket{"1", "2", "10"}));
    EXPECT_EQ(assignment.shards[1], (Bucket{"3", "200"}));

    EXPECT_EQ(assignment.stats.total_fetched, 5u);
    EXPECT_EQ(assignment.stats.excluded_count, 0u);
    EXPECT_EQ(assignment.stats.reserved_count, 2u);
    EXPECT_EQ(assignment.stats.distributed_count, 3u);
    EXPECT_EQ(assignment.stats.shard_count, 2);
}

TEST(ShardAssemblerTest, MissingBucketsTreatedAsEmpty) {
    ReservationMap reservations = {{2, {"9"}}};
    PoolPartition partition = PartitionPool({"4", "9"}, {}, reservations, 3);

    auto assignment = AssembleShards(Buckets{Bucket{"4"}}, partition);
    ASSERT_EQ(assignment.shards.size(), 3u);
    EXPECT_EQ(assignment.shards[0], (Bucket{"4"}));
    EXPECT_TRUE(assignment.shards[1].empty());
    EXPECT_EQ(assignment.shards[2], (Bucket{"9"}));
}

TEST(ShardAssemblerTest, CountsExclusions) {
    PoolPartition partition = PartitionPool({"1", "2", "3"}, {"2"}, ReservationMap{}, 1);
    auto assignment = AssembleShards(Buckets{Bucket{"3", "1"}}, partition);
    EXPECT_EQ(assignment.shards[0], (Bucket{"1", "3"}));
    EXPECT_EQ(assignment.stats.excluded_count, 1u);
    EXPECT_EQ(assignment.stats.distributed_count, 2u);
}
