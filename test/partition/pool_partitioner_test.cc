#include <gtest/gtest.h>
#include "../../src/partition/pool_partitioner.h"
#include "../../src/partition/partition_errors.h"

#include <algorithm>

using namespace Fleetshard;

class PoolPartitionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 1; i <= 10; ++i) {
            pool_.push_back(std::to_string(i));
        }
    }

    static bool Contains(const std::vector<std::string>& ids, const std::string& id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    }

    std::vector<std::string> pool_;
};

TEST_F(PoolPartitionerTest, NoExclusionsOrReservations) {
    auto result = PartitionPool(pool_, {}, {}, 3);
    EXPECT_EQ(result.filtered, pool_);
    EXPECT_EQ(result.distributable, pool_);
    EXPECT_EQ(result.total_fetched, 10u);
    EXPECT_EQ(result.excluded_count, 0u);
    EXPECT_EQ(result.reserved_count, 0u);
    EXPECT_EQ(result.distributable_count, 10u);
    EXPECT_EQ(result.shard_count(), 3);
    EXPECT_EQ(result.reserved_count_by_shard, (std::vector<int>{0, 0, 0}));
}

TEST_F(PoolPartitionerTest, ExclusionsRemovedKeepingOrder) {
    auto result = PartitionPool(pool_, {"3", "7", "404"}, {}, 2);
    EXPECT_EQ(result.filtered, (std::vector<std::string>{"1", "2", "4", "5", "6", "8", "9", "10"}));
    // Only IDs actually present in the pool count as excluded
    EXPECT_EQ(result.excluded_count, 2u);
    EXPECT_EQ(result.distributable_count, 8u);
}

TEST_F(PoolPartitionerTest, ReservationsPinnedAndRemoved) {
    ReservationMap reservations = {{0, {"2"}}, {2, {"5", "9"}}};
    auto result = PartitionPool(pool_, {}, reservations, 3);

    EXPECT_EQ(result.reserved_by_shard[0], (std::vector<std::string>{"2"}));
    EXPECT_TRUE(result.reserved_by_shard[1].empty());
    EXPECT_EQ(result.reserved_by_shard[2], (std::vector<std::string>{"5", "9"}));
    EXPECT_EQ(result.reserved_count_by_shard, (std::vector<int>{1, 0, 2}));
    EXPECT_EQ(result.reserved_count, 3u);
    EXPECT_EQ(result.distributable_count, 7u);
    EXPECT_FALSE(Contains(result.distributable, "2"));
    EXPECT_FALSE(Contains(result.distributable, "5"));
    EXPECT_FALSE(Contains(result.distributable, "9"));
    EXPECT_EQ(result.filtered.size(), 10u);
}

TEST_F(PoolPartitionerTest, ExclusionBeatsReservation) {
    ReservationMap reservations = {{1, {"4", "6"}}};
    auto result = PartitionPool(pool_, {"4"}, reservations, 2);

    EXPECT_EQ(result.reserved_by_shard[1], (std::vector<std::string>{"6"}));
    EXPECT_EQ(result.reserved_count, 1u);
    EXPECT_FALSE(Contains(result.filtered, "4"));
    EXPECT_FALSE(Contains(result.distributable, "4"));
}

TEST_F(PoolPartitionerTest, ReservedIdMissingFromPoolIsSkipped) {
    ReservationMap reservations = {{0, {"1", "12345"}}};
    auto result = PartitionPool(pool_, {}, reservations, 2);
    EXPECT_EQ(result.reserved_by_shard[0], (std::vector<std::string>{"1"}));
    EXPECT_EQ(result.reserved_count, 1u);
    EXPECT_EQ(result.distributable_count, 9u);
}

TEST_F(PoolPartitionerTest, RepeatWithinOneShardCollapses) {
    ReservationMap reservations = {{1, {"7", "7"}}};
    auto result = PartitionPool(pool_, {}, reservations, 2);
    EXPECT_EQ(result.reserved_by_shard[1], (std::vector<std::string>{"7"}));
    EXPECT_EQ(result.reserved_count_by_shard[1], 1);
    EXPECT_EQ(result.reserved_count, 1u);
}

TEST_F(PoolPartitionerTest, OutOfRangeShardThrows) {
    ReservationMap reservations = {{3, {"1"}}};
    try {
        PartitionPool(pool_, {}, reservations, 3);
        FAIL() << "expected InvalidReservationError";
    } catch (const InvalidReservationError& e) {
        EXPECT_EQ(e.shard_index(), 3);
        EXPECT_EQ(e.shard_count(), 3);
        std::string msg = e.what();
        EXPECT_NE(msg.find("\"shard_3\""), std::string::npos);
        EXPECT_NE(msg.find("shard_count=3"), std::string::npos);
        EXPECT_NE(msg.find("shard_0 to shard_2"), std::string::npos);
    }

    ReservationMap negative = {{-1, {"1"}}};
    EXPECT_THROW(PartitionPool(pool_, {}, negative, 3), InvalidReservationError);
}

TEST_F(PoolPartitionerTest, OutOfRangeChecksEvenForAbsentIds) {
    ReservationMap reservations = {{5, {"99999"}}};
    EXPECT_THROW(PartitionPool(pool_, {}, reservations, 2), InvalidReservationError);
}

TEST_F(PoolPartitionerTest, DuplicateAcrossShardsThrows) {
    ReservationMap reservations = {{2, {"7"}}, {0, {"7"}}};
    try {
        PartitionPool(pool_, {}, reservations, 3);
        FAIL() << "expected DuplicateReservationError";
    } catch (const DuplicateReservationError& e) {
        EXPECT_EQ(e.id(), "7");
        EXPECT_EQ(e.first_shard(), 0);
        EXPECT_EQ(e.second_shard(), 2);
        std::string msg = e.what();
        EXPECT_NE(msg.find("\"7\""), std::string::npos);
        EXPECT_NE(msg.find("\"shard_0\" and \"shard_2\""), std::string::npos);
    }
}

TEST_F(PoolPartitionerTest, ErrorsAreCatchableAsPartitionError) {
    ReservationMap reservations = {{0, {"1"}}, {1, {"1"}}};
    EXPECT_THROW(PartitionPool(pool_, {}, reservations, 2), PartitionError);
}

TEST_F(PoolPartitionerTest, NonPositiveShardCountTreatedAsOne) {
    ReservationMap reservations = {{0, {"1"}}};
    auto result = PartitionPool(pool_, {}, reservations, 0);
    EXPECT_EQ(result.shard_count(), 1);
    EXPECT_EQ(result.reserved_count, 1u);
}

TEST_F(PoolPartitionerTest, EmptyPool) {
    ReservationMap reservations = {{0, {"1"}}};
    auto result = PartitionPool({}, {"1"}, reservations, 2);
    EXPECT_TRUE(result.filtered.empty());
    EXPECT_TRUE(result.distributable.empty());
    EXPECT_EQ(result.excluded_count, 0u);
    EXPECT_EQ(result.reserved_count, 0u);
}
