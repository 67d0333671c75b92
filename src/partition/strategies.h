#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "strategy.h"

namespace Fleetshard {

/**
 * Circular assignment over the sequenced pool: element i goes to bucket
 * i mod shard_count. Bucket sizes differ by at most one.
 */
class RoundRobinStrategy : public IShardStrategy {
public:
    explicit RoundRobinStrategy(int shard_count);

    StrategyType type() const override { return StrategyType::kRoundRobin; }
    int ShardCount() const override { return shard_count_; }
    Buckets Distribute(const DistributionInput& input) const override;

private:
    int shard_count_;
};

/**
 * Contiguous slices of the sequenced pool sized by percentage of the
 * filtered (pre-reservation) total, net of each shard's reservations.
 * The last shard takes whatever remains.
 */
class PercentageStrategy : public IShardStrategy {
public:
    explicit PercentageStrategy(std::vector<int> percentages);

    StrategyType type() const override { return StrategyType::kPercentage; }
    int ShardCount() const override;
    Buckets Distribute(const DistributionInput& input) const override;

private:
    std::vector<int> percentages_;
};

/**
 * Contiguous slices of the sequenced pool with absolute sizes net of each
 * shard's reservations. A size of -1 takes all remaining IDs.
 * Under-supply is not an error: later shards just come out short or empty.
 */
class SizeStrategy : public IShardStrategy {
public:
    static constexpr int kRemainder = -1;

    explicit SizeStrategy(std::vector<int> sizes);

    StrategyType type() const override { return StrategyType::kSize; }
    int ShardCount() const override;
    Buckets Distribute(const DistributionInput& input) const override;

private:
    std::vector<int> sizes_;
};

/**
 * Highest Random Weight hashing. Each ID independently picks the shard
 * whose weight Sha256Prefix64("<id>:shard_<s>:<seed>") is strictly
 * greatest, first found on ties. No sequencing step; the seed is always
 * part of the hash input, even when empty.
 * Growing from N to N+1 shards moves roughly 1/(N+1) of the IDs.
 */
class RendezvousStrategy : public IShardStrategy {
public:
    explicit RendezvousStrategy(int shard_count);

    StrategyType type() const override { return StrategyType::kRendezvous; }
    int ShardCount() const override { return shard_count_; }
    Buckets Distribute(const DistributionInput& input) const override;

    // Weight of id for shard_index under seed
    static uint64_t Weight(const std::string& id, int shard_index, const std::string& seed);

    // Winning shard index for id among [0, shard_count)
    static int SelectShard(const std::string& id, int shard_count, const std::string& seed);

private:
    int shard_count_;
};

} // namespace Fleetshard
