#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pool_partitioner.h"
#include "strategy.h"

namespace Fleetshard {

struct PartitionStats {
    size_t total_fetched = 0;
    size_t excluded_count = 0;
    size_t reserved_count = 0;
    size_t distributed_count = 0;
    int shard_count = 0;
};

/**
 * Final output of a partition run: one ascending-sorted bucket per shard
 * index plus the counts at each stage.
 */
struct ShardAssignment {
    Buckets shards;
    PartitionStats stats;
};

/**
 * Merges each shard's reserved IDs into its distributed bucket and sorts
 * every bucket ascending by numeric value.
 * The result always has partition.shard_count() buckets; missing
 * distributed buckets are treated as empty.
 */
ShardAssignment AssembleShards(Buckets distributed, const PoolPartition& partition);

} // namespace Fleetshard
