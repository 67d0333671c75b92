#include "partition_engine.h"

#include <memory>
#include <utility>

#include <glog/logging.h>

namespace Fleetshard {

ShardAssignment RunPartition(const PartitionRequest& request) {
    std::unique_ptr<IShardStrategy> strategy = CreateStrategy(request.strategy, request.params);
    const int shard_count = strategy->ShardCount();

    PoolPartition partition = PartitionPool(request.ids, request.exclusions,
                                            request.reservations, shard_count);
    VLOG(1) << "Pool partitioned: fetched=" << partition.total_fetched
            << " excluded=" << partition.excluded_count
            << " reserved=" << partition.reserved_count
            << " distributable=" << partition.distributable_count;

    DistributionInput input{partition.distributable, partition.filtered.size(),
                            partition.reserved_count_by_shard, request.seed};
    Buckets buckets = strategy->Distribute(input);
    VLOG(1) << "Distributed " << partition.distributable_count << " IDs with "
            << StrategyName(strategy->type()) << " into " << shard_count << " shards";

    ShardAssignment assignment = AssembleShards(std::move(buckets), partition);
    LOG(INFO) << "Sharding complete: strategy=" << StrategyName(strategy->type())
              << " shards=" << assignment.stats.shard_count
              << " fetched=" << assignment.stats.total_fetched
              << " excluded=" << assignment.stats.excluded_count
              << " reserved=" << assignment.stats.reserved_count
              << " distributed=" << assignment.stats.distributed_count;
    return assignment;
}

} // namespace Fleetshard
