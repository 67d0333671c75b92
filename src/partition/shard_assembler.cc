#include "shard_assembler.h"

#include <utility>

#include <glog/logging.h>

#include "../common/identifier.h"

namespace Fleetshard {

ShardAssignment AssembleShards(Buckets distributed, const PoolPartition& partition) {
    const int shard_count = partition.shard_count();
    if (static_cast<int>(distributed.size()) != shard_count) {
        LOG(WARNING) << "Strategy produced " << distributed.size()
                     << " buckets for " << shard_count << " shards";
        distributed.resize(shard_count);
    }

    ShardAssignment assignment;
    assignment.shards = std::move(distributed);

    size_t distributed_count = 0;
    for (int i = 0; i < shard_count; ++i) {
        Bucket& bucket = assignment.shards[i];
        distributed_count += bucket.size();
        const auto& reserved = partition.reserved_by_shard[i];
        bucket.insert(bucket.end(), reserved.begin(), reserved.end());
        SortNumerically(bucket);
    }

    assignment.stats.total_fetched = partition.total_fetched;
    assignment.stats.excluded_count = partition.excluded_count;
    assignment.stats.reserved_count = partition.reserved_count;
    assignment.stats.distributed_count = distributed_count;
    assignment.stats.shard_count = shard_count;
    return assignment;
}

} // namespace Fleetshard
