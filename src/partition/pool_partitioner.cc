#include "pool_partitioner.h"

#include <glog/logging.h>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "partition_errors.h"
#include "../common/shard_name.h"

namespace Fleetshard {

PoolPartition PartitionPool(const std::vector<std::string>& pool,
                            const std::vector<std::string>& exclusions,
                            const ReservationMap& reservations,
                            int shard_count) {
    if (shard_count <= 0) {
        shard_count = 1;
    }

    PoolPartition result;
    result.total_fetched = pool.size();
    result.reserved_by_shard.resize(shard_count);
    result.reserved_count_by_shard.assign(shard_count, 0);

    // Exclusions
    if (exclusions.empty()) {
        result.filtered = pool;
    } else {
        absl::flat_hash_set<std::string> excluded(exclusions.begin(), exclusions.end());
        result.filtered.reserve(pool.size());
        for (const auto& id : pool) {
            if (!excluded.contains(id)) {
                result.filtered.push_back(id);
            }
        }
    }
    result.excluded_count = result.total_fetched - result.filtered.size();

    // Validate reservations before touching the pool. std::map iterates
    // shard indices ascending, so the lower shard is always reported first.
    absl::flat_hash_map<std::string, int> owner;
    for (const auto& [shard_index, ids] : reservations) {
        if (shard_index < 0 || shard_index >= shard_count) {
            throw InvalidReservationError(shard_index, shard_count);
        }
        for (const auto& id : ids) {
            auto [it, inserted] = owner.emplace(id, shard_index);
            if (!inserted && it->second != shard_index) {
                throw DuplicateReservationError(id, it->second, shard_index);
            }
        }
    }

    if (owner.empty()) {
        result.distributable = result.filtered;
        result.distributable_count = result.distributable.size();
        return result;
    }

    absl::flat_hash_set<std::string> present(result.filtered.begin(), result.filtered.end());
    absl::flat_hash_set<std::string> pinned;
    for (const auto& [shard_index, ids] : reservations) {
        for (const auto& id : ids) {
            if (!present.contains(id)) {
                LOG(WARNING) << "Reserved ID " << id << " for " << ShardName(shard_index)
                             << " is not in the filtered pool (excluded or not fetched); skipping";
                continue;
            }
            if (!pinned.insert(id).second) {
                continue;  // repeated within the same shard list
            }
            result.reserved_by_shard[shard_index].push_back(id);
            result.reserved_count_by_shard[shard_index]++;
        }
    }
    result.reserved_count = pinned.size();

    result.distributable.reserve(result.filtered.size() - pinned.size());
    for (const auto& id : result.filtered) {
        if (!pinned.contains(id)) {
            result.distributable.push_back(id);
        }
    }
    result.distributable_count = result.distributable.size();
    return result;
}

} // namespace Fleetshard
