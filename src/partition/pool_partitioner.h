#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace Fleetshard {

// Shard index -> identifiers pinned to that shard
using ReservationMap = std::map<int, std::vector<std::string>>;

/**
 * Result of splitting the identifier pool into excluded, reserved and
 * distributable parts. All vectors keep the pool's input order.
 */
struct PoolPartition {
    // Pool after exclusions, before reservations are removed
    std::vector<std::string> filtered;
    // What the distribution strategy operates on
    std::vector<std::string> distributable;
    // Pinned IDs per shard index; sized to the shard count
    std::vector<std::vector<std::string>> reserved_by_shard;
    std::vector<int> reserved_count_by_shard;

    size_t total_fetched = 0;
    size_t excluded_count = 0;
    size_t reserved_count = 0;
    size_t distributable_count = 0;

    int shard_count() const { return static_cast<int>(reserved_by_shard.size()); }
};

/**
 * Splits pool into the distributable pool and per-shard reservations.
 *
 * Exclusions are applied first, so an ID that is both excluded and reserved
 * ends up nowhere. Reserved IDs missing from the filtered pool are dropped
 * with a warning. shard_count <= 0 is treated as 1.
 *
 * Throws InvalidReservationError for a shard index outside [0, shard_count)
 * and DuplicateReservationError for an ID reserved in two shards.
 */
PoolPartition PartitionPool(const std::vector<std::string>& pool,
                            const std::vector<std::string>& exclusions,
                            const ReservationMap& reservations,
                            int shard_count);

} // namespace Fleetshard
