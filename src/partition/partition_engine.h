#pragma once

#include <string>
#include <vector>

#include "partition_errors.h"
#include "pool_partitioner.h"
#include "shard_assembler.h"
#include "strategy.h"

namespace Fleetshard {

/**
 * Everything one partition run needs. Shard names have already been
 * decoded to indices by the caller.
 */
struct PartitionRequest {
    std::vector<std::string> ids;
    std::vector<std::string> exclusions;
    ReservationMap reservations;
    std::string seed;
    std::string strategy;
    StrategyParams params;
};

/**
 * Runs the full pipeline: resolve strategy, partition the pool, distribute,
 * assemble. Pure computation over the request; safe to call concurrently
 * on independent requests.
 *
 * Throws UnknownStrategyError before any other work when the strategy name
 * is not recognised, and InvalidReservationError / DuplicateReservationError
 * from the pool partitioner. No partial assignment is ever returned.
 */
ShardAssignment RunPartition(const PartitionRequest& request);

} // namespace Fleetshard
