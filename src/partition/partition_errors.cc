#include "partition_errors.h"

#include "strategy.h"
#include "../common/shard_name.h"

namespace Fleetshard {

namespace {

std::string Quote(const std::string& s) {
    return "\"" + s + "\"";
}

std::string OutOfRangeMessage(int shard_index, int shard_count) {
    std::string msg = "shard name " + Quote(ShardName(shard_index)) +
        " in reserved_ids is out of range: with shard_count=" + std::to_string(shard_count);
    if (shard_count > 0) {
        msg += ", valid names are shard_0 to " + ShardName(shard_count - 1);
    }
    return msg;
}

} // namespace

InvalidReservationError::InvalidReservationError(int shard_index, int shard_count)
    : PartitionError(OutOfRangeMessage(shard_index, shard_count)),
      shard_index_(shard_index),
      shard_count_(shard_count) {}

DuplicateReservationError::DuplicateReservationError(const std::string& id, int first_shard, int second_shard)
    : PartitionError("ID " + Quote(id) + " appears in multiple reserved_ids shards: " +
                     Quote(ShardName(first_shard)) + " and " + Quote(ShardName(second_shard)) +
                     ", each ID may only be reserved for one shard"),
      id_(id),
      first_shard_(first_shard),
      second_shard_(second_shard) {}

UnknownStrategyError::UnknownStrategyError(const std::string& strategy)
    : PartitionError("unknown strategy " + Quote(strategy) + ": must be one of " + QuotedStrategyList()),
      strategy_(strategy) {}

} // namespace Fleetshard
