#pragma once

#include <string>
#include <vector>

#include "../common/configuration.h"
#include "../partition/partition_engine.h"

namespace Fleetshard {

/**
 * Converts a validated configuration plus the fetched pool into an engine
 * request. Decodes "shard_<N>" reservation keys into indices; keys naming
 * the same index ("shard_1", "shard_01") have their lists concatenated.
 * Throws std::invalid_argument on a key that is not a shard name.
 */
PartitionRequest BuildPartitionRequest(const FleetshardConfig& config, std::vector<std::string> ids);

/**
 * Validate -> fetch IDs -> partition -> write output.
 * Every failure is logged; nothing is written unless the whole run succeeds.
 * @return process exit status (0 on success, 1 on any failure)
 */
int RunShardCommand(const Configuration& configuration);

} // namespace Fleetshard
