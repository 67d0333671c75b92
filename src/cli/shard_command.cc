#include "shard_command.h"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include "../common/shard_name.h"
#include "../inventory/id_source.h"
#include "../output/result_writer.h"

namespace Fleetshard {

PartitionRequest BuildPartitionRequest(const FleetshardConfig& config, std::vector<std::string> ids) {
    PartitionRequest request;
    request.ids = std::move(ids);
    request.exclusions = config.sharding.exclude_ids.get();
    request.seed = config.sharding.seed.get();
    request.strategy = config.sharding.strategy.get();
    request.params.shard_count = config.sharding.shard_count.get();
    request.params.percentages = config.sharding.shard_percentages.get();
    request.params.sizes = config.sharding.shard_sizes.get();

    for (const auto& [name, reserved] : config.sharding.reserved_ids.get()) {
        auto index = ParseShardName(name);
        if (!index.has_value()) {
            throw std::invalid_argument("invalid shard name \"" + name +
                                        "\" in reserved_ids: must be 'shard_0', 'shard_1', etc.");
        }
        // "shard_1" and "shard_01" name the same shard; keep both lists
        auto& pinned = request.reservations[*index];
        pinned.insert(pinned.end(), reserved.begin(), reserved.end());
    }
    return request;
}

int RunShardCommand(const Configuration& configuration) {
    if (!configuration.validate()) {
        auto errors = configuration.getValidationErrors();
        for (const auto& error : errors) {
            LOG(ERROR) << "Config validation error: " << error;
        }
        LOG(ERROR) << "configuration validation failed with " << errors.size() << " error(s)";
        return 1;
    }

    const FleetshardConfig& config = configuration.config();
    try {
        std::unique_ptr<IIdSource> source = CreateIdSource(config.source.type.get(), config.source.path.get());
        std::vector<std::string> ids = source->FetchIds();
        LOG(INFO) << "Fetched " << ids.size() << " IDs from " << source->Describe();

        PartitionRequest request = BuildPartitionRequest(config, std::move(ids));
        ShardAssignment assignment = RunPartition(request);

        ShardMetadata metadata;
        metadata.generated_at = FormatTimestamp(std::chrono::system_clock::now());
        metadata.source_type = config.source.type.get();
        metadata.source = source->Describe();
        metadata.strategy = request.strategy;
        metadata.seed = request.seed;

        ResultWriter writer(config.output.format.get(), config.output.file.get());
        writer.Write(BuildShardResult(std::move(assignment), std::move(metadata)));
    } catch (const PartitionError& e) {
        LOG(ERROR) << "Sharding failed: " << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << e.what();
        return 1;
    }
    return 0;
}

} // namespace Fleetshard
