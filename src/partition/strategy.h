#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Fleetshard {

using Bucket = std::vector<std::string>;
using Buckets = std::vector<Bucket>;

enum class StrategyType {
    kRoundRobin,
    kPercentage,
    kSize,
    kRendezvous,
};

inline constexpr std::array<std::string_view, 4> kStrategyNames = {
    "round-robin", "percentage", "size", "rendezvous"};

std::string_view StrategyName(StrategyType type);

// Returns std::nullopt for anything outside kStrategyNames
std::optional<StrategyType> ParseStrategyType(std::string_view name);

// ["round-robin", "percentage", "size", "rendezvous"]
std::string QuotedStrategyList();

/**
 * Parameters for every strategy. Only the field matching the chosen
 * strategy is read: shard_count for round-robin and rendezvous,
 * percentages for percentage, sizes for size.
 */
struct StrategyParams {
    int shard_count = 0;
    std::vector<int> percentages;
    std::vector<int> sizes;
};

/**
 * What a strategy sees of the partitioned pool.
 * Reserved IDs are not part of distributable; they are merged afterwards.
 */
struct DistributionInput {
    const std::vector<std::string>& distributable;
    // Pool size after exclusions and before reservations are removed
    size_t filtered_total;
    // Reserved ID count per shard index, sized to ShardCount()
    const std::vector<int>& reserved_counts;
    const std::string& seed;
};

/**
 * Interface for a distribution algorithm mapping the distributable pool to
 * shard buckets
 */
class IShardStrategy {
public:
    virtual ~IShardStrategy() = default;

    virtual StrategyType type() const = 0;

    // Number of buckets Distribute() emits, always >= 1
    virtual int ShardCount() const = 0;

    // Emits exactly ShardCount() buckets; a bucket may be empty
    virtual Buckets Distribute(const DistributionInput& input) const = 0;
};

/**
 * Builds the strategy registered under name.
 * Throws UnknownStrategyError when name is not one of kStrategyNames.
 */
std::unique_ptr<IShardStrategy> CreateStrategy(std::string_view name, const StrategyParams& params);

} // namespace Fleetshard
