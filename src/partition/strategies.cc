#include "strategies.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include "deterministic_sequencer.h"
#include "partition_errors.h"
#include "../common/digest.h"
#include "../common/shard_name.h"

namespace Fleetshard {

namespace {

int ReservedAt(const DistributionInput& input, int shard_index) {
    if (shard_index < 0 || static_cast<size_t>(shard_index) >= input.reserved_counts.size()) {
        return 0;
    }
    return input.reserved_counts[shard_index];
}

// Clamps a requested slice length to [0, remaining]
size_t ClampTarget(int64_t target, size_t remaining) {
    if (target <= 0) {
        return 0;
    }
    return std::min(static_cast<size_t>(target), remaining);
}

/**
 * Cuts contiguous slices off the front of sequenced, one per shard, using
 * target_for(i, remaining) to size shard i.
 */
template <typename TargetFn>
Buckets CarveSlices(const std::vector<std::string>& sequenced, int shard_count, TargetFn target_for) {
    Buckets buckets(shard_count);
    size_t cursor = 0;
    for (int i = 0; i < shard_count; ++i) {
        size_t remaining = sequenced.size() - cursor;
        size_t take = target_for(i, remaining);
        VLOG(2) << ShardName(i) << " target=" << take << " remaining=" << remaining;
        buckets[i].assign(sequenced.begin() + cursor, sequenced.begin() + cursor + take);
        cursor += take;
    }
    return buckets;
}

} // namespace

std::string_view StrategyName(StrategyType type) {
    switch (type) {
        case StrategyType::kRoundRobin:
            return kStrategyNames[0];
        case StrategyType::kPercentage:
            return kStrategyNames[1];
        case StrategyType::kSize:
            return kStrategyNames[2];
        case StrategyType::kRendezvous:
            return kStrategyNames[3];
    }
    return "unknown";
}

std::optional<StrategyType> ParseStrategyType(std::string_view name) {
    if (name == kStrategyNames[0]) return StrategyType::kRoundRobin;
    if (name == kStrategyNames[1]) return StrategyType::kPercentage;
    if (name == kStrategyNames[2]) return StrategyType::kSize;
    if (name == kStrategyNames[3]) return StrategyType::kRendezvous;
    return std::nullopt;
}

std::string QuotedStrategyList() {
    std::string out = "[";
    for (size_t i = 0; i < kStrategyNames.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += "\"";
        out += kStrategyNames[i];
        out += "\"";
    }
    out += "]";
    return out;
}

std::unique_ptr<IShardStrategy> CreateStrategy(std::string_view name, const StrategyParams& params) {
    auto type = ParseStrategyType(name);
    if (!type.has_value()) {
        throw UnknownStrategyError(std::string(name));
    }

    switch (*type) {
        case StrategyType::kRoundRobin:
            return std::make_unique<RoundRobinStrategy>(params.shard_count);
        case StrategyType::kPercentage:
            return std::make_unique<PercentageStrategy>(params.percentages);
        case StrategyType::kSize:
            return std::make_unique<SizeStrategy>(params.sizes);
        case StrategyType::kRendezvous:
            return std::make_unique<RendezvousStrategy>(params.shard_count);
    }
    throw UnknownStrategyError(std::string(name));
}

//----------------------------------------------------------------------------
// Round-robin
//----------------------------------------------------------------------------

RoundRobinStrategy::RoundRobinStrategy(int shard_count)
    : shard_count_(shard_count > 0 ? shard_count : 1) {}

Buckets RoundRobinStrategy::Distribute(const DistributionInput& input) const {
    Buckets buckets(shard_count_);
    std::vector<std::string> sequenced = SequenceIds(input.distributable, input.seed);

    for (auto& bucket : buckets) {
        bucket.reserve(sequenced.size() / shard_count_ + 1);
    }
    for (size_t i = 0; i < sequenced.size(); ++i) {
        buckets[i % shard_count_].push_back(std::move(sequenced[i]));
    }
    return buckets;
}

//----------------------------------------------------------------------------
// Percentage
//----------------------------------------------------------------------------

PercentageStrategy::PercentageStrategy(std::vector<int> percentages)
    : percentages_(std::move(percentages)) {}

int PercentageStrategy::ShardCount() const {
    return percentages_.empty() ? 1 : static_cast<int>(percentages_.size());
}

Buckets PercentageStrategy::Distribute(const DistributionInput& input) const {
    const int shard_count = ShardCount();
    const int64_t total = static_cast<int64_t>(input.filtered_total);
    std::vector<std::string> sequenced = SequenceIds(input.distributable, input.seed);

    return CarveSlices(sequenced, shard_count, [&](int i, size_t remaining) -> size_t {
        if (i == shard_count - 1) {
            return remaining;
        }
        int64_t target = total * percentages_[i] / 100 - ReservedAt(input, i);
        return ClampTarget(target, remaining);
    });
}

//----------------------------------------------------------------------------
// Size
//----------------------------------------------------------------------------

SizeStrategy::SizeStrategy(std::vector<int> sizes) : sizes_(std::move(sizes)) {}

int SizeStrategy::ShardCount() const {
    return sizes_.empty() ? 1 : static_cast<int>(sizes_.size());
}

Buckets SizeStrategy::Distribute(const DistributionInput& input) const {
    std::vector<std::string> sequenced = SequenceIds(input.distributable, input.seed);

    return CarveSlices(sequenced, ShardCount(), [&](int i, size_t remaining) -> size_t {
        int size = sizes_.empty() ? kRemainder : sizes_[i];
        if (size == kRemainder) {
            return remaining;
        }
        return ClampTarget(static_cast<int64_t>(size) - ReservedAt(input, i), remaining);
    });
}

//----------------------------------------------------------------------------
// Rendezvous
//----------------------------------------------------------------------------

RendezvousStrategy::RendezvousStrategy(int shard_count)
    : shard_count_(shard_count > 0 ? shard_count : 1) {}

uint64_t RendezvousStrategy::Weight(const std::string& id, int shard_index, const std::string& seed) {
    std::string key;
    key.reserve(id.size() + seed.size() + 20);
    key.append(id).append(":").append(ShardName(shard_index)).append(":").append(seed);
    return Sha256Prefix64(key);
}

int RendezvousStrategy::SelectShard(const std::string& id, int shard_count, const std::string& seed) {
    uint64_t best_weight = 0;
    int best_shard = 0;
    for (int s = 0; s < shard_count; ++s) {
        uint64_t weight = Weight(id, s, seed);
        if (weight > best_weight) {
            best_weight = weight;
            best_shard = s;
        }
    }
    return best_shard;
}

Buckets RendezvousStrategy::Distribute(const DistributionInput& input) const {
    Buckets buckets(shard_count_);
    for (const auto& id : input.distributable) {
        buckets[SelectShard(id, shard_count_, input.seed)].push_back(id);
    }
    return buckets;
}

} // namespace Fleetshard
