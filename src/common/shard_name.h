#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Fleetshard {

// Shard names ("shard_0", "shard_1", ...) only exist at the config and
// output boundary. The partition engine works on plain indices.
inline constexpr std::string_view kShardNamePrefix = "shard_";

std::string ShardName(int index);

/**
 * Decodes "shard_<N>" into N.
 * @return std::nullopt when name does not match ^shard_\d+$ or N does not fit an int
 */
std::optional<int> ParseShardName(std::string_view name);

inline bool IsShardName(std::string_view name) {
    return ParseShardName(name).has_value();
}

} // namespace Fleetshard
