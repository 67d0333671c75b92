#include "shard_name.h"

#include <limits>

#include "identifier.h"

namespace Fleetshard {

std::string ShardName(int index) {
    return std::string(kShardNamePrefix) + std::to_string(index);
}

std::optional<int> ParseShardName(std::string_view name) {
    if (name.substr(0, kShardNamePrefix.size()) != kShardNamePrefix) {
        return std::nullopt;
    }
    std::string_view digits = name.substr(kShardNamePrefix.size());
    if (!IsNumericId(digits)) {
        return std::nullopt;
    }

    long long value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
        if (value > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
    }
    return static_cast<int>(value);
}

} // namespace Fleetshard
