#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_join.h"
#include "identifier.h"
#include "shard_name.h"

namespace Fleetshard {

namespace {

const std::vector<std::string> kValidSourceTypes = {"file", "stdin"};
const std::vector<std::string> kValidStrategies = {"round-robin", "percentage", "size", "rendezvous"};
const std::vector<std::string> kValidOutputFormats = {"json", "yaml"};

std::string Quote(const std::string& s) {
    return "\"" + s + "\"";
}

// ["a", "b", "c"]
std::string QuotedList(const std::vector<std::string>& items) {
    std::vector<std::string> quoted;
    quoted.reserve(items.size());
    for (const auto& item : items) {
        quoted.push_back(Quote(item));
    }
    return "[" + absl::StrJoin(quoted, ", ") + "]";
}

// [10 30 60]
std::string IntList(const std::vector<int>& values) {
    return "[" + absl::StrJoin(values, " ") + "]";
}

bool Contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

std::string Trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitCommaList(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        std::string item = Trim(text.substr(start, comma - start));
        if (!item.empty()) {
            out.push_back(item);
        }
        start = comma + 1;
    }
    return out;
}

std::vector<int> ReadIntList(const YAML::Node& node) {
    std::vector<int> out;
    for (const auto& v : node) {
        out.push_back(v.as<int>());
    }
    return out;
}

std::vector<std::string> ReadStringList(const YAML::Node& node) {
    std::vector<std::string> out;
    for (const auto& v : node) {
        out.push_back(v.as<std::string>());
    }
    return out;
}

ReservedIdMap ReadReservedIds(const YAML::Node& node) {
    ReservedIdMap out;
    if (!node.IsMap()) {
        throw YAML::RepresentationException(node.Mark(), "reserved_ids must be a map of shard name to ID list");
    }
    for (const auto& entry : node) {
        out[entry.first.as<std::string>()] = ReadStringList(entry.second);
    }
    return out;
}

void ApplyYaml(const YAML::Node& yaml, FleetshardConfig& config) {
    if (!yaml["fleetshard"]) {
        LOG(WARNING) << "Configuration has no top-level 'fleetshard' key; nothing loaded";
        return;
    }
    auto root = yaml["fleetshard"];

    // Log
    if (root["log"]) {
        auto log = root["log"];
        if (log["level"]) config.log.level.set(log["level"].as<int>());
    }

    // Source
    if (root["source"]) {
        auto source = root["source"];
        if (source["type"]) config.source.type.set(source["type"].as<std::string>());
        if (source["path"]) config.source.path.set(source["path"].as<std::string>());
    }

    // Sharding
    if (root["sharding"]) {
        auto sharding = root["sharding"];
        if (sharding["strategy"]) config.sharding.strategy.set(sharding["strategy"].as<std::string>());
        if (sharding["shard_count"]) config.sharding.shard_count.set(sharding["shard_count"].as<int>());
        if (sharding["shard_percentages"]) config.sharding.shard_percentages.set(ReadIntList(sharding["shard_percentages"]));
        if (sharding["shard_sizes"]) config.sharding.shard_sizes.set(ReadIntList(sharding["shard_sizes"]));
        if (sharding["seed"]) config.sharding.seed.set(sharding["seed"].as<std::string>());
        if (sharding["exclude_ids"]) config.sharding.exclude_ids.set(ReadStringList(sharding["exclude_ids"]));
        if (sharding["reserved_ids"]) config.sharding.reserved_ids.set(ReadReservedIds(sharding["reserved_ids"]));
    }

    // Output
    if (root["output"]) {
        auto output = root["output"];
        if (output["format"]) config.output.format.set(output["format"].as<std::string>());
        if (output["file"]) config.output.file.set(output["file"].as<std::string>());
    }
}

//----------------------------------------------------------------------------
// Validation. Each check appends to issues and never throws, so the caller
// sees every problem in one pass.
//----------------------------------------------------------------------------

void ValidateLog(const FleetshardConfig& config, std::vector<std::string>& issues) {
    int level = config.log.level.get();
    if (level < 0) {
        issues.push_back("log_level must be >= 0, got " + std::to_string(level));
    }
}

void ValidateSource(const FleetshardConfig& config, std::vector<std::string>& issues) {
    const std::string type = config.source.type.get();
    const std::string path = config.source.path.get();

    if (type.empty()) {
        issues.push_back("source_type is required: must be one of " + QuotedList(kValidSourceTypes));
        return;
    }
    if (!Contains(kValidSourceTypes, type)) {
        issues.push_back("source_type " + Quote(type) + " is not valid: must be one of " +
                         QuotedList(kValidSourceTypes));
        return;
    }
    if (type == "file" && path.empty()) {
        issues.push_back("source_path is required when source_type is \"file\"");
    }
    if (type == "stdin" && !path.empty()) {
        issues.push_back("source_path is set (" + Quote(path) + ") but source_type \"stdin\" does not read a file; "
                         "remove source_path or set source_type to \"file\"");
    }
}

void ValidateShardingParameters(const FleetshardConfig& config, std::vector<std::string>& issues) {
    const std::string strategy = config.sharding.strategy.get();
    const int shard_count = config.sharding.shard_count.get();
    const std::vector<int> percentages = config.sharding.shard_percentages.get();
    const std::vector<int> sizes = config.sharding.shard_sizes.get();

    const bool has_count = shard_count > 0;
    const bool has_pct = !percentages.empty();
    const bool has_sizes = !sizes.empty();

    // Exactly one of shard_count / shard_percentages / shard_sizes
    std::vector<std::string> set_names;
    if (has_count) set_names.push_back("shard_count (" + std::to_string(shard_count) + ")");
    if (has_pct) set_names.push_back("shard_percentages (" + IntList(percentages) + ")");
    if (has_sizes) set_names.push_back("shard_sizes (" + IntList(sizes) + ")");

    if (set_names.empty()) {
        issues.push_back("exactly one of shard_count, shard_percentages, or shard_sizes must be set; none were provided");
    } else if (set_names.size() > 1) {
        issues.push_back("exactly one of shard_count, shard_percentages, or shard_sizes must be set; "
                         "multiple were provided: " + absl::StrJoin(set_names, "; "));
        return;
    }

    if (strategy.empty()) {
        issues.push_back("strategy is required: must be one of " + QuotedList(kValidStrategies));
        return;
    }
    if (!Contains(kValidStrategies, strategy)) {
        issues.push_back("strategy " + Quote(strategy) + " is not valid: must be one of " +
                         QuotedList(kValidStrategies));
        return;
    }

    // Strategy <-> parameter compatibility
    if (strategy == "round-robin" || strategy == "rendezvous") {
        if (!has_count) {
            issues.push_back("strategy " + Quote(strategy) +
                             " requires shard_count; use shard_count, not shard_percentages or shard_sizes");
        }
        if (has_pct) {
            issues.push_back("shard_percentages is set but strategy is " + Quote(strategy) +
                             "; shard_percentages is only valid with strategy \"percentage\"");
        }
        if (has_sizes) {
            issues.push_back("shard_sizes is set but strategy is " + Quote(strategy) +
                             "; shard_sizes is only valid with strategy \"size\"");
        }
    } else if (strategy == "percentage") {
        if (!has_pct) {
            issues.push_back("strategy \"percentage\" requires shard_percentages; "
                             "use shard_percentages, not shard_count or shard_sizes");
        }
        if (has_count) {
            issues.push_back("shard_count is set but strategy is \"percentage\"; "
                             "shard_count is only valid with strategies \"round-robin\" or \"rendezvous\"");
        }
        if (has_sizes) {
            issues.push_back("shard_sizes is set but strategy is \"percentage\"; "
                             "shard_sizes is only valid with strategy \"size\"");
        }
    } else if (strategy == "size") {
        if (!has_sizes) {
            issues.push_back("strategy \"size\" requires shard_sizes; "
                             "use shard_sizes, not shard_count or shard_percentages");
        }
        if (has_count) {
            issues.push_back("shard_count is set but strategy is \"size\"; "
                             "shard_count is only valid with strategies \"round-robin\" or \"rendezvous\"");
        }
        if (has_pct) {
            issues.push_back("shard_percentages is set but strategy is \"size\"; "
                             "shard_percentages is only valid with strategy \"percentage\"");
        }
    }

    if (shard_count < 0) {
        issues.push_back("shard_count must be at least 1, got " + std::to_string(shard_count));
    }

    if (has_pct) {
        long long sum = 0;
        for (size_t i = 0; i < percentages.size(); ++i) {
            if (percentages[i] < 0) {
                issues.push_back("shard_percentages[" + std::to_string(i) + "] is " +
                                 std::to_string(percentages[i]) + "; each percentage must be >= 0");
            }
            sum += percentages[i];
        }
        if (sum != 100) {
            issues.push_back("shard_percentages must sum to exactly 100, got " + std::to_string(sum) +
                             " (" + IntList(percentages) + ")");
        }
    }

    if (has_sizes) {
        for (size_t i = 0; i < sizes.size(); ++i) {
            if (sizes[i] != -1 && sizes[i] < 1) {
                issues.push_back("shard_sizes[" + std::to_string(i) + "] is " + std::to_string(sizes[i]) +
                                 "; each size must be >= 1 or exactly -1 (remainder)");
            }
            if (sizes[i] == -1 && i != sizes.size() - 1) {
                issues.push_back("shard_sizes[" + std::to_string(i) + "] is -1 (remainder) but is not the last "
                                 "element; -1 is only valid in the final position");
            }
        }
    }
}

void ValidateIdFormats(const FleetshardConfig& config, std::vector<std::string>& issues) {
    const auto exclude_ids = config.sharding.exclude_ids.get();
    for (size_t i = 0; i < exclude_ids.size(); ++i) {
        if (!IsNumericId(exclude_ids[i])) {
            issues.push_back("exclude_ids[" + std::to_string(i) + "] " + Quote(exclude_ids[i]) +
                             " must be a numeric ID (e.g. \"42\")");
        }
    }

    for (const auto& [key, ids] : config.sharding.reserved_ids.get()) {
        if (!IsShardName(key)) {
            issues.push_back("reserved_ids key " + Quote(key) +
                             " is not valid; keys must be in the format \"shard_0\", \"shard_1\", etc.");
        }
        for (size_t i = 0; i < ids.size(); ++i) {
            if (!IsNumericId(ids[i])) {
                issues.push_back("reserved_ids[" + Quote(key) + "][" + std::to_string(i) + "] " + Quote(ids[i]) +
                                 " must be a numeric ID (e.g. \"42\")");
            }
        }
    }
}

// "shard_1" and "shard_01" name the same shard
bool SameShard(const std::string& a, const std::string& b) {
    if (a == b) {
        return true;
    }
    auto ia = ParseShardName(a);
    auto ib = ParseShardName(b);
    return ia.has_value() && ia == ib;
}

void ValidateIdConflicts(const FleetshardConfig& config, std::vector<std::string>& issues) {
    const auto exclude_ids = config.sharding.exclude_ids.get();
    const auto reserved_ids = config.sharding.reserved_ids.get();
    if (exclude_ids.empty() && reserved_ids.empty()) {
        return;
    }

    absl::flat_hash_set<std::string> excluded(exclude_ids.begin(), exclude_ids.end());
    absl::flat_hash_map<std::string, std::string> seen;  // id -> first shard claiming it

    for (const auto& [shard, ids] : reserved_ids) {
        for (const auto& id : ids) {
            if (excluded.contains(id)) {
                issues.push_back("ID " + Quote(id) + " appears in both exclude_ids and reserved_ids[" + Quote(shard) +
                                 "]; exclusion takes precedence and the ID will be absent from all shards; "
                                 "remove it from reserved_ids or from exclude_ids");
            }
            auto [it, inserted] = seen.emplace(id, shard);
            if (!inserted && !SameShard(it->second, shard)) {
                issues.push_back("ID " + Quote(id) + " is reserved in multiple shards: " + Quote(it->second) +
                                 " and " + Quote(shard) + "; each ID may only be pinned to one shard");
            }
        }
    }
}

void ValidateOutput(const FleetshardConfig& config, std::vector<std::string>& issues) {
    const std::string format = config.output.format.get();
    if (format.empty()) {
        issues.push_back("output_format is required: must be \"json\" or \"yaml\"");
    } else if (!Contains(kValidOutputFormats, format)) {
        issues.push_back("output_format " + Quote(format) + " is not valid: must be \"json\" or \"yaml\"");
    }
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<std::vector<int>> ConfigValue<std::vector<int>>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            std::vector<int> values;
            for (const auto& item : SplitCommaList(env_val)) {
                values.push_back(std::stoi(item));
            }
            return values;
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::vector<std::string>> ConfigValue<std::vector<std::string>>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return SplitCommaList(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<ReservedIdMap> ConfigValue<ReservedIdMap>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return ParseReservedIdsJson(env_val);
        } catch (const std::invalid_argument& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

ReservedIdMap ParseReservedIdsJson(const std::string& json_text) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("invalid reserved_ids JSON: ") + e.what());
    }
    if (!parsed.is_object()) {
        throw std::invalid_argument("invalid reserved_ids JSON: expected an object of shard name to ID list");
    }

    ReservedIdMap out;
    for (const auto& [shard, ids] : parsed.items()) {
        if (!ids.is_array()) {
            throw std::invalid_argument("invalid reserved_ids JSON: value for " + Quote(shard) + " must be a list");
        }
        std::vector<std::string>& list = out[shard];
        for (const auto& id : ids) {
            if (!id.is_string()) {
                throw std::invalid_argument("invalid reserved_ids JSON: IDs for " + Quote(shard) + " must be strings");
            }
            list.push_back(id.get<std::string>());
        }
    }
    return out;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

std::unique_ptr<Configuration> Configuration::CreateStandalone() {
    return std::unique_ptr<Configuration>(new Configuration());
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        ApplyYaml(yaml, config_);
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        ApplyYaml(yaml, config_);
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

int Configuration::resolveShardCount() const {
    auto percentages = config_.sharding.shard_percentages.get();
    if (!percentages.empty()) {
        return static_cast<int>(percentages.size());
    }
    auto sizes = config_.sharding.shard_sizes.get();
    if (!sizes.empty()) {
        return static_cast<int>(sizes.size());
    }
    return config_.sharding.shard_count.get();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    ValidateLog(config_, validation_errors_);
    ValidateSource(config_, validation_errors_);
    ValidateShardingParameters(config_, validation_errors_);
    ValidateIdFormats(config_, validation_errors_);
    ValidateIdConflicts(config_, validation_errors_);
    ValidateOutput(config_, validation_errors_);

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Fleetshard
