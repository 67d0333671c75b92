#ifndef FLEETSHARD_CONFIGURATION_H_
#define FLEETSHARD_CONFIGURATION_H_

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace Fleetshard {

// reserved_ids as written in config: shard name -> IDs
using ReservedIdMap = std::map<std::string, std::vector<std::string>>;

/**
 * Configuration value resolved with precedence
 * command line > environment variable > config file > default
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (overridden_) {
            return value_;
        }
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    // Value from the config file; still loses to the environment
    void set(T value) { value_ = value; }

    // Value from the command line; wins over everything
    void override(T value) {
        value_ = value;
        overridden_ = true;
    }

    const std::string& env_var() const { return env_var_; }

private:
    T value_{};
    std::string env_var_;
    bool overridden_ = false;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct FleetshardConfig {
    struct Log {
        ConfigValue<int> level{0, "FLEETSHARD_LOG_LEVEL"};
    } log;

    // Where the identifier pool comes from
    struct Source {
        // Supported types: file, stdin
        ConfigValue<std::string> type{"", "FLEETSHARD_SOURCE_TYPE"};
        ConfigValue<std::string> path{"", "FLEETSHARD_SOURCE_PATH"};
    } source;

    struct Sharding {
        ConfigValue<std::string> strategy{"", "FLEETSHARD_STRATEGY"};
        ConfigValue<int> shard_count{0, "FLEETSHARD_SHARD_COUNT"};
        ConfigValue<std::vector<int>> shard_percentages{{}, "FLEETSHARD_SHARD_PERCENTAGES"};
        // -1 as the last element means "all remaining IDs"
        ConfigValue<std::vector<int>> shard_sizes{{}, "FLEETSHARD_SHARD_SIZES"};
        ConfigValue<std::string> seed{"", "FLEETSHARD_SEED"};
        ConfigValue<std::vector<std::string>> exclude_ids{{}, "FLEETSHARD_EXCLUDE_IDS"};
        ConfigValue<ReservedIdMap> reserved_ids{{}, "FLEETSHARD_RESERVED_IDS"};
    } sharding;

    struct Output {
        // json or yaml
        ConfigValue<std::string> format{"json", "FLEETSHARD_OUTPUT_FORMAT"};
        // Empty writes to stdout
        ConfigValue<std::string> file{"", "FLEETSHARD_OUTPUT_FILE"};
    } output;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Independent instance outside the singleton; used by tests
    static std::unique_ptr<Configuration> CreateStandalone();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const FleetshardConfig& config() const { return config_; }
    FleetshardConfig& config() { return config_; }

    // Number of shards implied by whichever sharding parameter is set
    int resolveShardCount() const;

    // Validation: runs every check and keeps all problems found
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    FleetshardConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Parses a JSON object of shard name -> ID list, as taken by --reserved-ids.
// Throws std::invalid_argument on malformed input.
ReservedIdMap ParseReservedIdsJson(const std::string& json_text);

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<std::vector<int>> ConfigValue<std::vector<int>>::getEnvValue() const;

template<>
std::optional<std::vector<std::string>> ConfigValue<std::vector<std::string>>::getEnvValue() const;

template<>
std::optional<ReservedIdMap> ConfigValue<ReservedIdMap>::getEnvValue() const;

} // namespace Fleetshard

#endif // FLEETSHARD_CONFIGURATION_H_
