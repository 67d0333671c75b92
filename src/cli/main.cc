#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "shard_command.h"
#include "../common/configuration.h"

#ifndef FLEETSHARD_VERSION
#define FLEETSHARD_VERSION "dev"
#endif

using namespace Fleetshard;

namespace {

constexpr const char* kDefaultConfigFile = "fleetshard.yaml";

// Config file from --config, then FLEETSHARD_CONFIG, then ./fleetshard.yaml if present
std::string ResolveConfigPath(const cxxopts::ParseResult& result) {
    if (result.count("config")) {
        return result["config"].as<std::string>();
    }
    if (const char* env = std::getenv("FLEETSHARD_CONFIG"); env && env[0]) {
        return env;
    }
    std::error_code ec;
    if (std::filesystem::exists(kDefaultConfigFile, ec)) {
        return kDefaultConfigFile;
    }
    return "";
}

void OverrideFromCommandLine(const cxxopts::ParseResult& result, FleetshardConfig& config) {
    if (result.count("log_level")) config.log.level.override(result["log_level"].as<int>());
    if (result.count("source-type")) config.source.type.override(result["source-type"].as<std::string>());
    if (result.count("source-path")) config.source.path.override(result["source-path"].as<std::string>());
    if (result.count("strategy")) config.sharding.strategy.override(result["strategy"].as<std::string>());
    if (result.count("shard-count")) config.sharding.shard_count.override(result["shard-count"].as<int>());
    if (result.count("shard-percentages")) {
        config.sharding.shard_percentages.override(result["shard-percentages"].as<std::vector<int>>());
    }
    if (result.count("shard-sizes")) {
        config.sharding.shard_sizes.override(result["shard-sizes"].as<std::vector<int>>());
    }
    if (result.count("seed")) config.sharding.seed.override(result["seed"].as<std::string>());
    if (result.count("exclude-ids")) {
        config.sharding.exclude_ids.override(result["exclude-ids"].as<std::vector<std::string>>());
    }
    if (result.count("reserved-ids")) {
        config.sharding.reserved_ids.override(ParseReservedIdsJson(result["reserved-ids"].as<std::string>()));
    }
    if (result.count("output")) config.output.format.override(result["output"].as<std::string>());
    if (result.count("output-file")) config.output.file.override(result["output-file"].as<std::string>());
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options("fleetshard",
        "Distribute fleet device and account IDs into shards for staged rollouts.\n"
        "Strategies: round-robin | percentage | size | rendezvous");

    options.add_options()
        ("c,config", "Config file path (default: ./fleetshard.yaml)", cxxopts::value<std::string>())
        ("source-type", "Identifier source: file | stdin", cxxopts::value<std::string>())
        ("source-path", "ID file for source type 'file' (newline or comma separated)",
            cxxopts::value<std::string>())
        ("strategy", "Sharding strategy: round-robin | percentage | size | rendezvous",
            cxxopts::value<std::string>())
        ("shard-count", "Number of shards (round-robin and rendezvous)", cxxopts::value<int>())
        ("shard-percentages", "Percentages summing to 100, e.g. 10,30,60 (percentage)",
            cxxopts::value<std::vector<int>>())
        ("shard-sizes", "Absolute shard sizes; -1 as last element for remainder, e.g. 50,200,-1 (size)",
            cxxopts::value<std::vector<int>>())
        ("seed", "Seed for deterministic distribution", cxxopts::value<std::string>())
        ("exclude-ids", "IDs to exclude from all shards, comma separated",
            cxxopts::value<std::vector<std::string>>())
        ("reserved-ids", "JSON map of shard names to pinned IDs, e.g. '{\"shard_0\":[\"101\"]}'",
            cxxopts::value<std::string>())
        ("o,output", "Output format: json or yaml", cxxopts::value<std::string>())
        ("output-file", "Write output to this file instead of stdout", cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>())
        ("version", "Print version")
        ("h,help", "Print usage");

    Configuration& configuration = Configuration::getInstance();
    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        if (result.count("version")) {
            std::cout << "fleetshard version " << FLEETSHARD_VERSION << std::endl;
            return 0;
        }

        std::string config_path = ResolveConfigPath(result);
        if (!config_path.empty()) {
            if (!configuration.loadFromFile(config_path)) {
                LOG(ERROR) << "Failed to load configuration file " << config_path;
                return 1;
            }
            LOG(INFO) << "Using config file: " << config_path;
        }

        OverrideFromCommandLine(result, configuration.config());
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid command line: " << e.what();
        return 1;
    }

    FLAGS_v = configuration.config().log.level.get();
    return RunShardCommand(configuration);
}
