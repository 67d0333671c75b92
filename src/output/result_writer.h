#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "../partition/shard_assembler.h"

namespace Fleetshard {

/**
 * Parameters and statistics of a sharding run
 */
struct ShardMetadata {
    // RFC 3339 UTC, stamped by the caller
    std::string generated_at;
    std::string source_type;
    std::string source;
    std::string strategy;
    std::string seed;
    size_t total_ids_fetched = 0;
    size_t excluded_id_count = 0;
    size_t reserved_id_count = 0;
    size_t unreserved_ids_distributed = 0;
    int shard_count = 0;
};

/**
 * Serialisable top-level output: metadata plus shard_0..shard_{N-1}
 */
struct ShardResult {
    ShardMetadata metadata;
    std::vector<std::vector<std::string>> shards;
};

// Copies the assignment's buckets and counts into a result; the
// descriptive metadata fields are taken from metadata as given
ShardResult BuildShardResult(ShardAssignment assignment, ShardMetadata metadata);

// YYYY-MM-DDTHH:MM:SSZ
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

// Pretty-printed JSON (2-space indent) with a trailing newline
std::string ToJson(const ShardResult& result);

// Block-style YAML; IDs are double-quoted so they stay strings
std::string ToYaml(const ShardResult& result);

/**
 * Class for writing a shard result to stdout or a file
 */
class ResultWriter {
public:
    /**
     * Constructor
     * @param format "json" or "yaml"; anything else falls back to json
     * @param output_file Destination path, empty for stdout
     */
    ResultWriter(std::string format, std::string output_file);

    /**
     * Serializes and writes result.
     * Throws std::runtime_error when the destination cannot be written.
     */
    void Write(const ShardResult& result) const;

    // Serialized form without writing it anywhere
    std::string Render(const ShardResult& result) const;

private:
    std::string format_;
    std::string output_file_;
};

} // namespace Fleetshard
