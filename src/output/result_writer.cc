#include "result_writer.h"

#include <ctime>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "../common/shard_name.h"

namespace Fleetshard {

ShardResult BuildShardResult(ShardAssignment assignment, ShardMetadata metadata) {
    ShardResult result;
    result.metadata = std::move(metadata);
    result.metadata.total_ids_fetched = assignment.stats.total_fetched;
    result.metadata.excluded_id_count = assignment.stats.excluded_count;
    result.metadata.reserved_id_count = assignment.stats.reserved_count;
    result.metadata.unreserved_ids_distributed = assignment.stats.distributed_count;
    result.metadata.shard_count = assignment.stats.shard_count;
    result.shards = std::move(assignment.shards);
    return result;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

std::string ToJson(const ShardResult& result) {
    const ShardMetadata& m = result.metadata;
    nlohmann::ordered_json doc;
    doc["metadata"] = {
        {"generated_at", m.generated_at},
        {"source_type", m.source_type},
        {"source", m.source},
        {"strategy", m.strategy},
        {"seed", m.seed},
        {"total_ids_fetched", m.total_ids_fetched},
        {"excluded_id_count", m.excluded_id_count},
        {"reserved_id_count", m.reserved_id_count},
        {"unreserved_ids_distributed", m.unreserved_ids_distributed},
        {"shard_count", m.shard_count},
    };

    nlohmann::ordered_json shards = nlohmann::ordered_json::object();
    for (size_t i = 0; i < result.shards.size(); ++i) {
        shards[ShardName(static_cast<int>(i))] = result.shards[i];
    }
    doc["shards"] = std::move(shards);

    return doc.dump(2) + "\n";
}

std::string ToYaml(const ShardResult& result) {
    const ShardMetadata& m = result.metadata;
    YAML::Emitter out;

    out << YAML::BeginMap;
    out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "generated_at" << YAML::Value << m.generated_at;
    out << YAML::Key << "source_type" << YAML::Value << m.source_type;
    out << YAML::Key << "source" << YAML::Value << m.source;
    out << YAML::Key << "strategy" << YAML::Value << m.strategy;
    out << YAML::Key << "seed" << YAML::Value << YAML::DoubleQuoted << m.seed;
    out << YAML::Key << "total_ids_fetched" << YAML::Value << m.total_ids_fetched;
    out << YAML::Key << "excluded_id_count" << YAML::Value << m.excluded_id_count;
    out << YAML::Key << "reserved_id_count" << YAML::Value << m.reserved_id_count;
    out << YAML::Key << "unreserved_ids_distributed" << YAML::Value << m.unreserved_ids_distributed;
    out << YAML::Key << "shard_count" << YAML::Value << m.shard_count;
    out << YAML::EndMap;

    out << YAML::Key << "shards" << YAML::Value << YAML::BeginMap;
    for (size_t i = 0; i < result.shards.size(); ++i) {
        out << YAML::Key << ShardName(static_cast<int>(i)) << YAML::Value << YAML::BeginSeq;
        for (const auto& id : result.shards[i]) {
            out << YAML::DoubleQuoted << id;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    if (!out.good()) {
        throw std::runtime_error("Failed to marshal output as yaml: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

ResultWriter::ResultWriter(std::string format, std::string output_file)
    : format_(std::move(format)), output_file_(std::move(output_file)) {}

std::string ResultWriter::Render(const ShardResult& result) const {
    if (format_ == "yaml") {
        return ToYaml(result);
    }
    return ToJson(result);
}

void ResultWriter::Write(const ShardResult& result) const {
    std::string data = Render(result);

    if (output_file_.empty()) {
        std::cout << data;
        std::cout.flush();
        if (!std::cout) {
            throw std::runtime_error("Failed to write output to stdout");
        }
        return;
    }

    std::ofstream file(output_file_, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open output file: " + output_file_);
    }
    file << data;
    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write output to " + output_file_);
    }
    LOG(INFO) << "Output written to " << output_file_;
}

} // namespace Fleetshard
