#include <gtest/gtest.h>
#include "../../src/cli/shard_command.h"

#include <cstdio>
#include <fstream>
#include <memory>
#include <set>

#include <yaml-cpp/yaml.h>

using namespace Fleetshard;

class ShardCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string base = ::testing::TempDir() + "fleetshard_cli_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name();
        ids_path_ = base + "_ids.txt";
        output_path_ = base + "_out.yaml";

        std::ofstream ids(ids_path_);
        for (int i = 1; i <= 20; ++i) {
            ids << i << "\n";
        }
    }

    void TearDown() override {
        std::remove(ids_path_.c_str());
        std::remove(output_path_.c_str());
    }

    // File source, rendezvous over 3 shards, YAML to output_path_
    void UseFileRun() {
        auto& c = configuration_->config();
        c.source.type.override("file");
        c.source.path.override(ids_path_);
        c.sharding.strategy.override("rendezvous");
        c.sharding.shard_count.override(3);
        c.sharding.seed.override("cli");
        c.output.format.override("yaml");
        c.output.file.override(output_path_);
    }

    bool OutputExists() const {
        std::ifstream in(output_path_);
        return in.good();
    }

    std::unique_ptr<Configuration> configuration_ = Configuration::CreateStandalone();
    std::string ids_path_;
    std::string output_path_;
};

TEST_F(ShardCommandTest, BuildRequestDecodesShardNames) {
    auto& c = configuration_->config();
    c.sharding.strategy.override("size");
    c.sharding.shard_sizes.override({5, -1});
    c.sharding.seed.override("s");
    c.sharding.exclude_ids.override({"3"});
    c.sharding.reserved_ids.override({{"shard_1", {"9", "10"}}});

    auto request = BuildPartitionRequest(c, {"1", "2", "3"});
    EXPECT_EQ(request.ids, (std::vector<std::string>{"1", "2", "3"}));
    EXPECT_EQ(request.strategy, "size");
    EXPECT_EQ(request.seed, "s");
    EXPECT_EQ(request.params.sizes, (std::vector<int>{5, -1}));
    EXPECT_EQ(request.exclusions, (std::vector<std::string>{"3"}));
    ASSERT_EQ(request.reservations.count(1), 1u);
    EXPECT_EQ(request.reservations.at(1), (std::vector<std::string>{"9", "10"}));
}

TEST_F(ShardCommandTest, BuildRequestRejectsBadShardName) {
    auto& c = configuration_->config();
    c.sharding.reserved_ids.override({{"first", {"9"}}});
    EXPECT_THROW(BuildPartitionRequest(c, {}), std::invalid_argument);
}

TEST_F(ShardCommandTest, InvalidConfigurationFails) {
    UseFileRun();
    configuration_->config().sharding.shard_percentages.override({50, 50});
    EXPECT_EQ(RunShardCommand(*configuration_), 1);
    EXPECT_FALSE(OutputExists());
}

TEST_F(ShardCommandTest, MissingSourceFileFails) {
    UseFileRun();
    configuration_->config().source.path.override(ids_path_ + ".missing");
    EXPECT_EQ(RunShardCommand(*configuration_), 1);
    EXPECT_FALSE(OutputExists());
}

TEST_F(ShardCommandTest, OutOfRangeReservationFails) {
    UseFileRun();
    configuration_->config().sharding.reserved_ids.override({{"shard_5", {"1"}}});
    EXPECT_EQ(RunShardCommand(*configuration_), 1);
    EXPECT_FALSE(OutputExists());
}

TEST_F(ShardCommandTest, WritesCompleteAssignment) {
    UseFileRun();
    auto& c = configuration_->config();
    c.sharding.exclude_ids.override({"4"});
    c.sharding.reserved_ids.override({{"shard_2", {"7"}}});

    ASSERT_EQ(RunShardCommand(*configuration_), 0);

    YAML::Node doc = YAML::LoadFile(output_path_);
    const YAML::Node metadata = doc["metadata"];
    EXPECT_EQ(metadata["source_type"].as<std::string>(), "file");
    EXPECT_EQ(metadata["source"].as<std::string>(), "file:" + ids_path_);
    EXPECT_EQ(metadata["strategy"].as<std::string>(), "rendezvous");
    EXPECT_EQ(metadata["seed"].as<std::string>(), "cli");
    EXPECT_EQ(metadata["total_ids_fetched"].as<int>(), 20);
    EXPECT_EQ(metadata["excluded_id_count"].as<int>(), 1);
    EXPECT_EQ(metadata["reserved_id_count"].as<int>(), 1);
    EXPECT_EQ(metadata["unreserved_ids_distributed"].as<int>(), 18);
    EXPECT_EQ(metadata["shard_count"].as<int>(), 3);
    EXPECT_FALSE(metadata["generated_at"].as<std::string>().empty());

    std::set<std::string> seen;
    bool reserved_in_shard_2 = false;
    for (int i = 0; i < 3; ++i) {
        const YAML::Node shard = doc["shards"]["shard_" + std::to_string(i)];
        ASSERT_TRUE(shard.IsSequence());
        for (const auto& id : shard) {
            EXPECT_TRUE(seen.insert(id.as<std::string>()).second);
            if (i == 2 && id.as<std::string>() == "7") {
                reserved_in_shard_2 = true;
            }
        }
    }
    EXPECT_EQ(seen.size(), 19u);
    EXPECT_EQ(seen.count("4"), 0u);
    EXPECT_TRUE(reserved_in_shard_2);
}

TEST_F(ShardCommandTest, BuildRequestMergesAliasedShardNames) {
    auto& c = configuration_->config();
    c.sharding.reserved_ids.override({{"shard_01", {"101"}}, {"shard_1", {"102"}}});

    auto request = BuildPartitionRequest(c, {});
    ASSERT_EQ(request.reservations.size(), 1u);
    std::set<std::string> pinned(request.reservations.at(1).begin(), request.reservations.at(1).end());
    EXPECT_EQ(pinned, (std::set<std::string>{"101", "102"}));
}

TEST_F(ShardCommandTest, AliasedShardNamesKeepEveryPin) {
    {
        std::ofstream ids(ids_path_, std::ios::trunc);
        ids << "101\n102\n103\n104\n105\n106\n";
    }
    UseFileRun();
    auto& c = configuration_->config();
    c.sharding.strategy.override("round-robin");
    c.sharding.seed.override("");
    c.sharding.reserved_ids.override({{"shard_01", {"101"}}, {"shard_1", {"102"}}});

    ASSERT_EQ(RunShardCommand(*configuration_), 0);

    YAML::Node doc = YAML::LoadFile(output_path_);
    EXPECT_EQ(doc["metadata"]["reserved_id_count"].as<int>(), 2);
    EXPECT_EQ(doc["metadata"]["unreserved_ids_distributed"].as<int>(), 4);
    EXPECT_EQ(doc["shards"]["shard_0"].as<std::vector<std::string>>(),
              (std::vector<std::string>{"103", "106"}));
    EXPECT_EQ(doc["shards"]["shard_1"].as<std::vector<std::string>>(),
              (std::vector<std::string>{"101", "102", "104"}));
    EXPECT_EQ(doc["shards"]["shard_2"].as<std::vector<std::string>>(),
              (std::vector<std::string>{"105"}));
}
