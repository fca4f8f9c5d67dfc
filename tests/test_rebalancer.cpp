// Test: Rebalancer
// Distribution analysis, imbalance detection and sampled row moves

#include <gtest/gtest.h>
#include "sharding/data_migrator.h"
#include "sharding/memory_adapter.h"
#include "sharding/prometheus_metrics.h"
#include "sharding/rebalancer.h"
#include "sharding/shard_registry.h"
#include "sharding/shard_router.h"
#include <algorithm>
#include <map>

using namespace sams::sharding;

// ===== Imbalance detection =====

TEST(ImbalanceDetectionTest, EvenDistributionIsBalanced) {
    DistributionMatrix matrix{
        {"A", {{"alerts", 100}}},
        {"B", {{"alerts", 100}}},
        {"C", {{"alerts", 100}}}
    };
    EXPECT_TRUE(Rebalancer::identifyImbalanced(matrix, 0.2).empty());
}

TEST(ImbalanceDetectionTest, DeviationWithinThresholdIsBalanced) {
    DistributionMatrix matrix{
        {"A", {{"alerts", 110}}},
        {"B", {{"alerts", 95}}},
        {"C", {{"alerts", 95}}}
    };
    EXPECT_TRUE(Rebalancer::identifyImbalanced(matrix, 0.2).empty());
}

TEST(ImbalanceDetectionTest, OverAndUnderloadedShardsAreReported) {
    // mean 100, allowed deviation 20
    DistributionMatrix matrix{
        {"A", {{"alerts", 150}}},
        {"B", {{"alerts", 75}}},
        {"C", {{"alerts", 75}}}
    };
    EXPECT_EQ(Rebalancer::identifyImbalanced(matrix, 0.2),
              (std::vector<std::string>{"A", "B", "C"}));

    EXPECT_TRUE(Rebalancer::identifyImbalanced(matrix, 0.6).empty());
}

TEST(ImbalanceDetectionTest, TablesAreJudgedSeparately) {
    DistributionMatrix matrix{
        {"A", {{"alerts", 100}, {"metrics", 10}}},
        {"B", {{"alerts", 100}, {"metrics", 10}}},
        {"C", {{"alerts", 100}, {"metrics", 40}}}
    };
    // metrics: mean 20, A and B deviate by 10, C by 20
    EXPECT_EQ(Rebalancer::identifyImbalanced(matrix, 0.2),
              (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(Rebalancer::identifyImbalanced(matrix, 0.9),
              (std::vector<std::string>{"C"}));
}

TEST(ImbalanceDetectionTest, MissingTableCountsAsZero) {
    DistributionMatrix matrix{
        {"A", {{"alerts", 50}}},
        {"B", {{"alerts", 50}}},
        {"C", {}}
    };
    EXPECT_EQ(Rebalancer::identifyImbalanced(matrix, 0.2),
              (std::vector<std::string>{"A", "B", "C"}));
}

TEST(ImbalanceDetectionTest, EmptyTablesAndEmptyMatrix) {
    DistributionMatrix empty_tables{
        {"A", {{"alerts", 0}}},
        {"B", {{"alerts", 0}}}
    };
    EXPECT_TRUE(Rebalancer::identifyImbalanced(empty_tables, 0.2).empty());
    EXPECT_TRUE(Rebalancer::identifyImbalanced(DistributionMatrix{}, 0.2).empty());
}

TEST(RebalanceStateTest, Names) {
    EXPECT_STREQ(rebalanceStateToString(RebalanceState::PLANNED), "PLANNED");
    EXPECT_STREQ(rebalanceStateToString(RebalanceState::IN_PROGRESS), "IN_PROGRESS");
    EXPECT_STREQ(rebalanceStateToString(RebalanceState::COMPLETED), "COMPLETED");
    EXPECT_STREQ(rebalanceStateToString(RebalanceState::FAILED), "FAILED");
}

// ===== Rebalancing a live cluster =====

class RebalancerTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<AdapterFactory>();
        factory_->registerKind("memory", [this](const ShardConfig& config) {
            auto adapter = std::make_shared<MemoryAdapter>();
            adapters_[config.database] = adapter;
            return adapter;
        });

        registry_ = std::make_unique<ShardRegistry>(ShardRegistry::Config{}, factory_);
        for (const auto& id : {"A", "B", "C"}) {
            ShardConfig config;
            config.database = id;
            registry_->addShard(id, config);
        }
        registry_->setShardKey("alerts", "server_id");
        registry_->setReplicationFactor(1);

        ShardRouter::Config router_config;
        router_config.adapter_timeout = std::chrono::milliseconds(200);
        router_ = std::make_unique<ShardRouter>(*registry_, metrics_, router_config);

        DataMigrator::Config migrator_config;
        migrator_config.adapter_timeout = std::chrono::milliseconds(200);
        migrator_ = std::make_unique<DataMigrator>(*registry_, *router_, metrics_, migrator_config);

        for (int i = 1; i <= 60; ++i) {
            router_->distributeData("alerts", {{"id", i}, {"server_id", "srv-" + std::to_string(i)}});
        }

        config_.adapter_timeout = std::chrono::milliseconds(200);
    }

    void TearDown() override {
        for (const auto& [id, adapter] : adapters_) {
            EXPECT_EQ(adapter->inFlight().load(), 0u) << "shard " << id;
        }
    }

    // Writes rows straight into A even though the ring places them elsewhere
    size_t misplaceRowsOnA(int count) {
        size_t placed = 0;
        for (int i = 1000; placed < static_cast<size_t>(count); ++i) {
            std::string server = "srv-" + std::to_string(i);
            if (router_->getShardForKey(server) == "A") {
                continue;
            }
            adapters_["A"]->insert("alerts", {{"id", i}, {"server_id", server}});
            placed++;
        }
        return placed;
    }

    size_t totalRows() const {
        size_t rows = 0;
        for (const auto& [id, adapter] : adapters_) {
            rows += adapter->rowCount("alerts");
        }
        return rows;
    }

    std::shared_ptr<AdapterFactory> factory_;
    std::map<std::string, std::shared_ptr<MemoryAdapter>> adapters_;
    std::unique_ptr<ShardRegistry> registry_;
    PrometheusMetrics metrics_;
    std::unique_ptr<ShardRouter> router_;
    std::unique_ptr<DataMigrator> migrator_;
    Rebalancer::Config config_;
};

TEST_F(RebalancerTest, AnalyzeCountsRowsPerShard) {
    Rebalancer rebalancer(*registry_, *migrator_, metrics_, config_);
    auto matrix = rebalancer.analyzeDistribution();

    ASSERT_EQ(matrix.size(), 3u);
    uint64_t total = 0;
    for (const auto& [shard_id, per_table] : matrix) {
        EXPECT_EQ(per_table.at("alerts"), adapters_[shard_id]->rowCount("alerts"));
        total += per_table.at("alerts");
    }
    EXPECT_EQ(total, 60u);
}

TEST_F(RebalancerTest, UnreachableShardCountsAsEmpty) {
    adapters_["B"]->setOnline(false);

    Rebalancer rebalancer(*registry_, *migrator_, metrics_, config_);
    auto matrix = rebalancer.analyzeDistribution();
    EXPECT_EQ(matrix.at("B").at("alerts"), 0u);
}

TEST_F(RebalancerTest, InactiveShardsAreLeftOut) {
    registry_->markShardDown("C");

    Rebalancer rebalancer(*registry_, *migrator_, metrics_, config_);
    auto matrix = rebalancer.analyzeDistribution();
    EXPECT_EQ(matrix.size(), 2u);
    EXPECT_EQ(matrix.count("C"), 0u);
}

TEST_F(RebalancerTest, MisplacedRowsAreMovedToTheirOwners) {
    const size_t misplaced = misplaceRowsOnA(40);

    Rebalancer rebalancer(*registry_, *migrator_, metrics_, config_);
    auto report = rebalancer.rebalance();

    EXPECT_EQ(report.state, RebalanceState::COMPLETED);
    EXPECT_NE(std::find(report.imbalanced_shards.begin(), report.imbalanced_shards.end(), "A"),
              report.imbalanced_shards.end());
    EXPECT_EQ(report.rows_moved, misplaced);
    EXPECT_EQ(report.rows_failed, 0u);
    EXPECT_EQ(totalRows(), 60u + misplaced);

    // Every row now sits on its primary
    for (const auto& [shard_id, adapter] : adapters_) {
        for (const auto& row : adapter->rows("alerts")) {
            EXPECT_EQ(router_->getShardForKey(row["server_id"].get<std::string>()), shard_id);
        }
    }

    EXPECT_EQ(rebalancer.getState(), RebalanceState::COMPLETED);
    EXPECT_EQ(rebalancer.getLastReport().rows_moved, misplaced);
    EXPECT_EQ(metrics_.getCounter("sams_rebalance_runs_total"), 1);
    EXPECT_EQ(metrics_.getCounter("sams_rebalance_rows_total", {{"outcome", "moved"}}),
              static_cast<int64_t>(misplaced));
}

TEST_F(RebalancerTest, SampleSizeBoundsRowsPerTable) {
    misplaceRowsOnA(40);

    config_.sample_size = 5;
    Rebalancer rebalancer(*registry_, *migrator_, metrics_, config_);
    auto report = rebalancer.rebalance();

    EXPECT_LE(report.rows_sampled, 5u * report.shards_examined);
    EXPECT_LE(report.rows_moved, 5u);
}

TEST_F(RebalancerTest, BalancedClusterMovesNothing) {
    config_.threshold = 10.0;
    Rebalancer rebalancer(*registry_, *migrator_, metrics_, config_);
    auto report = rebalancer.rebalance();

    EXPECT_EQ(report.state, RebalanceState::COMPLETED);
    EXPECT_TRUE(report.imbalanced_shards.empty());
    EXPECT_EQ(report.rows_sampled, 0u);
    EXPECT_EQ(report.rows_moved, 0u);

    auto j = report.toJson();
    EXPECT_EQ(j["state"], "COMPLETED");
    EXPECT_EQ(j["rowsMoved"], 0);
}

TEST_F(RebalancerTest, UnreachableOwnerCountsAsFailedMove) {
    misplaceRowsOnA(10);
    const size_t on_a = adapters_["A"]->rowCount("alerts");
    adapters_["B"]->setOnline(false);
    adapters_["C"]->setOnline(false);

    Rebalancer rebalancer(*registry_, *migrator_, metrics_, config_);
    auto report = rebalancer.rebalance();

    EXPECT_EQ(report.state, RebalanceState::COMPLETED);
    EXPECT_EQ(report.rows_moved, 0u);
    EXPECT_EQ(report.rows_failed, 10u);
    EXPECT_EQ(adapters_["A"]->rowCount("alerts"), on_a);
}

TEST_F(RebalancerTest, InvalidConfigurationIsRejected) {
    Rebalancer::Config negative;
    negative.threshold = -0.1;
    EXPECT_THROW({ Rebalancer rebalancer(*registry_, *migrator_, metrics_, negative); }, ShardingError);

    Rebalancer::Config no_sample;
    no_sample.sample_size = 0;
    EXPECT_THROW({ Rebalancer rebalancer(*registry_, *migrator_, metrics_, no_sample); }, ShardingError);
}
