// Test: Data Migrator
// Moving rows off a shard that leaves the ring

#include <gtest/gtest.h>
#include "sharding/data_migrator.h"
#include "sharding/memory_adapter.h"
#include "sharding/prometheus_metrics.h"
#include "sharding/shard_registry.h"
#include "sharding/shard_router.h"
#include <algorithm>
#include <map>

using namespace sams::sharding;

class DataMigratorTest : public ::testing::Test {
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
        registry_->setReplicationFactor(2);

        ShardRouter::Config router_config;
        router_config.adapter_timeout = std::chrono::milliseconds(200);
        router_config.replica_timeout = std::chrono::milliseconds(200);
        router_ = std::make_unique<ShardRouter>(*registry_, metrics_, router_config);

        DataMigrator::Config migrator_config;
        migrator_config.adapter_timeout = std::chrono::milliseconds(200);
        migrator_ = std::make_unique<DataMigrator>(*registry_, *router_, metrics_, migrator_config);

        for (int i = 1; i <= 60; ++i) {
            router_->distributeData("alerts", {{"id", i}, {"server_id", "srv-" + std::to_string(i)}});
        }
    }

    void TearDown() override {
        for (const auto& [id, adapter] : adapters_) {
            EXPECT_EQ(adapter->inFlight().load(), 0u) << "shard " << id;
        }
    }

    size_t totalCopies() const {
        size_t copies = 0;
        for (const auto& [id, adapter] : adapters_) {
            copies += adapter->rowCount("alerts");
        }
        return copies;
    }

    std::shared_ptr<AdapterFactory> factory_;
    std::map<std::string, std::shared_ptr<MemoryAdapter>> adapters_;
    std::unique_ptr<ShardRegistry> registry_;
    PrometheusMetrics metrics_;
    std::unique_ptr<ShardRouter> router_;
    std::unique_ptr<DataMigrator> migrator_;
};

TEST_F(DataMigratorTest, DrainedShardEndsEmptyWithReplicasRestored) {
    ASSERT_EQ(totalCopies(), 120u);
    const size_t on_b = adapters_["B"]->rowCount("alerts");
    ASSERT_GT(on_b, 0u);

    registry_->beginRemoval("B");
    auto result = migrator_->migrateShardData("B");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.records_migrated, on_b);
    EXPECT_EQ(result.failed, 0u);
    EXPECT_EQ(adapters_["B"]->rowCount("alerts"), 0u);

    // With two shards left every row lives on both
    for (int i = 1; i <= 60; ++i) {
        EXPECT_TRUE(adapters_["A"]->findById("alerts", i).has_value()) << "row " << i;
        EXPECT_TRUE(adapters_["C"]->findById("alerts", i).has_value()) << "row " << i;
    }
    EXPECT_EQ(metrics_.getCounter("sams_migration_rows_total",
                                  {{"shard_id", "B"}, {"outcome", "migrated"}}),
              static_cast<int64_t>(on_b));
}

TEST_F(DataMigratorTest, RowsWithoutShardKeyValueAreSkipped) {
    adapters_["B"]->insert("alerts", {{"id", 1000}, {"severity", "low"}});

    registry_->beginRemoval("B");
    auto result = migrator_->migrateShardData("B");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_TRUE(adapters_["B"]->findById("alerts", 1000).has_value());
}

TEST_F(DataMigratorTest, UnreachableTargetLeavesRowsOnSource) {
    const size_t on_b = adapters_["B"]->rowCount("alerts");
    adapters_["A"]->setOnline(false);

    registry_->beginRemoval("B");
    auto result = migrator_->migrateShardData("B");

    // Every remaining owner set includes A
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failed, on_b);
    EXPECT_EQ(result.records_migrated, 0u);
    EXPECT_EQ(result.errors.size(), on_b);
    EXPECT_EQ(adapters_["B"]->rowCount("alerts"), on_b);

    auto j = result.toJson();
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["failed"], on_b);
}

TEST_F(DataMigratorTest, UnreadableSourceIsReportedAsError) {
    adapters_["B"]->setOnline(false);

    registry_->beginRemoval("B");
    auto result = migrator_->migrateShardData("B");

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("alerts"), std::string::npos);
}

TEST_F(DataMigratorTest, ProgressIsReportedPerTable) {
    registry_->setShardKey("metrics", "host_id");
    adapters_["B"]->insert("metrics", {{"id", 1}, {"host_id", "h-1"}});

    std::vector<MigrationProgress> reports;
    registry_->beginRemoval("B");
    migrator_->migrateShardData("B", [&](const MigrationProgress& progress) {
        reports.push_back(progress);
    });

    ASSERT_EQ(reports.size(), 2u);
    for (const auto& progress : reports) {
        EXPECT_DOUBLE_EQ(progress.progress_percent, 100.0);
        EXPECT_EQ(progress.records_migrated, progress.total_records);
    }
}

TEST_F(DataMigratorTest, RowAlreadyOnOwnerIsNotMoved) {
    auto owners = router_->getOwnersForKey("srv-1");
    ASSERT_EQ(owners.size(), 2u);

    auto row = adapters_[owners[0]]->findById("alerts", 1);
    ASSERT_TRUE(row.has_value());
    EXPECT_FALSE(migrator_->relocateRow(owners[0], "alerts", *row));
    EXPECT_TRUE(adapters_[owners[0]]->findById("alerts", 1).has_value());
}

TEST_F(DataMigratorTest, MisplacedRowMovesToItsOwners) {
    auto owners = router_->getOwnersForKey("srv-500");
    std::string stray;
    for (const auto& id : {"A", "B", "C"}) {
        if (std::find(owners.begin(), owners.end(), id) == owners.end()) {
            stray = id;
        }
    }
    ASSERT_FALSE(stray.empty());

    Row row{{"id", 500}, {"server_id", "srv-500"}};
    adapters_[stray]->insert("alerts", row);

    EXPECT_TRUE(migrator_->relocateRow(stray, "alerts", row));
    EXPECT_FALSE(adapters_[stray]->findById("alerts", 500).has_value());
    for (const auto& owner : owners) {
        EXPECT_TRUE(adapters_[owner]->findById("alerts", 500).has_value());
    }
}

TEST_F(DataMigratorTest, DifferentRowUnderSameIdKeepsSourceCopy) {
    auto owners = router_->getOwnersForKey("srv-700");
    std::string stray;
    for (const auto& id : {"A", "B", "C"}) {
        if (std::find(owners.begin(), owners.end(), id) == owners.end()) {
            stray = id;
        }
    }
    ASSERT_FALSE(stray.empty());

    Row unrelated{{"id", 700}, {"server_id", "srv-other"}};
    adapters_[owners[0]]->insert("alerts", unrelated);
    Row row{{"id", 700}, {"server_id", "srv-700"}};
    adapters_[stray]->insert("alerts", row);

    try {
        migrator_->relocateRow(stray, "alerts", row);
        FAIL() << "expected ROW_CONFLICT";
    } catch (const ShardingError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ROW_CONFLICT);
    }

    auto kept = adapters_[stray]->findById("alerts", 700);
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(*kept, row);
    auto other = adapters_[owners[0]]->findById("alerts", 700);
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(*other, unrelated);
}

TEST_F(DataMigratorTest, ConflictingRowCountsAsFailedDuringDrain) {
    auto owners = router_->getOwnersForKey("srv-800");
    auto is_owner = [&owners](const std::string& id) {
        return std::find(owners.begin(), owners.end(), id) != owners.end();
    };

    // Drain a shard that is not an owner so the row has to move
    std::string drained;
    for (const auto& id : {"A", "B", "C"}) {
        if (!is_owner(id)) drained = id;
    }
    ASSERT_FALSE(drained.empty());

    registry_->beginRemoval(drained);
    auto survivors = router_->getOwnersForKey("srv-800");
    Row row{{"id", 800}, {"server_id", "srv-800"}};
    adapters_[drained]->insert("alerts", row);
    adapters_[survivors[0]]->insert("alerts", {{"id", 800}, {"server_id", "srv-unrelated"}});

    auto result = migrator_->migrateShardData(drained);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failed, 1u);
    auto kept = adapters_[drained]->findById("alerts", 800);
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(*kept, row);
}

TEST_F(DataMigratorTest, UnknownShardThrows) {
    try {
        migrator_->migrateShardData("Z");
        FAIL() << "expected SHARD_NOT_FOUND";
    } catch (const ShardingError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SHARD_NOT_FOUND);
    }
}
