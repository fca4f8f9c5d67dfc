// Test: Shard Router
// Keyed writes, replication fan-out and keyed queries

#include <gtest/gtest.h>
#include "sharding/memory_adapter.h"
#include "sharding/prometheus_metrics.h"
#include "sharding/shard_registry.h"
#include "sharding/shard_router.h"
#include <algorithm>
#include <map>
#include <set>
#include <thread>

using namespace sams::sharding;

class ShardRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<AdapterFactory>();
        factory_->registerKind("memory", [this](const ShardConfig& config) {
            auto adapter = std::make_shared<MemoryAdapter>();
            adapters_[config.database] = adapter;
            return adapter;
        });

        registry_ = std::make_unique<ShardRegistry>(ShardRegistry::Config{}, factory_);

        ShardRouter::Config config;
        config.adapter_timeout = std::chrono::milliseconds(150);
        config.replica_timeout = std::chrono::milliseconds(150);
        router_ = std::make_unique<ShardRouter>(*registry_, metrics_, config);
    }

    void TearDown() override {
        // Let workers that outlived a timeout finish
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    void addShards(std::initializer_list<std::string> ids) {
        for (const auto& id : ids) {
            ShardConfig config;
            config.database = id;
            registry_->addShard(id, config);
        }
    }

    size_t copiesOf(const std::string& table, const std::string& server_id) {
        size_t copies = 0;
        for (const auto& [id, adapter] : adapters_) {
            for (const auto& row : adapter->rows(table)) {
                if (row.value("server_id", std::string()) == server_id) {
                    copies++;
                }
            }
        }
        return copies;
    }

    std::shared_ptr<AdapterFactory> factory_;
    std::map<std::string, std::shared_ptr<MemoryAdapter>> adapters_;
    std::unique_ptr<ShardRegistry> registry_;
    PrometheusMetrics metrics_;
    std::unique_ptr<ShardRouter> router_;
};

// ===== Validation =====

TEST_F(ShardRouterTest, TableWithoutShardKeyIsRejected) {
    addShards({"A"});
    try {
        router_->distributeData("alerts", {{"id", 1}, {"server_id", "srv-1"}});
        FAIL() << "expected NO_SHARD_KEY_CONFIGURED";
    } catch (const ShardingError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NO_SHARD_KEY_CONFIGURED);
    }
}

TEST_F(ShardRouterTest, MissingOrNullKeyValueIsRejected) {
    addShards({"A"});
    registry_->setShardKey("alerts", "server_id");

    for (const auto& row : {Row{{"id", 1}}, Row{{"id", 2}, {"server_id", nullptr}}}) {
        try {
            router_->distributeData("alerts", row);
            FAIL() << "expected MISSING_SHARD_KEY_VALUE for " << row.dump();
        } catch (const ShardingError& e) {
            EXPECT_EQ(e.code(), ErrorCode::MISSING_SHARD_KEY_VALUE);
        }
    }
    EXPECT_EQ(adapters_["A"]->rowCount("alerts"), 0u);
}

TEST_F(ShardRouterTest, NonObjectRowIsRejected) {
    addShards({"A"});
    registry_->setShardKey("alerts", "server_id");

    try {
        router_->distributeData("alerts", Row::array({1, 2}));
        FAIL() << "expected INVALID_ARGUMENT";
    } catch (const ShardingError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }
}

TEST_F(ShardRouterTest, EmptyClusterHasNoShards) {
    registry_->setShardKey("alerts", "server_id");
    try {
        router_->distributeData("alerts", {{"id", 1}, {"server_id", "srv-1"}});
        FAIL() << "expected NO_SHARDS_AVAILABLE";
    } catch (const ShardingError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NO_SHARDS_AVAILABLE);
    }
}

// ===== Routing =====

TEST_F(ShardRouterTest, SingleCopyLandsOnPrimary) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("alerts", "server_id");
    registry_->setReplicationFactor(1);

    for (int i = 1; i <= 30; ++i) {
        std::string server = "srv-" + std::to_string(i);
        auto result = router_->distributeData("alerts", {{"id", i}, {"server_id", server}});

        EXPECT_EQ(result.primary_shard_id, router_->getShardForKey(server));
        EXPECT_TRUE(result.replica_shard_ids.empty());
        EXPECT_TRUE(adapters_[result.primary_shard_id]->findById("alerts", i).has_value());
        EXPECT_EQ(copiesOf("alerts", server), 1u);
    }
}

TEST_F(ShardRouterTest, ReplicationFactorTwoStoresTwoCopies) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("alerts", "server_id");
    registry_->setReplicationFactor(2);

    for (int i = 1; i <= 30; ++i) {
        std::string server = "srv-" + std::to_string(i);
        auto result = router_->distributeData("alerts", {{"id", i}, {"server_id", server}});

        ASSERT_EQ(result.replica_shard_ids.size(), 1u);
        EXPECT_NE(result.replica_shard_ids[0], result.primary_shard_id);
        EXPECT_TRUE(adapters_[result.replica_shard_ids[0]]->findById("alerts", i).has_value());
        EXPECT_EQ(copiesOf("alerts", server), 2u);
    }
    EXPECT_EQ(router_->getStatistics()["replica_writes"], 30);
}

TEST_F(ShardRouterTest, ReplicasFollowThePrimaryOnTheRing) {
    addShards({"A", "B", "C", "D"});
    registry_->setShardKey("alerts", "server_id");
    registry_->setReplicationFactor(3);
    auto ring = registry_->ring();

    for (int i = 1; i <= 30; ++i) {
        std::string server = "srv-" + std::to_string(i);
        auto result = router_->distributeData("alerts", {{"server_id", server}});

        auto expected = ring->replicasFor(result.primary_shard_id, 2, registry_->activePredicate());
        EXPECT_EQ(result.replica_shard_ids, expected) << server;

        auto owners = router_->getOwnersForKey(server);
        ASSERT_EQ(owners.size(), 3u);
        EXPECT_EQ(owners[0], result.primary_shard_id);
        EXPECT_EQ(std::vector<std::string>(owners.begin() + 1, owners.end()), expected);
    }
}

TEST_F(ShardRouterTest, ReplicationFactorIsCappedByActiveShards) {
    addShards({"A", "B"});
    registry_->setShardKey("alerts", "server_id");
    registry_->setReplicationFactor(5);

    auto result = router_->distributeData("alerts", {{"id", 1}, {"server_id", "srv-1"}});
    EXPECT_EQ(result.replica_shard_ids.size(), 1u);
    EXPECT_EQ(copiesOf("alerts", "srv-1"), 2u);
}

TEST_F(ShardRouterTest, AssignedIdentityIsReplicated) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("alerts", "server_id");

    auto result = router_->distributeData("alerts", {{"server_id", "srv-7"}});
    ASSERT_TRUE(result.stored.contains("id"));
    ASSERT_TRUE(result.stored["id"].is_string());
    ASSERT_EQ(result.replica_shard_ids.size(), 1u);

    auto primary = adapters_[result.primary_shard_id]->findById("alerts", result.stored["id"]);
    auto replica = adapters_[result.replica_shard_ids[0]]->findById("alerts", result.stored["id"]);
    ASSERT_TRUE(primary.has_value());
    ASSERT_TRUE(replica.has_value());
    EXPECT_EQ(*primary, *replica);
}

TEST_F(ShardRouterTest, RowsWithoutIdGetClusterUniqueIds) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("alerts", "server_id");

    std::set<std::string> ids;
    for (int i = 1; i <= 100; ++i) {
        auto result = router_->distributeData("alerts", {{"server_id", "srv-" + std::to_string(i)}});
        EXPECT_TRUE(result.failed_replicas.empty()) << "srv-" << i;
        EXPECT_TRUE(ids.insert(result.stored["id"].get<std::string>()).second);
    }
    EXPECT_EQ(router_->getStatistics()["replica_failures"], 0);

    size_t copies = 0;
    for (const auto& [id, adapter] : adapters_) {
        copies += adapter->rowCount("alerts");
    }
    EXPECT_EQ(copies, 200u);
}

TEST_F(ShardRouterTest, CallerSuppliedIdIsKept) {
    addShards({"A", "B"});
    registry_->setShardKey("alerts", "server_id");

    auto result = router_->distributeData("alerts", {{"id", 42}, {"server_id", "srv-1"}});
    EXPECT_EQ(result.stored["id"], 42);

    auto null_id = router_->distributeData("alerts", {{"id", nullptr}, {"server_id", "srv-2"}});
    EXPECT_TRUE(null_id.stored["id"].is_string());
}

TEST(ShardRouterKeyTest, GeneratedRowIdIsVersion4Uuid) {
    auto id = ShardRouter::generateRowId();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_EQ(id[18], '-');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
    EXPECT_EQ(id[23], '-');
    EXPECT_NE(id, ShardRouter::generateRowId());
}

TEST_F(ShardRouterTest, FailedReplicaDoesNotFailWrite) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("alerts", "server_id");
    registry_->setReplicationFactor(3);

    auto owners = router_->getOwnersForKey("srv-1");
    ASSERT_EQ(owners.size(), 3u);
    adapters_[owners[2]]->setOnline(false);

    auto result = router_->distributeData("alerts", {{"id", 1}, {"server_id", "srv-1"}});
    EXPECT_EQ(result.primary_shard_id, owners[0]);
    EXPECT_EQ(result.failed_replicas, (std::vector<std::string>{owners[2]}));
    EXPECT_EQ(copiesOf("alerts", "srv-1"), 2u);
    EXPECT_EQ(metrics_.getCounter("sams_replica_write_failures_total", {{"shard_id", owners[2]}}), 1);
}

TEST_F(ShardRouterTest, FailedPrimaryFailsWrite) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("alerts", "server_id");

    auto primary = router_->getShardForKey("srv-1");
    adapters_[primary]->setOnline(false);

    EXPECT_THROW(router_->distributeData("alerts", {{"id", 1}, {"server_id", "srv-1"}}), AdapterError);
    EXPECT_EQ(copiesOf("alerts", "srv-1"), 0u);
}

TEST_F(ShardRouterTest, SlowPrimaryTimesOut) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("alerts", "server_id");

    auto primary = router_->getShardForKey("srv-1");
    adapters_[primary]->setLatency(std::chrono::milliseconds(400));

    try {
        router_->distributeData("alerts", {{"id", 1}, {"server_id", "srv-1"}});
        FAIL() << "expected a timeout";
    } catch (const AdapterError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TIMEOUT);
    }

    adapters_[primary]->setLatency(std::chrono::milliseconds(0));
    std::this_thread::sleep_for(std::chrono::milliseconds(450));
}

TEST_F(ShardRouterTest, InactivePrimaryIsSkipped) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("alerts", "server_id");
    registry_->setReplicationFactor(1);

    auto primary = router_->getShardForKey("srv-1");
    registry_->markShardDown(primary);

    auto result = router_->distributeData("alerts", {{"id", 1}, {"server_id", "srv-1"}});
    EXPECT_NE(result.primary_shard_id, primary);
    EXPECT_EQ(adapters_[primary]->rowCount("alerts"), 0u);
}

TEST_F(ShardRouterTest, KeyedQueryHitsOwningShard) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("alerts", "server_id");
    registry_->setReplicationFactor(1);

    router_->distributeData("alerts", {{"id", 1}, {"server_id", "srv-1"}});
    router_->distributeData("alerts", {{"id", 2}, {"server_id", "srv-1"}});

    auto result = router_->queryShardByKey("srv-1", "SELECT * FROM alerts WHERE server_id = ?", {"srv-1"});
    EXPECT_EQ(result.row_count, 2u);
}

TEST_F(ShardRouterTest, NumericKeysRouteLikeTheirText) {
    addShards({"A", "B", "C"});
    registry_->setShardKey("metrics", "host_id");

    auto result = router_->distributeData("metrics", {{"id", 1}, {"host_id", 42}});
    EXPECT_EQ(result.primary_shard_id, router_->getShardForKey("42"));
}

TEST(ShardRouterKeyTest, StringifyKey) {
    EXPECT_EQ(ShardRouter::stringifyKey("srv-1"), "srv-1");
    EXPECT_EQ(ShardRouter::stringifyKey(42), "42");
    EXPECT_EQ(ShardRouter::stringifyKey(true), "true");
    EXPECT_EQ(ShardRouter::stringifyKey(false), "false");
}
