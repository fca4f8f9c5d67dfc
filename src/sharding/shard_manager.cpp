#define SAMS_LOG_COMPONENT "manager"

#include "sharding/shard_manager.h"
#include "sharding/adapter_call.h"
#include "utils/logger.h"
#include <algorithm>

namespace sams::sharding {

namespace {

ShardRegistry::Config registryConfig(const ShardingConfig& config) {
    ShardRegistry::Config rc;
    rc.virtual_nodes = config.virtual_nodes;
    rc.adapter_timeout = config.adapter_timeout;
    return rc;
}

ShardRouter::Config routerConfig(const ShardingConfig& config) {
    ShardRouter::Config rc;
    rc.adapter_timeout = config.adapter_timeout;
    rc.replica_timeout = config.replica_timeout;
    rc.row_id_column = config.row_id_column;
    return rc;
}

ScatterGatherEngine::Config scatterConfig(const ShardingConfig& config) {
    ScatterGatherEngine::Config sc;
    sc.query_timeout = config.adapter_timeout;
    sc.collapse_replicas = config.scatter_gather.collapse_replicas;
    sc.row_id_column = config.row_id_column;
    return sc;
}

DataMigrator::Config migratorConfig(const ShardingConfig& config) {
    DataMigrator::Config mc;
    mc.adapter_timeout = config.adapter_timeout;
    mc.row_id_column = config.row_id_column;
    return mc;
}

Rebalancer::Config rebalancerConfig(const ShardingConfig& config) {
    Rebalancer::Config rc;
    rc.threshold = config.rebalance.threshold;
    rc.sample_size = config.rebalance.sample_size;
    rc.adapter_timeout = config.adapter_timeout;
    return rc;
}

HealthMonitor::Config healthConfig(const ShardingConfig& config) {
    HealthMonitor::Config hc;
    hc.check_interval = config.health_check.interval;
    hc.probe_timeout = config.health_check.probe_timeout;
    return hc;
}

const ShardingConfig& validated(const ShardingConfig& config) {
    config.validate();
    return config;
}

std::shared_ptr<AdapterFactory> defaultFactory(std::shared_ptr<AdapterFactory> factory,
                                               const ShardingConfig& config) {
    if (factory) {
        return factory;
    }
    return std::make_shared<AdapterFactory>(config.row_id_column);
}

} // namespace

json ShardManager::ShardStatistics::toJson() const {
    return json{
        {"totalShards", total_shards},
        {"activeShards", active_shards},
        {"inactiveShards", inactive_shards},
        {"virtualNodeCount", virtual_node_count},
        {"replicationFactor", replication_factor},
        {"tablesWithShardKeys", tables_with_shard_keys}
    };
}

ShardManager::ShardManager(const ShardingConfig& config, std::shared_ptr<AdapterFactory> factory)
    : config_(validated(config)),
      factory_(defaultFactory(std::move(factory), config)),
      registry_(registryConfig(config), factory_),
      router_(registry_, metrics_, routerConfig(config)),
      scatter_gather_(registry_, metrics_, scatterConfig(config)),
      migrator_(registry_, router_, metrics_, migratorConfig(config)),
      rebalancer_(registry_, migrator_, metrics_, rebalancerConfig(config)),
      health_monitor_(registry_, metrics_, healthConfig(config)) {

    utils::Logger::setComponentLevels(config_.logging.components);
    registry_.setReplicationFactor(config_.replication_factor);

    if (config_.health_check.enabled) {
        health_monitor_.start();
    }

    SAMS_INFO("Shard manager initialized (virtual nodes: {}, replication factor: {})",
              config_.virtual_nodes, config_.replication_factor);
}

ShardManager::~ShardManager() {
    health_monitor_.stop();
    waitForRebalance();
}

void ShardManager::applyTopology(const ShardingConfig& config) {
    for (const auto& shard : config.shards) {
        addShard(shard.id, shard.connection, shard.weight);
    }
    for (const auto& key : config.shard_keys) {
        setShardKey(key.table, key.column, key.algorithm);
    }
}

void ShardManager::addShard(const std::string& shard_id, const ShardConfig& config, uint32_t weight) {
    registry_.addShard(shard_id, config, weight);
    metrics_.recordTopologyChange("add");
    recordClusterSize();
}

MigrationResult ShardManager::removeShard(const std::string& shard_id) {
    registry_.beginRemoval(shard_id);
    SAMS_INFO("Removing shard {}", shard_id);

    auto result = migrator_.migrateShardData(shard_id);
    if (!result.success) {
        SAMS_ERROR("Shard {} removed with incomplete migration: {} rows failed",
                   shard_id, result.failed);
    }

    registry_.eraseShard(shard_id);
    metrics_.recordTopologyChange("remove");
    recordClusterSize();

    SAMS_INFO("Shard removed: {}", shard_id);
    return result;
}

void ShardManager::setShardKey(const std::string& table, const std::string& column,
                               ShardingAlgorithm algorithm) {
    registry_.setShardKey(table, column, algorithm);
}

void ShardManager::setReplicationFactor(size_t factor) {
    registry_.setReplicationFactor(factor);
}

void ShardManager::setShardWeight(const std::string& shard_id, uint32_t weight) {
    registry_.setShardWeight(shard_id, weight);
    metrics_.recordTopologyChange("weight");
    recordClusterSize();
}

void ShardManager::markShardDown(const std::string& shard_id) {
    registry_.markShardDown(shard_id);
    metrics_.recordTopologyChange("down");
    recordClusterSize();
}

void ShardManager::markShardUp(const std::string& shard_id) {
    registry_.markShardUp(shard_id);
    metrics_.recordTopologyChange("up");
    recordClusterSize();
}

WriteResult ShardManager::distributeData(const std::string& table, const Row& row) {
    return router_.distributeData(table, row);
}

ScatterGatherResult ShardManager::queryAllShards(const std::string& query,
                                                 const std::vector<nlohmann::json>& params) {
    return scatter_gather_.queryAllShards(query, params);
}

QueryResult ShardManager::queryShardByKey(const std::string& key, const std::string& query,
                                          const std::vector<nlohmann::json>& params) {
    return router_.queryShardByKey(key, query, params);
}

std::string ShardManager::getShardForKey(const std::string& key) const {
    return router_.getShardForKey(key);
}

std::map<std::string, bool> ShardManager::getShardHealth() {
    std::map<std::string, bool> health;
    for (const auto& shard : health_monitor_.checkNow().shard_health) {
        health[shard.shard_id] = shard.healthy;
    }
    return health;
}

std::map<std::string, AdapterMetrics> ShardManager::getShardMetrics() {
    std::map<std::string, AdapterMetrics> result;
    for (const auto& shard : registry_.getAllShards()) {
        try {
            result[shard.shard_id] = callWithTimeout(shard.adapter, config_.adapter_timeout,
                                                     "metrics of " + shard.shard_id,
                                                     [](ShardAdapter& a) { return a.getMetrics(); });
        } catch (const std::exception& e) {
            SAMS_WARN("Failed to get metrics for shard {}: {}", shard.shard_id, e.what());
            AdapterMetrics fallback;
            fallback.error_count = 1;
            fallback.last_error = e.what();
            result[shard.shard_id] = fallback;
        }
    }
    return result;
}

ShardManager::ShardStatistics ShardManager::getShardStatistics() const {
    ShardStatistics stats;
    stats.total_shards = registry_.getShardCount();
    stats.active_shards = registry_.getActiveShardIds().size();
    stats.inactive_shards = stats.total_shards - std::min(stats.total_shards, stats.active_shards);
    stats.virtual_node_count = registry_.ring()->getVirtualNodeCount();
    stats.replication_factor = registry_.getReplicationFactor();
    for (const auto& key : registry_.getShardKeys()) {
        stats.tables_with_shard_keys.push_back(key.table);
    }
    return stats;
}

std::vector<std::string> ShardManager::getShardIds() const {
    return registry_.getShardIds();
}

std::vector<std::string> ShardManager::getActiveShardIds() const {
    return registry_.getActiveShardIds();
}

bool ShardManager::rebalance() {
    std::lock_guard<std::mutex> lock(rebalance_mutex_);
    if (rebalance_running_) {
        SAMS_WARN("Rebalance already in progress");
        return false;
    }

    // A previous pass has finished; reap its thread
    if (rebalance_thread_.joinable()) {
        rebalance_thread_.join();
    }

    rebalance_running_ = true;
    rebalance_report_.reset();
    rebalance_thread_ = std::thread([this]() {
        auto report = rebalancer_.rebalance();
        std::lock_guard<std::mutex> guard(rebalance_mutex_);
        rebalance_report_ = std::move(report);
        rebalance_running_ = false;
    });
    return true;
}

std::optional<RebalanceReport> ShardManager::waitForRebalance() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(rebalance_mutex_);
        worker = std::move(rebalance_thread_);
    }
    if (worker.joinable()) {
        worker.join();
    }

    std::lock_guard<std::mutex> lock(rebalance_mutex_);
    return rebalance_report_;
}

bool ShardManager::isRebalancing() const {
    std::lock_guard<std::mutex> lock(rebalance_mutex_);
    return rebalance_running_;
}

void ShardManager::recordClusterSize() {
    metrics_.recordClusterSize(static_cast<int>(registry_.getShardCount()),
                               static_cast<int>(registry_.getActiveShardIds().size()));
    metrics_.recordVirtualNodes(static_cast<int>(registry_.ring()->getVirtualNodeCount()));
}

} // namespace sams::sharding
