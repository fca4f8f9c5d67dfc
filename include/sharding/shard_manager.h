#pragma once

#include "sharding/adapter_factory.h"
#include "sharding/data_migrator.h"
#include "sharding/health_check.h"
#include "sharding/prometheus_metrics.h"
#include "sharding/rebalancer.h"
#include "sharding/scatter_gather.h"
#include "sharding/shard_registry.h"
#include "sharding/shard_router.h"
#include "sharding/sharding_config.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sams::sharding {

/**
 * Shard Manager - Coordinator of one sharded cluster
 *
 * Owns the registry, the router, the scatter-gather engine, the migrator,
 * the rebalancer and the health monitor, and exposes the operations the
 * rest of the application uses. Create one instance per cluster and pass
 * it by reference; the destructor stops the health monitor and waits for
 * a running rebalance.
 */
class ShardManager {
public:
    struct ShardStatistics {
        size_t total_shards = 0;
        size_t active_shards = 0;
        size_t inactive_shards = 0;
        size_t virtual_node_count = 0;
        size_t replication_factor = 0;
        std::vector<std::string> tables_with_shard_keys;

        json toJson() const;
    };

    /**
     * @param config Tunables; listed shards and shard keys are not applied
     *        here, see applyTopology()
     * @param factory Adapter factory; a default one (kind "memory") if null
     */
    explicit ShardManager(const ShardingConfig& config = ShardingConfig{},
                          std::shared_ptr<AdapterFactory> factory = nullptr);
    ~ShardManager();

    ShardManager(const ShardManager&) = delete;
    ShardManager& operator=(const ShardManager&) = delete;

    // Add the shards and shard keys listed in a configuration
    void applyTopology(const ShardingConfig& config);

    // ===== Topology =====

    void addShard(const std::string& shard_id, const ShardConfig& config, uint32_t weight = 1);

    /**
     * Take a shard out of rotation, move its rows to their new owners,
     * then disconnect and forget it. Partial migration is logged and
     * returned; the shard is removed regardless.
     * @throws ShardingError(SHARD_NOT_FOUND)
     */
    MigrationResult removeShard(const std::string& shard_id);

    void setShardKey(const std::string& table, const std::string& column,
                     ShardingAlgorithm algorithm = ShardingAlgorithm::HASH);
    void setReplicationFactor(size_t factor);
    void setShardWeight(const std::string& shard_id, uint32_t weight);
    void markShardDown(const std::string& shard_id);
    void markShardUp(const std::string& shard_id);

    // ===== Data path =====

    WriteResult distributeData(const std::string& table, const Row& row);

    ScatterGatherResult queryAllShards(const std::string& query,
                                       const std::vector<nlohmann::json>& params = {});

    QueryResult queryShardByKey(const std::string& key, const std::string& query,
                                const std::vector<nlohmann::json>& params = {});

    std::string getShardForKey(const std::string& key) const;

    // ===== Observation =====

    /**
     * Probe every shard now
     * @return shard id -> healthy
     */
    std::map<std::string, bool> getShardHealth();

    /**
     * Adapter metrics of every shard. A shard whose metrics call fails
     * reports zero connections and queries, errorCount 1 and the error.
     */
    std::map<std::string, AdapterMetrics> getShardMetrics();

    ShardStatistics getShardStatistics() const;

    std::vector<std::string> getShardIds() const;
    std::vector<std::string> getActiveShardIds() const;

    // ===== Rebalancing =====

    /**
     * Start a rebalance pass in the background
     * @return false if a pass is already running
     */
    bool rebalance();

    /**
     * Wait for the background pass started by rebalance()
     * @return Its report, or nullopt if none was started
     */
    std::optional<RebalanceReport> waitForRebalance();

    bool isRebalancing() const;

    // ===== Components =====

    PrometheusMetrics& metrics() { return metrics_; }
    ShardRegistry& registry() { return registry_; }
    HealthMonitor& healthMonitor() { return health_monitor_; }
    Rebalancer& rebalancer() { return rebalancer_; }
    AdapterFactory& adapterFactory() { return *factory_; }
    const ShardingConfig& config() const { return config_; }

private:
    ShardingConfig config_;
    std::shared_ptr<AdapterFactory> factory_;
    PrometheusMetrics metrics_;
    ShardRegistry registry_;
    ShardRouter router_;
    ScatterGatherEngine scatter_gather_;
    DataMigrator migrator_;
    Rebalancer rebalancer_;
    HealthMonitor health_monitor_;

    mutable std::mutex rebalance_mutex_;
    std::thread rebalance_thread_;
    std::optional<RebalanceReport> rebalance_report_;
    bool rebalance_running_ = false;

    void recordClusterSize();
};

} // namespace sams::sharding
