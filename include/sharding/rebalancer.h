#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sams {
namespace sharding {

class ShardRegistry;
class DataMigrator;
class PrometheusMetrics;

// State of a rebalance run
enum class RebalanceState {
    PLANNED,        // Initial state, not started
    IN_PROGRESS,    // Currently executing
    COMPLETED,      // Finished (individual rows may still have failed)
    FAILED          // Aborted before finishing
};

const char* rebalanceStateToString(RebalanceState state);

// shard id -> table -> row count
using DistributionMatrix = std::map<std::string, std::map<std::string, uint64_t>>;

// Outcome of one rebalance run
struct RebalanceReport {
    RebalanceState state = RebalanceState::PLANNED;
    std::vector<std::string> imbalanced_shards;
    uint64_t shards_examined = 0;
    uint64_t rows_sampled = 0;
    uint64_t rows_moved = 0;
    uint64_t rows_failed = 0;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
    std::string error_message;

    nlohmann::json toJson() const;
};

/**
 * Sampling rebalancer
 *
 * Counts rows per (shard, table), flags shards whose count deviates from
 * the per-table mean by more than the threshold, and moves sampled rows
 * that sit on a shard which no longer owns them. Each run looks at a
 * random sample only, so repeated runs converge; a run is not atomic.
 */
class Rebalancer {
public:
    struct Config {
        double threshold = 0.2;
        size_t sample_size = 1000;
        std::chrono::milliseconds adapter_timeout{5000};
    };

    Rebalancer(ShardRegistry& registry, DataMigrator& migrator,
               PrometheusMetrics& metrics, const Config& config);

    /**
     * Row count of every sharded table on every active shard.
     * A failed count is logged and recorded as 0.
     */
    DistributionMatrix analyzeDistribution();

    /**
     * Shards whose count for at least one table deviates from that table's
     * mean by more than mean * threshold, in ascending id order
     */
    static std::vector<std::string> identifyImbalanced(const DistributionMatrix& distribution,
                                                       double threshold);

    /**
     * Run one rebalance pass synchronously
     * @return Report of the run; the state is COMPLETED or FAILED
     */
    RebalanceReport rebalance();

    RebalanceState getState() const { return state_.load(); }
    RebalanceReport getLastReport() const;
    const Config& config() const { return config_; }

private:
    ShardRegistry& registry_;
    DataMigrator& migrator_;
    PrometheusMetrics& metrics_;
    Config config_;

    std::atomic<RebalanceState> state_{RebalanceState::PLANNED};
    RebalanceReport last_report_;
    mutable std::mutex mutex_;

    void rebalanceShard(const std::string& shard_id, RebalanceReport& report);
};

} // namespace sharding
} // namespace sams
