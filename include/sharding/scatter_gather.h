#ifndef SAMS_SHARDING_SCATTER_GATHER_H
#define SAMS_SHARDING_SCATTER_GATHER_H

#include "sharding/shard_adapter.h"
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sams {
namespace sharding {

class ShardRegistry;
class PrometheusMetrics;

/**
 * Merged result of a query sent to every active shard
 */
struct ScatterGatherResult {
    std::vector<Row> rows;
    uint64_t row_count = 0;
    double execution_time_ms = 0.0;         // slowest answering shard
    std::vector<std::string> fields;
    std::vector<std::string> responded_shards;
    std::vector<std::string> failed_shards;
    uint64_t collapsed_replicas = 0;        // duplicate replica rows dropped

    bool isPartial() const { return !failed_shards.empty(); }
    nlohmann::json toJson() const;
};

/**
 * Scatter-Gather Query Engine
 *
 * Sends the same query to every active shard concurrently and merges the
 * answers. A shard that fails or exceeds the query timeout contributes
 * nothing; the query as a whole only fails when no shard is active.
 */
class ScatterGatherEngine {
public:
    struct Config {
        std::chrono::milliseconds query_timeout{5000};
        bool collapse_replicas = true;
        std::string row_id_column = "id";
    };

    ScatterGatherEngine(ShardRegistry& registry, PrometheusMetrics& metrics, const Config& config);

    /**
     * @throws ShardingError(NO_ACTIVE_SHARDS) if no shard is active
     */
    ScatterGatherResult queryAllShards(const std::string& query,
                                       const std::vector<nlohmann::json>& params = {});

    const Config& config() const { return config_; }

private:
    ShardRegistry& registry_;
    PrometheusMetrics& metrics_;
    Config config_;

    uint64_t collapseReplicas(std::vector<Row>& rows) const;
};

} // namespace sharding
} // namespace sams

#endif // SAMS_SHARDING_SCATTER_GATHER_H
