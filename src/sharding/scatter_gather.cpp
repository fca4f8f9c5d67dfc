#define SAMS_LOG_COMPONENT "scatter_gather"

#include "sharding/scatter_gather.h"
#include "sharding/adapter_call.h"
#include "sharding/prometheus_metrics.h"
#include "sharding/shard_registry.h"
#include "utils/logger.h"
#include <algorithm>
#include <iterator>
#include <set>
#include <tbb/task_group.h>

namespace sams {
namespace sharding {

nlohmann::json ScatterGatherResult::toJson() const {
    return nlohmann::json{
        {"rows", rows},
        {"rowCount", row_count},
        {"executionTime", execution_time_ms},
        {"fields", fields},
        {"respondedShards", responded_shards},
        {"failedShards", failed_shards}
    };
}

ScatterGatherEngine::ScatterGatherEngine(ShardRegistry& registry, PrometheusMetrics& metrics,
                                         const Config& config)
    : registry_(registry), metrics_(metrics), config_(config) {
}

ScatterGatherResult ScatterGatherEngine::queryAllShards(const std::string& query,
                                                        const std::vector<nlohmann::json>& params) {
    auto shards = registry_.getActiveShards();
    if (shards.empty()) {
        throw ShardingError(ErrorCode::NO_ACTIVE_SHARDS, "No active shards available");
    }

    metrics_.recordRoutingRequest("scatter_gather");
    metrics_.recordScatterGatherFanout(static_cast<int>(shards.size()));
    auto start = std::chrono::steady_clock::now();

    struct Leg {
        bool ok = false;
        QueryResult result;
        std::string error;
    };
    std::vector<Leg> legs(shards.size());

    tbb::task_group tg;
    for (size_t i = 0; i < shards.size(); ++i) {
        tg.run([this, &shards, &legs, &query, &params, i]() {
            try {
                legs[i].result = callWithTimeout(shards[i].adapter, config_.query_timeout,
                                                 "query on " + shards[i].shard_id,
                                                 [query, params](ShardAdapter& a) { return a.query(query, params); });
                legs[i].ok = true;
            } catch (const std::exception& e) {
                legs[i].error = e.what();
            }
        });
    }
    tg.wait();

    ScatterGatherResult merged;
    for (size_t i = 0; i < shards.size(); ++i) {
        const auto& shard_id = shards[i].shard_id;
        if (!legs[i].ok) {
            SAMS_ERROR("Query failed on shard {}: {}", shard_id, legs[i].error);
            metrics_.recordScatterGatherFailure(shard_id);
            merged.failed_shards.push_back(shard_id);
            continue;
        }

        auto& result = legs[i].result;
        merged.responded_shards.push_back(shard_id);
        merged.row_count += result.row_count;
        merged.execution_time_ms = std::max(merged.execution_time_ms, result.execution_time_ms);
        if (merged.fields.empty()) {
            merged.fields = result.fields;
        }
        std::move(result.rows.begin(), result.rows.end(), std::back_inserter(merged.rows));
    }

    if (config_.collapse_replicas && registry_.getReplicationFactor() > 1) {
        merged.collapsed_replicas = collapseReplicas(merged.rows);
        merged.row_count -= std::min(merged.row_count, merged.collapsed_replicas);
    }

    if (merged.isPartial()) {
        SAMS_WARN("Partial result: {} of {} shards answered",
                  merged.responded_shards.size(), shards.size());
    }

    metrics_.recordRoutingLatency("scatter_gather", std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count());
    return merged;
}

uint64_t ScatterGatherEngine::collapseReplicas(std::vector<Row>& rows) const {
    // Aggregate rows (COUNT(*) and friends) carry no identity and are kept.
    // A replica is an exact copy, so two rows sharing an id but differing
    // in any column are distinct records.
    std::set<std::string> seen;
    auto last = std::remove_if(rows.begin(), rows.end(), [this, &seen](const Row& row) {
        if (!row.is_object()) return false;
        auto it = row.find(config_.row_id_column);
        if (it == row.end() || it->is_null()) return false;
        return !seen.insert(row.dump()).second;
    });

    uint64_t collapsed = static_cast<uint64_t>(std::distance(last, rows.end()));
    rows.erase(last, rows.end());
    return collapsed;
}

} // namespace sharding
} // namespace sams
