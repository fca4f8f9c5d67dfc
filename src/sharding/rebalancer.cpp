#define SAMS_LOG_COMPONENT "rebalance"

#include "sharding/rebalancer.h"
#include "sharding/adapter_call.h"
#include "sharding/data_migrator.h"
#include "sharding/prometheus_metrics.h"
#include "sharding/shard_registry.h"
#include "utils/logger.h"
#include <cmath>
#include <set>

namespace sams {
namespace sharding {

const char* rebalanceStateToString(RebalanceState state) {
    switch (state) {
        case RebalanceState::PLANNED: return "PLANNED";
        case RebalanceState::IN_PROGRESS: return "IN_PROGRESS";
        case RebalanceState::COMPLETED: return "COMPLETED";
        case RebalanceState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

nlohmann::json RebalanceReport::toJson() const {
    return nlohmann::json{
        {"state", rebalanceStateToString(state)},
        {"imbalancedShards", imbalanced_shards},
        {"shardsExamined", shards_examined},
        {"rowsSampled", rows_sampled},
        {"rowsMoved", rows_moved},
        {"rowsFailed", rows_failed},
        {"durationMs", std::chrono::duration_cast<std::chrono::milliseconds>(
            finished_at - started_at).count()},
        {"error", error_message}
    };
}

Rebalancer::Rebalancer(ShardRegistry& registry, DataMigrator& migrator,
                       PrometheusMetrics& metrics, const Config& config)
    : registry_(registry), migrator_(migrator), metrics_(metrics), config_(config) {

    if (config_.threshold < 0.0) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Rebalance threshold must not be negative");
    }
    if (config_.sample_size == 0) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Rebalance sample size must be greater than 0");
    }
}

DistributionMatrix Rebalancer::analyzeDistribution() {
    DistributionMatrix distribution;
    const auto shard_keys = registry_.getShardKeys();

    for (const auto& shard : registry_.getActiveShards()) {
        auto& per_table = distribution[shard.shard_id];
        for (const auto& shard_key : shard_keys) {
            const std::string query = "SELECT COUNT(*) AS count FROM " + shard_key.table;
            uint64_t count = 0;
            try {
                auto result = callWithTimeout(shard.adapter, config_.adapter_timeout,
                                              "count " + shard_key.table + " on " + shard.shard_id,
                                              [query](ShardAdapter& a) { return a.query(query); });
                if (!result.rows.empty() && result.rows.front().contains("count")) {
                    count = result.rows.front()["count"].get<uint64_t>();
                }
            } catch (const std::exception& e) {
                SAMS_ERROR("Failed to count {} on shard {}: {}", shard_key.table, shard.shard_id, e.what());
            }
            per_table[shard_key.table] = count;
        }
    }

    return distribution;
}

std::vector<std::string> Rebalancer::identifyImbalanced(const DistributionMatrix& distribution,
                                                        double threshold) {
    if (distribution.empty()) {
        return {};
    }

    std::set<std::string> tables;
    for (const auto& [shard_id, per_table] : distribution) {
        for (const auto& [table, count] : per_table) {
            tables.insert(table);
        }
    }

    std::set<std::string> imbalanced;
    const double shard_count = static_cast<double>(distribution.size());

    for (const auto& table : tables) {
        double total = 0.0;
        for (const auto& [shard_id, per_table] : distribution) {
            auto it = per_table.find(table);
            total += it == per_table.end() ? 0.0 : static_cast<double>(it->second);
        }
        const double mean = total / shard_count;

        for (const auto& [shard_id, per_table] : distribution) {
            auto it = per_table.find(table);
            const double count = it == per_table.end() ? 0.0 : static_cast<double>(it->second);
            if (std::abs(count - mean) > mean * threshold) {
                imbalanced.insert(shard_id);
            }
        }
    }

    return {imbalanced.begin(), imbalanced.end()};
}

RebalanceReport Rebalancer::rebalance() {
    RebalanceReport report;
    report.started_at = std::chrono::system_clock::now();
    state_ = RebalanceState::IN_PROGRESS;
    report.state = RebalanceState::IN_PROGRESS;

    SAMS_INFO("Starting rebalance (threshold: {}, sample size: {})",
              config_.threshold, config_.sample_size);

    try {
        auto distribution = analyzeDistribution();
        report.imbalanced_shards = identifyImbalanced(distribution, config_.threshold);
        metrics_.recordImbalancedShards(static_cast<int>(report.imbalanced_shards.size()));

        if (report.imbalanced_shards.empty()) {
            SAMS_INFO("Cluster is balanced, nothing to move");
        }

        for (const auto& shard_id : report.imbalanced_shards) {
            report.shards_examined++;
            rebalanceShard(shard_id, report);
        }

        report.state = RebalanceState::COMPLETED;
    } catch (const std::exception& e) {
        report.state = RebalanceState::FAILED;
        report.error_message = e.what();
        SAMS_ERROR("Rebalance failed: {}", e.what());
    }

    report.finished_at = std::chrono::system_clock::now();
    state_ = report.state;
    metrics_.recordRebalance(report.rows_sampled, report.rows_moved, report.rows_failed);

    if (report.state == RebalanceState::COMPLETED) {
        SAMS_INFO("Rebalance complete: {} shards examined, {} rows sampled, {} moved, {} failed",
                  report.shards_examined, report.rows_sampled, report.rows_moved, report.rows_failed);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_report_ = report;
    }
    return report;
}

RebalanceReport Rebalancer::getLastReport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_report_;
}

void Rebalancer::rebalanceShard(const std::string& shard_id, RebalanceReport& report) {
    auto adapter = registry_.getAdapter(shard_id);
    if (!adapter) {
        SAMS_WARN("Shard {} left the cluster during rebalance", shard_id);
        return;
    }

    for (const auto& shard_key : registry_.getShardKeys()) {
        const std::string query = "SELECT * FROM " + shard_key.table +
                                  " ORDER BY RANDOM() LIMIT " + std::to_string(config_.sample_size);
        QueryResult sample;
        try {
            sample = callWithTimeout(adapter, config_.adapter_timeout,
                                     "sample " + shard_key.table + " on " + shard_id,
                                     [query](ShardAdapter& a) { return a.query(query); });
        } catch (const std::exception& e) {
            SAMS_ERROR("Failed to sample {} on shard {}: {}", shard_key.table, shard_id, e.what());
            continue;
        }

        report.rows_sampled += sample.rows.size();

        for (const auto& row : sample.rows) {
            try {
                if (migrator_.relocateRow(shard_id, shard_key.table, row)) {
                    report.rows_moved++;
                }
            } catch (const std::exception& e) {
                report.rows_failed++;
                SAMS_WARN("Failed to move {} row from shard {}: {}", shard_key.table, shard_id, e.what());
            }
        }
    }
}

} // namespace sharding
} // namespace sams
