#include "sharding/prometheus_metrics.h"
#include <algorithm>
#include <sstream>

namespace sams {
namespace sharding {

PrometheusMetrics::PrometheusMetrics()
    : PrometheusMetrics(Config{}) {
}

PrometheusMetrics::PrometheusMetrics(const Config& config)
    : config_(config) {
}

void PrometheusMetrics::recordShardHealth(const std::string& shard_id, bool healthy) {
    setGauge("sams_shard_up", healthy ? 1.0 : 0.0, {{"shard_id", shard_id}});
}

void PrometheusMetrics::recordHealthProbeFailure(const std::string& shard_id) {
    incrementCounter("sams_health_probe_failures_total", {{"shard_id", shard_id}});
}

void PrometheusMetrics::recordRoutingRequest(const std::string& type) {
    incrementCounter("sams_routing_requests_total", {{"type", type}});
}

void PrometheusMetrics::recordRoutingError(const std::string& shard_id, const std::string& error_type) {
    incrementCounter("sams_routing_errors_total", {{"shard_id", shard_id}, {"error_type", error_type}});
}

void PrometheusMetrics::recordRoutingLatency(const std::string& operation, double latency_ms) {
    observeHistogram("sams_routing_latency_seconds", latency_ms / 1000.0, {{"operation", operation}});
}

void PrometheusMetrics::recordReplicaWrite(const std::string& shard_id, bool success) {
    if (success) {
        incrementCounter("sams_replica_writes_total", {{"shard_id", shard_id}});
    } else {
        incrementCounter("sams_replica_write_failures_total", {{"shard_id", shard_id}});
    }
}

void PrometheusMetrics::recordScatterGatherFanout(int num_shards) {
    observeHistogram("sams_scatter_gather_fanout", static_cast<double>(num_shards));
}

void PrometheusMetrics::recordScatterGatherFailure(const std::string& shard_id) {
    incrementCounter("sams_scatter_gather_failed_legs_total", {{"shard_id", shard_id}});
}

void PrometheusMetrics::recordMigration(const std::string& shard_id, uint64_t migrated,
                                        uint64_t skipped, uint64_t failed) {
    incrementCounter("sams_migration_rows_total", {{"shard_id", shard_id}, {"outcome", "migrated"}},
                     static_cast<int64_t>(migrated));
    incrementCounter("sams_migration_rows_total", {{"shard_id", shard_id}, {"outcome", "skipped"}},
                     static_cast<int64_t>(skipped));
    incrementCounter("sams_migration_rows_total", {{"shard_id", shard_id}, {"outcome", "failed"}},
                     static_cast<int64_t>(failed));
}

void PrometheusMetrics::recordRebalance(uint64_t rows_sampled, uint64_t rows_moved, uint64_t rows_failed) {
    incrementCounter("sams_rebalance_runs_total");
    incrementCounter("sams_rebalance_rows_total", {{"outcome", "sampled"}}, static_cast<int64_t>(rows_sampled));
    incrementCounter("sams_rebalance_rows_total", {{"outcome", "moved"}}, static_cast<int64_t>(rows_moved));
    incrementCounter("sams_rebalance_rows_total", {{"outcome", "failed"}}, static_cast<int64_t>(rows_failed));
}

void PrometheusMetrics::recordImbalancedShards(int num_shards) {
    setGauge("sams_imbalanced_shards", static_cast<double>(num_shards));
}

void PrometheusMetrics::recordTopologyChange(const std::string& change_type) {
    incrementCounter("sams_topology_changes_total", {{"change_type", change_type}});
}

void PrometheusMetrics::recordClusterSize(int total_shards, int active_shards) {
    setGauge("sams_cluster_shards", static_cast<double>(total_shards), {{"state", "total"}});
    setGauge("sams_cluster_shards", static_cast<double>(active_shards), {{"state", "active"}});
}

void PrometheusMetrics::recordVirtualNodes(int total_vnodes) {
    setGauge("sams_virtual_nodes_total", static_cast<double>(total_vnodes));
}

std::string PrometheusMetrics::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    for (const auto& [key, value] : counters_) {
        oss << key << " " << value << "\n";
    }

    for (const auto& [key, value] : gauges_) {
        oss << key << " " << value << "\n";
    }

    // Histograms are exported as summaries (quantiles over the recent window)
    for (const auto& [key, histogram] : histograms_) {
        if (histogram.values.empty()) continue;

        auto sorted = histogram.values;
        std::sort(sorted.begin(), sorted.end());

        for (int q : {50, 95, 99}) {
            Labels labels = histogram.labels;
            labels["quantile"] = q == 50 ? "0.5" : (q == 95 ? "0.95" : "0.99");
            oss << histogram.name << formatLabels(labels) << " "
                << sorted[(sorted.size() - 1) * q / 100] << "\n";
        }
        oss << histogram.name << "_count" << formatLabels(histogram.labels) << " "
            << histogram.values.size() << "\n";
    }

    return oss.str();
}

int64_t PrometheusMetrics::getCounter(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(seriesKey(name, labels));
    return it == counters_.end() ? 0 : it->second;
}

double PrometheusMetrics::getGauge(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(seriesKey(name, labels));
    return it == gauges_.end() ? 0.0 : it->second;
}

size_t PrometheusMetrics::getObservationCount(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(seriesKey(name, labels));
    return it == histograms_.end() ? 0 : it->second.values.size();
}

void PrometheusMetrics::incrementCounter(const std::string& name, const Labels& labels, int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[seriesKey(name, labels)] += delta;
}

void PrometheusMetrics::setGauge(const std::string& name, double value, const Labels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[seriesKey(name, labels)] = value;
}

void PrometheusMetrics::observeHistogram(const std::string& name, double value, const Labels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histograms_[seriesKey(name, labels)];
    if (histogram.name.empty()) {
        histogram.name = name;
        histogram.labels = labels;
    }
    histogram.values.push_back(value);

    // Keep only recent values
    if (histogram.values.size() > config_.histogram_window) {
        histogram.values.erase(histogram.values.begin());
    }
}

std::string PrometheusMetrics::formatLabels(const Labels& labels) {
    if (labels.empty()) return "";

    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) oss << ",";
        oss << key << "=\"" << value << "\"";
        first = false;
    }
    oss << "}";
    return oss.str();
}

std::string PrometheusMetrics::seriesKey(const std::string& name, const Labels& labels) {
    return name + formatLabels(labels);
}

} // namespace sharding
} // namespace sams
