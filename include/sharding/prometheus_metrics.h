#ifndef SAMS_SHARDING_PROMETHEUS_METRICS_H
#define SAMS_SHARDING_PROMETHEUS_METRICS_H

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sams {
namespace sharding {

/**
 * Prometheus metrics registry for the shard manager.
 *
 * Renders metrics in Prometheus text format. Tracks shard health, routing
 * statistics, replica write failures, scatter-gather fan-out, migration and
 * rebalance progress, and topology changes. Partial-completion conditions
 * (rows left behind by a migration, failed replica writes) are visible here
 * so an operator can detect drift.
 */
class PrometheusMetrics {
public:
    using Labels = std::map<std::string, std::string>;

    struct Config {
        size_t histogram_window = 1000;   // recent observations kept per series
    };

    PrometheusMetrics();
    explicit PrometheusMetrics(const Config& config);
    ~PrometheusMetrics() = default;

    // Shard health
    void recordShardHealth(const std::string& shard_id, bool healthy);
    void recordHealthProbeFailure(const std::string& shard_id);

    // Routing
    void recordRoutingRequest(const std::string& type); // write/key_query/scatter_gather
    void recordRoutingError(const std::string& shard_id, const std::string& error_type);
    void recordRoutingLatency(const std::string& operation, double latency_ms);
    void recordReplicaWrite(const std::string& shard_id, bool success);

    // Scatter-gather
    void recordScatterGatherFanout(int num_shards);
    void recordScatterGatherFailure(const std::string& shard_id);

    // Data movement
    void recordMigration(const std::string& shard_id, uint64_t migrated, uint64_t skipped, uint64_t failed);
    void recordRebalance(uint64_t rows_sampled, uint64_t rows_moved, uint64_t rows_failed);
    void recordImbalancedShards(int num_shards);

    // Topology
    void recordTopologyChange(const std::string& change_type); // add/remove/weight/health
    void recordClusterSize(int total_shards, int active_shards);
    void recordVirtualNodes(int total_vnodes);

    // Get metrics in Prometheus text format
    std::string getMetrics() const;

    // Point reads, mostly for tests and statistics
    int64_t getCounter(const std::string& name, const Labels& labels = {}) const;
    double getGauge(const std::string& name, const Labels& labels = {}) const;
    size_t getObservationCount(const std::string& name, const Labels& labels = {}) const;

private:
    struct Histogram {
        std::string name;
        Labels labels;
        std::vector<double> values;
    };

    Config config_;
    mutable std::mutex mutex_;

    std::map<std::string, int64_t> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, Histogram> histograms_;

    void incrementCounter(const std::string& name, const Labels& labels = {}, int64_t delta = 1);
    void setGauge(const std::string& name, double value, const Labels& labels = {});
    void observeHistogram(const std::string& name, double value, const Labels& labels = {});

    static std::string formatLabels(const Labels& labels);
    static std::string seriesKey(const std::string& name, const Labels& labels);
};

} // namespace sharding
} // namespace sams

#endif // SAMS_SHARDING_PROMETHEUS_METRICS_H
