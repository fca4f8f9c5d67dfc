#ifndef SAMS_SHARDING_HEALTH_CHECK_H
#define SAMS_SHARDING_HEALTH_CHECK_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sams {
namespace sharding {

class ShardRegistry;
class PrometheusMetrics;
struct ShardInfo;

struct ShardHealthInfo {
    std::string shard_id;
    bool healthy = false;
    bool was_active = false;
    double response_time_ms = 0.0;
    std::string error;
};

struct ClusterHealthInfo {
    int total_shards = 0;
    int healthy_shards = 0;
    int unhealthy_shards = 0;
    bool has_quorum = false;
    bool topology_changed = false;           // an active flag flipped in this pass
    std::chrono::system_clock::time_point checked_at;
    std::vector<ShardHealthInfo> shard_health;
};

/**
 * Health monitor for the shards of one cluster.
 *
 * Periodically probes every registered shard (active or not) through its
 * adapter with a bounded timeout, updates the shard's active flag, and
 * rebuilds the hash ring when the active set changed. Probe failures are
 * logged and counted, never thrown: a degraded shard simply stops
 * receiving new traffic.
 *
 * The periodic loop runs on its own thread between start() and stop();
 * the destructor stops it.
 */
class HealthMonitor {
public:
    struct Config {
        std::chrono::milliseconds check_interval{30000};   // 30 seconds
        std::chrono::milliseconds probe_timeout{5000};
    };

    using HealthCheckCallback = std::function<void(const ClusterHealthInfo&)>;

    HealthMonitor(ShardRegistry& registry, PrometheusMetrics& metrics, const Config& config);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // Probe every shard once, concurrently, and apply the outcome
    ClusterHealthInfo checkNow();

    // Register callback invoked after every pass
    void registerCallback(HealthCheckCallback callback);

    void start();
    void stop();
    bool isRunning() const { return running_; }

    ClusterHealthInfo getCurrentHealth() const;

private:
    ShardRegistry& registry_;
    PrometheusMetrics& metrics_;
    Config config_;

    HealthCheckCallback callback_;
    ClusterHealthInfo current_health_;
    mutable std::mutex mutex_;

    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> check_thread_;
    std::condition_variable stop_cv_;
    std::mutex stop_mutex_;
    std::mutex pass_mutex_;                   // one probe pass at a time

    void checkLoop();
    ShardHealthInfo probe(const ShardInfo& shard);

    static bool hasQuorum(int healthy_shards, int total_shards);
};

} // namespace sharding
} // namespace sams

#endif // SAMS_SHARDING_HEALTH_CHECK_H
