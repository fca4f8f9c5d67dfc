#define SAMS_LOG_COMPONENT "health"

#include "sharding/health_check.h"
#include "sharding/adapter_call.h"
#include "sharding/prometheus_metrics.h"
#include "sharding/shard_registry.h"
#include "utils/logger.h"
#include <tbb/task_group.h>

namespace sams {
namespace sharding {

HealthMonitor::HealthMonitor(ShardRegistry& registry, PrometheusMetrics& metrics, const Config& config)
    : registry_(registry), metrics_(metrics), config_(config) {
    if (config_.check_interval.count() <= 0 || config_.probe_timeout.count() <= 0) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT,
                            "Health check interval and probe timeout must be positive");
    }
}

HealthMonitor::~HealthMonitor() {
    stop();
}

ClusterHealthInfo HealthMonitor::checkNow() {
    std::lock_guard<std::mutex> pass_lock(pass_mutex_);

    auto shards = registry_.getAllShards();
    std::vector<ShardHealthInfo> results(shards.size());

    tbb::task_group tg;
    for (size_t i = 0; i < shards.size(); ++i) {
        tg.run([this, &shards, &results, i]() {
            results[i] = probe(shards[i]);
        });
    }
    tg.wait();

    ClusterHealthInfo cluster_info;
    cluster_info.total_shards = static_cast<int>(shards.size());
    cluster_info.checked_at = std::chrono::system_clock::now();

    for (const auto& health : results) {
        if (registry_.updateHealth(health.shard_id, health.healthy, cluster_info.checked_at)) {
            cluster_info.topology_changed = true;
            SAMS_WARN("Shard {} is now {}", health.shard_id,
                      registry_.isActive(health.shard_id) ? "active" : "inactive");
            metrics_.recordTopologyChange("health");
        }

        metrics_.recordShardHealth(health.shard_id, health.healthy);
        if (health.healthy) {
            cluster_info.healthy_shards++;
        } else {
            cluster_info.unhealthy_shards++;
            metrics_.recordHealthProbeFailure(health.shard_id);
        }
        cluster_info.shard_health.push_back(health);
    }

    if (cluster_info.topology_changed) {
        registry_.rebuildRing();
    }

    cluster_info.has_quorum = hasQuorum(cluster_info.healthy_shards, cluster_info.total_shards);
    if (cluster_info.total_shards > 0 && !cluster_info.has_quorum) {
        SAMS_WARN("No quorum - {} of {} shards healthy",
                  cluster_info.healthy_shards, cluster_info.total_shards);
    }

    metrics_.recordClusterSize(cluster_info.total_shards,
                               static_cast<int>(registry_.getActiveShardIds().size()));
    metrics_.recordVirtualNodes(static_cast<int>(registry_.ring()->getVirtualNodeCount()));

    HealthCheckCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_health_ = cluster_info;
        callback = callback_;
    }

    if (callback) {
        callback(cluster_info);
    }

    return cluster_info;
}

void HealthMonitor::registerCallback(HealthCheckCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

void HealthMonitor::start() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (running_) {
        SAMS_WARN("Health monitor already running");
        return;
    }

    running_ = true;
    check_thread_ = std::make_unique<std::thread>(&HealthMonitor::checkLoop, this);

    SAMS_INFO("Health monitor started (interval: {}ms, probe timeout: {}ms)",
              config_.check_interval.count(), config_.probe_timeout.count());
}

void HealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    stop_cv_.notify_all();

    if (check_thread_ && check_thread_->joinable()) {
        check_thread_->join();
    }
    check_thread_.reset();

    SAMS_INFO("Health monitor stopped");
}

ClusterHealthInfo HealthMonitor::getCurrentHealth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_health_;
}

void HealthMonitor::checkLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(stop_mutex_);
            stop_cv_.wait_for(lock, config_.check_interval, [this]() { return !running_; });
        }
        if (!running_) {
            break;
        }

        try {
            checkNow();
        } catch (const std::exception& e) {
            SAMS_ERROR("Health monitoring pass failed: {}", e.what());
        }
    }
}

ShardHealthInfo HealthMonitor::probe(const ShardInfo& shard) {
    ShardHealthInfo info;
    info.shard_id = shard.shard_id;
    info.was_active = shard.is_active;

    auto start = std::chrono::steady_clock::now();
    try {
        info.healthy = callWithTimeout(shard.adapter, config_.probe_timeout,
                                       "health check " + shard.shard_id,
                                       [](ShardAdapter& adapter) { return adapter.healthCheck(); });
        if (!info.healthy) {
            info.error = "health check reported unhealthy";
        }
    } catch (const std::exception& e) {
        info.healthy = false;
        info.error = e.what();
    }
    info.response_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    if (!info.healthy) {
        SAMS_WARN("Health check failed for shard {}: {}", shard.shard_id, info.error);
    }
    return info;
}

bool HealthMonitor::hasQuorum(int healthy_shards, int total_shards) {
    if (total_shards == 0) return false;
    return healthy_shards > total_shards / 2;
}

} // namespace sharding
} // namespace sams
