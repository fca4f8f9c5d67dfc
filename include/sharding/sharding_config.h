#pragma once

#include "sharding/shard_adapter.h"
#include "sharding/shard_registry.h"
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sams::sharding {

using json = nlohmann::json;

/**
 * Shard manager configuration
 *
 * Loaded from the `sharding:` and `logging:` sections of a YAML file.
 * Every key is optional; missing keys keep the defaults below.
 */
struct ShardingConfig {
    size_t virtual_nodes = ConsistentHashRing::kDefaultVirtualNodes;
    size_t replication_factor = 2;
    std::string row_id_column = "id";                 // identity column of every row
    std::chrono::milliseconds adapter_timeout{5000};  // primary writes, keyed and scatter queries
    std::chrono::milliseconds replica_timeout{5000};

    struct HealthCheckConfig {
        bool enabled = true;
        std::chrono::milliseconds interval{30000};
        std::chrono::milliseconds probe_timeout{5000};
    } health_check;

    struct RebalanceConfig {
        double threshold = 0.2;
        size_t sample_size = 1000;
    } rebalance;

    struct ScatterGatherConfig {
        bool collapse_replicas = true;
    } scatter_gather;

    // Shards to add at startup
    struct ShardEntry {
        std::string id;
        uint32_t weight = 1;
        ShardConfig connection;
    };
    std::vector<ShardEntry> shards;

    std::vector<ShardKey> shard_keys;

    struct LoggingConfig {
        std::string level = "info";
        std::string file;                             // empty: console only
        std::map<std::string, std::string> components; // component name -> level
    } logging;

    /**
     * Load configuration from YAML file
     * @throws ShardingError(INVALID_ARGUMENT) if the file cannot be read or
     *         parsed, or a value is out of range
     */
    static ShardingConfig loadFromYaml(const std::string& yaml_path);

    // Same as loadFromYaml() for an in-memory document
    static ShardingConfig loadFromString(const std::string& yaml_text);

    /**
     * @throws ShardingError(INVALID_ARGUMENT) on out-of-range values
     */
    void validate() const;

    // Passwords are masked
    json toJson() const;
};

} // namespace sams::sharding
