#pragma once

#include "sharding/adapter_factory.h"
#include "sharding/consistent_hash.h"
#include "sharding/shard_adapter.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sams::sharding {

/**
 * Routing strategy of a shard key. Only HASH is implemented; RANGE and
 * DIRECTORY are stored and reported but routed by consistent hashing.
 */
enum class ShardingAlgorithm {
    HASH,
    RANGE,
    DIRECTORY
};

const char* algorithmToString(ShardingAlgorithm algorithm);
// Throws ShardingError(INVALID_ARGUMENT) on unknown names
ShardingAlgorithm algorithmFromString(const std::string& name);

/**
 * Per-table routing rule: the value of `column` in each row is hashed
 * to pick the owning shard.
 */
struct ShardKey {
    std::string table;
    std::string column;
    ShardingAlgorithm algorithm = ShardingAlgorithm::HASH;
};

/**
 * Shard Information
 * Snapshot of one registered shard. The adapter handle is shared with the
 * registry; everything else is a copy.
 */
struct ShardInfo {
    std::string shard_id;
    ShardConfig config;
    uint32_t weight = 1;
    bool is_active = true;                   // routing-eligible
    bool marked_down = false;                // operator override, wins over health probes
    std::chrono::system_clock::time_point last_health_check;
    std::shared_ptr<ShardAdapter> adapter;
};

/**
 * Shard Registry
 *
 * Authoritative set of shards plus the table → shard key mapping and the
 * cluster replication factor. Owns the published hash ring: every change
 * to the active set or to a weight rebuilds the ring off-line and swaps it
 * in, so readers always see a complete ring.
 *
 * Thread-safe for concurrent access (single writer, many readers).
 */
class ShardRegistry {
public:
    struct Config {
        size_t virtual_nodes = ConsistentHashRing::kDefaultVirtualNodes;
        std::chrono::milliseconds adapter_timeout{5000};
    };

    ShardRegistry(const Config& config, std::shared_ptr<AdapterFactory> factory);

    /**
     * Create, connect and register a shard, then rebuild the ring
     * @throws ShardingError DUPLICATE_SHARD, INVALID_ARGUMENT or CONNECTION_ERROR;
     *         the registry is unchanged on failure
     */
    void addShard(const std::string& shard_id, const ShardConfig& config, uint32_t weight = 1);

    /**
     * First step of shard removal: mark the shard down so new writes stop
     * targeting it, and rebuild the ring without it.
     * @return Snapshot of the shard being removed
     * @throws ShardingError(SHARD_NOT_FOUND)
     */
    ShardInfo beginRemoval(const std::string& shard_id);

    /**
     * Last step of shard removal: disconnect the adapter, drop the entry,
     * rebuild the ring. A disconnect failure is logged, not thrown.
     * @throws ShardingError(SHARD_NOT_FOUND)
     */
    void eraseShard(const std::string& shard_id);

    std::optional<ShardInfo> getShard(const std::string& shard_id) const;
    std::vector<ShardInfo> getAllShards() const;
    std::vector<ShardInfo> getActiveShards() const;
    std::vector<std::string> getShardIds() const;
    std::vector<std::string> getActiveShardIds() const;

    std::shared_ptr<ShardAdapter> getAdapter(const std::string& shard_id) const;
    bool hasShard(const std::string& shard_id) const;
    bool isActive(const std::string& shard_id) const;

    /**
     * Record a health probe outcome. Does not rebuild the ring.
     * @return true if the active flag changed
     */
    bool updateHealth(const std::string& shard_id, bool healthy,
                      std::chrono::system_clock::time_point checked_at);

    /**
     * Operator override of the active flag; rebuilds the ring on change
     * @throws ShardingError(SHARD_NOT_FOUND)
     */
    void markShardDown(const std::string& shard_id);
    void markShardUp(const std::string& shard_id);

    /**
     * Change a shard's share of the hash space and rebuild the ring
     * @throws ShardingError SHARD_NOT_FOUND or INVALID_ARGUMENT (weight 0)
     */
    void setShardWeight(const std::string& shard_id, uint32_t weight);

    /**
     * Register or overwrite the routing rule for a table
     * @throws ShardingError(INVALID_ARGUMENT) on empty table or column
     */
    void setShardKey(const std::string& table, const std::string& column,
                     ShardingAlgorithm algorithm = ShardingAlgorithm::HASH);
    std::optional<ShardKey> getShardKey(const std::string& table) const;
    std::vector<ShardKey> getShardKeys() const;

    /**
     * @throws ShardingError(INVALID_ARGUMENT) if factor < 1
     */
    void setReplicationFactor(size_t factor);
    size_t getReplicationFactor() const { return replication_factor_.load(); }

    /**
     * Currently published ring (never null, possibly empty)
     */
    std::shared_ptr<const ConsistentHashRing> ring() const;

    /**
     * Rebuild the ring from the current active set and publish it
     */
    void rebuildRing();

    /**
     * Predicate over the live active flags, for ring walks
     */
    ConsistentHashRing::ActivePredicate activePredicate() const;

    size_t getShardCount() const;
    const Config& config() const { return config_; }

private:
    struct ShardEntry {
        ShardConfig config;
        uint32_t weight = 1;
        bool is_active = true;
        bool marked_down = false;
        std::chrono::system_clock::time_point last_health_check;
        std::shared_ptr<ShardAdapter> adapter;
    };

    Config config_;
    std::shared_ptr<AdapterFactory> factory_;

    std::map<std::string, ShardEntry> shards_;
    std::map<std::string, ShardKey> shard_keys_;
    mutable std::shared_mutex mutex_;

    std::atomic<size_t> replication_factor_{2};

    std::shared_ptr<const ConsistentHashRing> ring_;
    mutable std::mutex ring_mutex_;       // guards the ring_ pointer swap only
    std::mutex rebuild_mutex_;            // serializes rebuilds

    static ShardInfo toInfo(const std::string& shard_id, const ShardEntry& entry);
    bool setOperatorState(const std::string& shard_id, bool down);
};

} // namespace sams::sharding
