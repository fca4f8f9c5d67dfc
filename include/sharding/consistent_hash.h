#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sams::sharding {

/**
 * A shard as seen by the ring builder
 */
struct RingMember {
    std::string shard_id;
    uint32_t weight = 1;
    bool active = true;
};

/**
 * Consistent Hashing Ring for even data distribution
 *
 * Uses virtual nodes to ensure balanced distribution even with uneven
 * number of shards. Each active shard gets weight * V positions on the
 * 32-bit hash ring, keyed by hash("<shard_id>:<index>").
 *
 * A ring is immutable once built. Topology or health changes build a new
 * ring which the owner publishes atomically, so lookups never observe a
 * partially built ring and never block on a rebuild.
 *
 * Benefits:
 * - Minimal data movement on shard add/remove (only 1/N of data moves)
 * - Even distribution with virtual nodes
 * - Fast lookup O(log N) where N is number of virtual nodes
 */
class ConsistentHashRing {
public:
    using ActivePredicate = std::function<bool(const std::string&)>;

    static constexpr size_t kDefaultVirtualNodes = 150;

    /**
     * Build a ring from the given members
     * Inactive members and members with weight 0 get no virtual nodes.
     * @param members Shards to place on the ring
     * @param virtual_nodes Base virtual node count per unit of weight
     * @return Immutable ring
     */
    static std::shared_ptr<const ConsistentHashRing> build(
        const std::vector<RingMember>& members,
        size_t virtual_nodes = kDefaultVirtualNodes);

    /**
     * Stable 32-bit hash: first four bytes of the MD5 digest, big-endian
     */
    static uint32_t hash(const std::string& key);

    /**
     * Resolve the shard owning a key
     * Uses clockwise search on the ring to find the first virtual node
     * @throws ShardingError(NO_SHARDS_AVAILABLE) if the ring is empty
     */
    std::string lookup(const std::string& key) const;

    /**
     * Resolve the shard owning a key, skipping shards that are not active
     * Walks clockwise from the key's position, wrapping once.
     * @throws ShardingError(NO_SHARDS_AVAILABLE) if no entry is active
     */
    std::string lookupSkippingInactive(const std::string& key,
                                       const ActivePredicate& is_active) const;

    /**
     * Get shard for a hash position, or empty string if the ring is empty
     */
    std::string getShardForHash(uint32_t hash) const;

    /**
     * Replica targets for a primary shard
     * Returns the next `count` distinct active shards clockwise from the
     * primary's first virtual node, excluding the primary.
     * @return Shard IDs (may be fewer than count if not enough shards exist)
     */
    std::vector<std::string> replicasFor(const std::string& primary_shard_id,
                                         size_t count,
                                         const ActivePredicate& is_active) const;

    /**
     * Get all unique shards in the ring, sorted
     */
    std::vector<std::string> getAllShards() const;

    bool hasShard(const std::string& shard_id) const {
        return shard_vnodes_.find(shard_id) != shard_vnodes_.end();
    }

    /**
     * Calculate balance factor (coefficient of variation of virtual nodes
     * per shard). Lower is better; 0 for equal weights without collisions.
     * @return Balance factor as percentage (0.0 to 100.0)
     */
    double getBalanceFactor() const;

    size_t getVirtualNodeCount() const { return ring_.size(); }
    size_t getShardCount() const { return shard_vnodes_.size(); }
    bool empty() const { return ring_.empty(); }

    const std::map<std::string, size_t>& getVirtualNodesPerShard() const {
        return shard_vnodes_;
    }

    size_t getBaseVirtualNodes() const { return virtual_nodes_; }

private:
    // Token (hash) → Shard ID mapping
    std::map<uint32_t, std::string> ring_;

    // Shard ID → number of ring positions it ended up with
    std::map<std::string, size_t> shard_vnodes_;

    size_t virtual_nodes_ = kDefaultVirtualNodes;

    std::vector<std::string> walkDistinct(std::map<uint32_t, std::string>::const_iterator start,
                                          const std::string& exclude,
                                          size_t count,
                                          const ActivePredicate& is_active) const;
};

} // namespace sams::sharding
