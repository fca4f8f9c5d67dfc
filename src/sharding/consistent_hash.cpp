#include "sharding/consistent_hash.h"
#include "sharding/sharding_error.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <openssl/evp.h>

namespace sams::sharding {

std::shared_ptr<const ConsistentHashRing> ConsistentHashRing::build(
    const std::vector<RingMember>& members,
    size_t virtual_nodes) {

    auto ring = std::make_shared<ConsistentHashRing>();
    ring->virtual_nodes_ = virtual_nodes;

    for (const auto& member : members) {
        if (!member.active || member.weight == 0) {
            continue;
        }

        const size_t count = virtual_nodes * member.weight;
        for (size_t i = 0; i < count; ++i) {
            // A colliding token is taken over by the later virtual node
            ring->ring_[hash(member.shard_id + ":" + std::to_string(i))] = member.shard_id;
        }
    }

    for (const auto& [token, shard_id] : ring->ring_) {
        ring->shard_vnodes_[shard_id]++;
    }

    return ring;
}

uint32_t ConsistentHashRing::hash(const std::string& key) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(key.data(), key.size(), digest, &digest_len, EVP_md5(), nullptr) != 1 ||
        digest_len < 4) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "MD5 digest unavailable");
    }

    return (static_cast<uint32_t>(digest[0]) << 24) |
           (static_cast<uint32_t>(digest[1]) << 16) |
           (static_cast<uint32_t>(digest[2]) << 8) |
           static_cast<uint32_t>(digest[3]);
}

std::string ConsistentHashRing::lookup(const std::string& key) const {
    if (ring_.empty()) {
        throw ShardingError(ErrorCode::NO_SHARDS_AVAILABLE, "No shards available");
    }
    return getShardForHash(hash(key));
}

std::string ConsistentHashRing::lookupSkippingInactive(const std::string& key,
                                                       const ActivePredicate& is_active) const {
    if (ring_.empty()) {
        throw ShardingError(ErrorCode::NO_SHARDS_AVAILABLE, "No shards available");
    }

    auto it = ring_.lower_bound(hash(key));
    if (it == ring_.end()) {
        it = ring_.begin();
    }

    // One full turn at most
    std::set<std::string> rejected;
    for (size_t i = 0; i < ring_.size(); ++i) {
        if (rejected.find(it->second) == rejected.end()) {
            if (!is_active || is_active(it->second)) {
                return it->second;
            }
            rejected.insert(it->second);
            if (rejected.size() == shard_vnodes_.size()) {
                break;
            }
        }

        ++it;
        if (it == ring_.end()) {
            it = ring_.begin();
        }
    }

    throw ShardingError(ErrorCode::NO_SHARDS_AVAILABLE, "No active shards available");
}

std::string ConsistentHashRing::getShardForHash(uint32_t hash) const {
    if (ring_.empty()) {
        return "";
    }

    // Find the first virtual node at or after this hash (clockwise search)
    auto it = ring_.lower_bound(hash);

    // If we've gone past the end, wrap around to the beginning
    if (it == ring_.end()) {
        it = ring_.begin();
    }

    return it->second;
}

std::vector<std::string> ConsistentHashRing::replicasFor(const std::string& primary_shard_id,
                                                         size_t count,
                                                         const ActivePredicate& is_active) const {
    if (ring_.empty() || count == 0) {
        return {};
    }

    auto start = std::find_if(ring_.begin(), ring_.end(), [&](const auto& entry) {
        return entry.second == primary_shard_id;
    });
    if (start == ring_.end()) {
        start = ring_.begin();
    }

    return walkDistinct(start, primary_shard_id, count, is_active);
}

std::vector<std::string> ConsistentHashRing::getAllShards() const {
    std::vector<std::string> shards;
    shards.reserve(shard_vnodes_.size());

    for (const auto& [shard_id, _] : shard_vnodes_) {
        shards.push_back(shard_id);
    }

    return shards;
}

double ConsistentHashRing::getBalanceFactor() const {
    if (shard_vnodes_.empty()) {
        return 0.0;
    }

    double mean = static_cast<double>(ring_.size()) / static_cast<double>(shard_vnodes_.size());

    double variance = 0.0;
    for (const auto& [shard_id, vnodes] : shard_vnodes_) {
        double diff = static_cast<double>(vnodes) - mean;
        variance += diff * diff;
    }
    variance /= static_cast<double>(shard_vnodes_.size());

    return (std::sqrt(variance) / mean) * 100.0;
}

std::vector<std::string> ConsistentHashRing::walkDistinct(
    std::map<uint32_t, std::string>::const_iterator start,
    const std::string& exclude,
    size_t count,
    const ActivePredicate& is_active) const {

    std::vector<std::string> result;
    std::set<std::string> seen{exclude};

    auto it = start;
    for (size_t i = 0; i < ring_.size() && result.size() < count; ++i) {
        if (seen.insert(it->second).second && (!is_active || is_active(it->second))) {
            result.push_back(it->second);
        }
        if (seen.size() >= shard_vnodes_.size() + 1) {
            break;
        }

        ++it;
        if (it == ring_.end()) {
            it = ring_.begin(); // Wrap around
        }
    }

    return result;
}

} // namespace sams::sharding
