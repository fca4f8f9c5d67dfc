#define SAMS_LOG_COMPONENT "registry"

#include "sharding/shard_registry.h"
#include "sharding/adapter_call.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>

namespace sams::sharding {

const char* algorithmToString(ShardingAlgorithm algorithm) {
    switch (algorithm) {
        case ShardingAlgorithm::HASH: return "hash";
        case ShardingAlgorithm::RANGE: return "range";
        case ShardingAlgorithm::DIRECTORY: return "directory";
    }
    return "hash";
}

ShardingAlgorithm algorithmFromString(const std::string& name) {
    std::string s = name;
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "hash") return ShardingAlgorithm::HASH;
    if (s == "range") return ShardingAlgorithm::RANGE;
    if (s == "directory") return ShardingAlgorithm::DIRECTORY;
    throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Unknown sharding algorithm: " + name);
}

ShardRegistry::ShardRegistry(const Config& config, std::shared_ptr<AdapterFactory> factory)
    : config_(config),
      factory_(std::move(factory)),
      ring_(ConsistentHashRing::build({}, config.virtual_nodes)) {
    if (!factory_) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Adapter factory must not be null");
    }
    if (config_.virtual_nodes == 0) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Virtual node count must be greater than 0");
    }
}

void ShardRegistry::addShard(const std::string& shard_id, const ShardConfig& config, uint32_t weight) {
    if (shard_id.empty()) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Shard id must not be empty");
    }
    if (weight == 0) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Shard weight must be at least 1");
    }
    if (hasShard(shard_id)) {
        throw ShardingError(ErrorCode::DUPLICATE_SHARD, "Shard already exists: " + shard_id);
    }

    // Connect outside the lock; the registry stays untouched until this succeeds
    std::shared_ptr<ShardAdapter> adapter;
    try {
        adapter = factory_->create(config);
        callWithTimeout(adapter, config_.adapter_timeout, "connect " + shard_id,
                        [config](ShardAdapter& a) { a.connect(config); });
    } catch (const std::exception& e) {
        SAMS_ERROR("Failed to add shard {}: {}", shard_id, e.what());
        throw ShardingError(ErrorCode::CONNECTION_ERROR,
                            "Failed to connect shard " + shard_id + ": " + e.what());
    }

    bool inserted = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        ShardEntry entry;
        entry.config = config;
        entry.weight = weight;
        entry.is_active = true;
        entry.last_health_check = std::chrono::system_clock::now();
        entry.adapter = adapter;
        inserted = shards_.emplace(shard_id, std::move(entry)).second;
    }

    if (!inserted) {
        // Lost a race against a concurrent addShard with the same id
        try {
            callWithTimeout(adapter, config_.adapter_timeout, "disconnect " + shard_id,
                            [](ShardAdapter& a) { a.disconnect(); });
        } catch (const ShardingError& e) {
            SAMS_WARN("Disconnect of duplicate shard {} failed: {}", shard_id, e.what());
        }
        throw ShardingError(ErrorCode::DUPLICATE_SHARD, "Shard already exists: " + shard_id);
    }

    rebuildRing();
    SAMS_INFO("Shard added: {} with weight {} ({})", shard_id, weight, config.kind);
}

ShardInfo ShardRegistry::beginRemoval(const std::string& shard_id) {
    ShardInfo info;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = shards_.find(shard_id);
        if (it == shards_.end()) {
            throw ShardingError(ErrorCode::SHARD_NOT_FOUND, "Shard not found: " + shard_id);
        }
        it->second.is_active = false;
        it->second.marked_down = true;
        info = toInfo(it->first, it->second);
    }

    rebuildRing();
    return info;
}

void ShardRegistry::eraseShard(const std::string& shard_id) {
    std::shared_ptr<ShardAdapter> adapter;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = shards_.find(shard_id);
        if (it == shards_.end()) {
            throw ShardingError(ErrorCode::SHARD_NOT_FOUND, "Shard not found: " + shard_id);
        }
        adapter = it->second.adapter;
        shards_.erase(it);
    }

    try {
        callWithTimeout(adapter, config_.adapter_timeout, "disconnect " + shard_id,
                        [](ShardAdapter& a) { a.disconnect(); });
    } catch (const ShardingError& e) {
        SAMS_WARN("Disconnect of shard {} failed: {}", shard_id, e.what());
    }

    rebuildRing();
}

std::optional<ShardInfo> ShardRegistry::getShard(const std::string& shard_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = shards_.find(shard_id);
    if (it == shards_.end()) {
        return std::nullopt;
    }

    return toInfo(it->first, it->second);
}

std::vector<ShardInfo> ShardRegistry::getAllShards() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ShardInfo> result;
    result.reserve(shards_.size());

    for (const auto& [id, entry] : shards_) {
        result.push_back(toInfo(id, entry));
    }

    return result;
}

std::vector<ShardInfo> ShardRegistry::getActiveShards() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ShardInfo> result;

    for (const auto& [id, entry] : shards_) {
        if (entry.is_active) {
            result.push_back(toInfo(id, entry));
        }
    }

    return result;
}

std::vector<std::string> ShardRegistry::getShardIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> ids;
    for (const auto& [id, _] : shards_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> ShardRegistry::getActiveShardIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> ids;
    for (const auto& [id, entry] : shards_) {
        if (entry.is_active) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::shared_ptr<ShardAdapter> ShardRegistry::getAdapter(const std::string& shard_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = shards_.find(shard_id);
    return it == shards_.end() ? nullptr : it->second.adapter;
}

bool ShardRegistry::hasShard(const std::string& shard_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return shards_.find(shard_id) != shards_.end();
}

bool ShardRegistry::isActive(const std::string& shard_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = shards_.find(shard_id);
    return it != shards_.end() && it->second.is_active;
}

bool ShardRegistry::updateHealth(const std::string& shard_id, bool healthy,
                                 std::chrono::system_clock::time_point checked_at) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = shards_.find(shard_id);
    if (it == shards_.end()) {
        return false; // removed while the probe was in flight
    }

    it->second.last_health_check = checked_at;
    bool active = healthy && !it->second.marked_down;
    if (it->second.is_active == active) {
        return false;
    }

    it->second.is_active = active;
    return true;
}

void ShardRegistry::markShardDown(const std::string& shard_id) {
    if (setOperatorState(shard_id, true)) {
        rebuildRing();
    }
    SAMS_INFO("Shard {} marked down", shard_id);
}

void ShardRegistry::markShardUp(const std::string& shard_id) {
    if (setOperatorState(shard_id, false)) {
        rebuildRing();
    }
    SAMS_INFO("Shard {} marked up", shard_id);
}

void ShardRegistry::setShardWeight(const std::string& shard_id, uint32_t weight) {
    if (weight == 0) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Shard weight must be at least 1");
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = shards_.find(shard_id);
        if (it == shards_.end()) {
            throw ShardingError(ErrorCode::SHARD_NOT_FOUND, "Shard not found: " + shard_id);
        }
        if (it->second.weight == weight) {
            return;
        }
        it->second.weight = weight;
    }

    rebuildRing();
    SAMS_INFO("Shard {} weight set to {}", shard_id, weight);
}

void ShardRegistry::setShardKey(const std::string& table, const std::string& column,
                                ShardingAlgorithm algorithm) {
    if (table.empty() || column.empty()) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Shard key table and column must not be empty");
    }
    if (algorithm != ShardingAlgorithm::HASH) {
        SAMS_WARN("Sharding algorithm '{}' for table {} is not implemented; routing by hash",
                  algorithmToString(algorithm), table);
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        shard_keys_[table] = ShardKey{table, column, algorithm};
    }
    SAMS_INFO("Shard key configured for table {}: {} ({})", table, column, algorithmToString(algorithm));
}

std::optional<ShardKey> ShardRegistry::getShardKey(const std::string& table) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = shard_keys_.find(table);
    if (it == shard_keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ShardKey> ShardRegistry::getShardKeys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ShardKey> keys;
    keys.reserve(shard_keys_.size());
    for (const auto& [_, key] : shard_keys_) {
        keys.push_back(key);
    }
    return keys;
}

void ShardRegistry::setReplicationFactor(size_t factor) {
    if (factor < 1) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Replication factor must be at least 1");
    }
    replication_factor_ = factor;
    SAMS_INFO("Replication factor set to {}", factor);
}

std::shared_ptr<const ConsistentHashRing> ShardRegistry::ring() const {
    std::lock_guard<std::mutex> lock(ring_mutex_);
    return ring_;
}

void ShardRegistry::rebuildRing() {
    std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);

    std::vector<RingMember> members;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        members.reserve(shards_.size());
        for (const auto& [id, entry] : shards_) {
            members.push_back(RingMember{id, entry.weight, entry.is_active});
        }
    }

    auto next = ConsistentHashRing::build(members, config_.virtual_nodes);
    SAMS_DEBUG("Consistent hash ring updated with {} virtual nodes over {} shards",
               next->getVirtualNodeCount(), next->getShardCount());

    std::lock_guard<std::mutex> lock(ring_mutex_);
    ring_ = std::move(next);
}

ConsistentHashRing::ActivePredicate ShardRegistry::activePredicate() const {
    return [this](const std::string& shard_id) { return isActive(shard_id); };
}

size_t ShardRegistry::getShardCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return shards_.size();
}

ShardInfo ShardRegistry::toInfo(const std::string& shard_id, const ShardEntry& entry) {
    ShardInfo info;
    info.shard_id = shard_id;
    info.config = entry.config;
    info.weight = entry.weight;
    info.is_active = entry.is_active;
    info.marked_down = entry.marked_down;
    info.last_health_check = entry.last_health_check;
    info.adapter = entry.adapter;
    return info;
}

bool ShardRegistry::setOperatorState(const std::string& shard_id, bool down) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = shards_.find(shard_id);
    if (it == shards_.end()) {
        throw ShardingError(ErrorCode::SHARD_NOT_FOUND, "Shard not found: " + shard_id);
    }

    it->second.marked_down = down;
    bool active = !down;
    if (it->second.is_active == active) {
        return false;
    }
    it->second.is_active = active;
    return true;
}

} // namespace sams::sharding
