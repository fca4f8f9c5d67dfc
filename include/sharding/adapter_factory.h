#pragma once

#include "sharding/shard_adapter.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sams::sharding {

/**
 * Creates ShardAdapter instances by backend kind ("memory", "postgresql", ...).
 *
 * Backend drivers register a creator per kind. The factory does not connect
 * the adapter; the shard registry does that under its own timeout.
 */
class AdapterFactory {
public:
    using Creator = std::function<std::shared_ptr<ShardAdapter>(const ShardConfig&)>;

    /**
     * Factory with the built-in "memory" kind registered
     * @param id_column Identity column used by the built-in adapters
     */
    explicit AdapterFactory(std::string id_column = "id");

    void registerKind(const std::string& kind, Creator creator);
    bool hasKind(const std::string& kind) const;
    std::vector<std::string> kinds() const;

    /**
     * Create an unconnected adapter for config.kind
     * @throws ShardingError(CONNECTION_ERROR) for an unknown kind
     */
    std::shared_ptr<ShardAdapter> create(const ShardConfig& config) const;

private:
    std::map<std::string, Creator> creators_;
    mutable std::mutex mutex_;
};

} // namespace sams::sharding
