#include "sharding/adapter_factory.h"
#include "sharding/memory_adapter.h"

namespace sams::sharding {

AdapterFactory::AdapterFactory(std::string id_column) {
    creators_["memory"] = [id_column](const ShardConfig&) {
        return std::make_shared<MemoryAdapter>(id_column);
    };
}

void AdapterFactory::registerKind(const std::string& kind, Creator creator) {
    if (kind.empty() || !creator) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Adapter kind and creator must be set");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    creators_[kind] = std::move(creator);
}

bool AdapterFactory::hasKind(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return creators_.count(kind) > 0;
}

std::vector<std::string> AdapterFactory::kinds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [kind, _] : creators_) {
        result.push_back(kind);
    }
    return result;
}

std::shared_ptr<ShardAdapter> AdapterFactory::create(const ShardConfig& config) const {
    Creator creator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = creators_.find(config.kind);
        if (it == creators_.end()) {
            throw ShardingError(ErrorCode::CONNECTION_ERROR,
                                "Unsupported backend kind: " + config.kind);
        }
        creator = it->second;
    }

    auto adapter = creator(config);
    if (!adapter) {
        throw ShardingError(ErrorCode::CONNECTION_ERROR,
                            "Adapter creation failed for kind: " + config.kind);
    }
    return adapter;
}

} // namespace sams::sharding
