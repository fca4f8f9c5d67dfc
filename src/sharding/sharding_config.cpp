#define SAMS_LOG_COMPONENT "config"

#include "sharding/sharding_config.h"
#include "utils/logger.h"
#include <yaml-cpp/yaml.h>

namespace sams::sharding {

namespace {

std::chrono::milliseconds readMillis(const YAML::Node& node, const char* key,
                                     std::chrono::milliseconds fallback) {
    auto value = node[key].as<long long>(fallback.count());
    if (value <= 0) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT,
                            std::string(key) + " must be positive, got " + std::to_string(value));
    }
    return std::chrono::milliseconds(value);
}

size_t readPositive(const YAML::Node& node, const char* key, size_t fallback) {
    auto value = node[key].as<long long>(static_cast<long long>(fallback));
    if (value < 1) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT,
                            std::string(key) + " must be at least 1, got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

bool isLogLevel(const std::string& level) {
    static const char* const kLevels[] = {"trace", "debug", "info", "warn", "warning",
                                          "error", "err", "critical", "crit"};
    for (const char* known : kLevels) {
        if (level == known) return true;
    }
    return false;
}

ShardingConfig parse(const YAML::Node& root) {
    ShardingConfig result;

    if (auto sharding = root["sharding"]) {
        result.virtual_nodes = readPositive(sharding, "virtual_nodes", result.virtual_nodes);
        result.replication_factor = readPositive(sharding, "replication_factor", result.replication_factor);
        result.row_id_column = sharding["row_id_column"].as<std::string>(result.row_id_column);
        result.adapter_timeout = readMillis(sharding, "adapter_timeout_ms", result.adapter_timeout);
        result.replica_timeout = readMillis(sharding, "replica_timeout_ms", result.replica_timeout);

        if (auto health = sharding["health_check"]) {
            result.health_check.enabled = health["enabled"].as<bool>(true);
            result.health_check.interval = readMillis(health, "interval_ms", result.health_check.interval);
            result.health_check.probe_timeout = readMillis(health, "probe_timeout_ms",
                                                           result.health_check.probe_timeout);
        }

        if (auto rebalance = sharding["rebalance"]) {
            result.rebalance.threshold = rebalance["threshold"].as<double>(result.rebalance.threshold);
            result.rebalance.sample_size = readPositive(rebalance, "sample_size", result.rebalance.sample_size);
        }

        if (auto scatter = sharding["scatter_gather"]) {
            result.scatter_gather.collapse_replicas = scatter["collapse_replicas"].as<bool>(true);
        }

        if (auto shards = sharding["shards"]) {
            for (const auto& shard : shards) {
                ShardingConfig::ShardEntry entry;
                entry.id = shard["id"].as<std::string>("");
                entry.weight = static_cast<uint32_t>(readPositive(shard, "weight", 1));

                auto& conn = entry.connection;
                conn.kind = shard["kind"].as<std::string>(conn.kind);
                conn.host = shard["host"].as<std::string>(conn.host);
                conn.port = shard["port"].as<uint16_t>(conn.port);
                conn.database = shard["database"].as<std::string>("");
                conn.username = shard["username"].as<std::string>("");
                conn.password = shard["password"].as<std::string>("");
                conn.ssl = shard["ssl"].as<bool>(false);
                conn.pool_size = shard["pool_size"].as<uint32_t>(conn.pool_size);
                conn.timeout_ms = shard["timeout_ms"].as<uint32_t>(conn.timeout_ms);

                result.shards.push_back(std::move(entry));
            }
        }

        if (auto keys = sharding["shard_keys"]) {
            for (const auto& key : keys) {
                ShardKey shard_key;
                shard_key.table = key["table"].as<std::string>("");
                shard_key.column = key["column"].as<std::string>("");
                shard_key.algorithm = algorithmFromString(key["algorithm"].as<std::string>("hash"));
                result.shard_keys.push_back(std::move(shard_key));
            }
        }
    }

    if (auto logging = root["logging"]) {
        result.logging.level = logging["level"].as<std::string>(result.logging.level);
        result.logging.file = logging["file"].as<std::string>("");
        if (auto components = logging["components"]) {
            for (const auto& entry : components) {
                result.logging.components[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }
    }

    result.validate();
    return result;
}

} // namespace

ShardingConfig ShardingConfig::loadFromYaml(const std::string& yaml_path) {
    try {
        auto result = parse(YAML::LoadFile(yaml_path));
        SAMS_INFO("Loaded sharding configuration from {} ({} shards, {} shard keys)",
                  yaml_path, result.shards.size(), result.shard_keys.size());
        return result;
    } catch (const ShardingError&) {
        throw;
    } catch (const YAML::Exception& e) {
        SAMS_ERROR("Failed to load sharding configuration from {}: {}", yaml_path, e.what());
        throw ShardingError(ErrorCode::INVALID_ARGUMENT,
                            "Invalid sharding configuration " + yaml_path + ": " + e.what());
    }
}

ShardingConfig ShardingConfig::loadFromString(const std::string& yaml_text) {
    try {
        return parse(YAML::Load(yaml_text));
    } catch (const ShardingError&) {
        throw;
    } catch (const YAML::Exception& e) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT,
                            std::string("Invalid sharding configuration: ") + e.what());
    }
}

void ShardingConfig::validate() const {
    if (virtual_nodes == 0) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "virtual_nodes must be at least 1");
    }
    if (replication_factor < 1) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "replication_factor must be at least 1");
    }
    if (row_id_column.empty()) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "row_id_column must not be empty");
    }
    if (rebalance.threshold < 0.0) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "rebalance.threshold must not be negative");
    }

    if (!isLogLevel(logging.level)) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Unknown log level '" + logging.level + "'");
    }
    for (const auto& [component, level] : logging.components) {
        if (!isLogLevel(level)) {
            throw ShardingError(ErrorCode::INVALID_ARGUMENT,
                                "Unknown log level '" + level + "' for component " + component);
        }
    }

    for (const auto& shard : shards) {
        if (shard.id.empty()) {
            throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Every shard needs an id");
        }
    }
    for (const auto& key : shard_keys) {
        if (key.table.empty() || key.column.empty()) {
            throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Shard keys need a table and a column");
        }
    }
}

json ShardingConfig::toJson() const {
    json j;
    j["virtual_nodes"] = virtual_nodes;
    j["replication_factor"] = replication_factor;
    j["row_id_column"] = row_id_column;
    j["adapter_timeout_ms"] = adapter_timeout.count();
    j["replica_timeout_ms"] = replica_timeout.count();

    j["health_check"]["enabled"] = health_check.enabled;
    j["health_check"]["interval_ms"] = health_check.interval.count();
    j["health_check"]["probe_timeout_ms"] = health_check.probe_timeout.count();

    j["rebalance"]["threshold"] = rebalance.threshold;
    j["rebalance"]["sample_size"] = rebalance.sample_size;

    j["scatter_gather"]["collapse_replicas"] = scatter_gather.collapse_replicas;

    j["shards"] = json::array();
    for (const auto& shard : shards) {
        json s;
        s["id"] = shard.id;
        s["weight"] = shard.weight;
        s["kind"] = shard.connection.kind;
        s["host"] = shard.connection.host;
        s["port"] = shard.connection.port;
        s["database"] = shard.connection.database;
        s["username"] = shard.connection.username;
        // Mask password
        if (!shard.connection.password.empty()) {
            s["password"] = "***";
        }
        j["shards"].push_back(s);
    }

    j["shard_keys"] = json::array();
    for (const auto& key : shard_keys) {
        j["shard_keys"].push_back({
            {"table", key.table},
            {"column", key.column},
            {"algorithm", algorithmToString(key.algorithm)}
        });
    }

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;
    j["logging"]["components"] = logging.components;
    return j;
}

} // namespace sams::sharding
