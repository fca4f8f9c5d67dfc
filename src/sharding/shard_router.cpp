#define SAMS_LOG_COMPONENT "router"

#include "sharding/shard_router.h"
#include "sharding/adapter_call.h"
#include "sharding/prometheus_metrics.h"
#include "sharding/shard_registry.h"
#include "utils/logger.h"
#include <openssl/rand.h>
#include <tbb/task_group.h>
#include <iomanip>
#include <sstream>

namespace sams::sharding {

ShardRouter::ShardRouter(ShardRegistry& registry, PrometheusMetrics& metrics, const Config& config)
    : registry_(registry), metrics_(metrics), config_(config) {
}

WriteResult ShardRouter::distributeData(const std::string& table, const Row& row) {
    total_writes_++;
    metrics_.recordRoutingRequest("write");
    auto start = std::chrono::steady_clock::now();

    if (!row.is_object()) {
        errors_++;
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Row for table " + table + " must be an object");
    }

    const std::string key = routingKeyFor(table, row);

    Row keyed = row;
    auto id_it = keyed.find(config_.row_id_column);
    if (id_it == keyed.end() || id_it->is_null()) {
        keyed[config_.row_id_column] = generateRowId();
    }

    WriteResult result;
    result.primary_shard_id = getShardForKey(key);

    auto adapter = registry_.getAdapter(result.primary_shard_id);
    if (!adapter) {
        errors_++;
        throw ShardingError(ErrorCode::SHARD_NOT_FOUND, "Shard not found: " + result.primary_shard_id);
    }

    try {
        result.stored = callWithTimeout(adapter, config_.adapter_timeout,
                                        "insert into " + table + " on " + result.primary_shard_id,
                                        [table, keyed](ShardAdapter& a) { return a.insert(table, keyed); });
    } catch (const AdapterError& e) {
        errors_++;
        metrics_.recordRoutingError(result.primary_shard_id, errorCodeToString(e.code()));
        SAMS_ERROR("Write to {} on shard {} failed: {}", table, result.primary_shard_id, e.what());
        throw;
    } catch (const std::exception& e) {
        errors_++;
        metrics_.recordRoutingError(result.primary_shard_id, "AdapterError");
        SAMS_ERROR("Write to {} on shard {} failed: {}", table, result.primary_shard_id, e.what());
        throw AdapterError(std::string("Write failed on shard ") + result.primary_shard_id + ": " + e.what());
    }

    const size_t factor = registry_.getReplicationFactor();
    if (factor > 1) {
        auto targets = registry_.ring()->replicasFor(result.primary_shard_id, factor - 1,
                                                     registry_.activePredicate());
        if (targets.size() < factor - 1) {
            SAMS_WARN("Only {} of {} replica shards available for {} key {}",
                      targets.size(), factor - 1, table, key);
        }
        replicate(table, result.stored, targets, result);
    }

    metrics_.recordRoutingLatency("write", std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count());
    return result;
}

QueryResult ShardRouter::queryShardByKey(const std::string& key,
                                         const std::string& query,
                                         const std::vector<nlohmann::json>& params) {
    keyed_queries_++;
    metrics_.recordRoutingRequest("key_query");
    auto start = std::chrono::steady_clock::now();

    const std::string shard_id = getShardForKey(key);
    auto adapter = registry_.getAdapter(shard_id);
    if (!adapter) {
        errors_++;
        throw ShardingError(ErrorCode::SHARD_NOT_FOUND, "Shard not found: " + shard_id);
    }

    QueryResult result;
    try {
        result = callWithTimeout(adapter, config_.adapter_timeout, "query on " + shard_id,
                                 [query, params](ShardAdapter& a) { return a.query(query, params); });
    } catch (const AdapterError& e) {
        errors_++;
        metrics_.recordRoutingError(shard_id, errorCodeToString(e.code()));
        throw;
    } catch (const std::exception& e) {
        errors_++;
        metrics_.recordRoutingError(shard_id, "AdapterError");
        throw AdapterError(std::string("Query failed on shard ") + shard_id + ": " + e.what());
    }

    metrics_.recordRoutingLatency("key_query", std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count());
    return result;
}

std::string ShardRouter::getShardForKey(const std::string& key) const {
    if (registry_.getShardCount() == 0) {
        throw ShardingError(ErrorCode::NO_SHARDS_AVAILABLE, "No shards available");
    }
    return registry_.ring()->lookupSkippingInactive(key, registry_.activePredicate());
}

std::vector<std::string> ShardRouter::getOwnersForKey(const std::string& key) const {
    auto ring = registry_.ring();
    auto is_active = registry_.activePredicate();

    std::vector<std::string> owners{ring->lookupSkippingInactive(key, is_active)};
    const size_t factor = registry_.getReplicationFactor();
    if (factor > 1) {
        auto replicas = ring->replicasFor(owners.front(), factor - 1, is_active);
        owners.insert(owners.end(), replicas.begin(), replicas.end());
    }
    return owners;
}

std::string ShardRouter::routingKeyFor(const std::string& table, const Row& row) const {
    auto shard_key = registry_.getShardKey(table);
    if (!shard_key) {
        throw ShardingError(ErrorCode::NO_SHARD_KEY_CONFIGURED,
                            "No shard key configured for table: " + table);
    }

    auto it = row.is_object() ? row.find(shard_key->column) : row.end();
    if (!row.is_object() || it == row.end() || it->is_null()) {
        throw ShardingError(ErrorCode::MISSING_SHARD_KEY_VALUE,
                            "Shard key column '" + shard_key->column + "' not found in data for table " + table);
    }

    return stringifyKey(*it);
}

std::string ShardRouter::stringifyKey(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

std::string ShardRouter::generateRowId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("Failed to generate row id");
    }

    bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80; // variant 10

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

nlohmann::json ShardRouter::getStatistics() const {
    return nlohmann::json{
        {"total_writes", total_writes_.load()},
        {"keyed_queries", keyed_queries_.load()},
        {"replica_writes", replica_writes_.load()},
        {"replica_failures", replica_failures_.load()},
        {"errors", errors_.load()}
    };
}

void ShardRouter::replicate(const std::string& table, const Row& row,
                            const std::vector<std::string>& targets, WriteResult& result) {
    std::vector<char> succeeded(targets.size(), 0);

    tbb::task_group tg;
    for (size_t i = 0; i < targets.size(); ++i) {
        tg.run([this, &table, &row, &targets, &succeeded, i]() {
            const auto& shard_id = targets[i];
            try {
                auto adapter = registry_.getAdapter(shard_id);
                if (!adapter) {
                    throw AdapterError("replica shard " + shard_id + " is gone");
                }
                callWithTimeout(adapter, config_.replica_timeout,
                                "replicate " + table + " to " + shard_id,
                                [table, row](ShardAdapter& a) { a.insert(table, row); });
                succeeded[i] = 1;
            } catch (const std::exception& e) {
                SAMS_ERROR("Replication failed to shard {}: {}", shard_id, e.what());
            }
        });
    }
    tg.wait();

    for (size_t i = 0; i < targets.size(); ++i) {
        metrics_.recordReplicaWrite(targets[i], succeeded[i] != 0);
        if (succeeded[i]) {
            replica_writes_++;
            result.replica_shard_ids.push_back(targets[i]);
        } else {
            replica_failures_++;
            result.failed_replicas.push_back(targets[i]);
        }
    }
}

} // namespace sams::sharding
