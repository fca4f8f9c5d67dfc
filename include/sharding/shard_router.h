#pragma once

#include "sharding/shard_adapter.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sams::sharding {

class ShardRegistry;
class PrometheusMetrics;

/**
 * Outcome of a routed write
 */
struct WriteResult {
    std::string primary_shard_id;
    Row stored;                                 // row as stored by the primary
    std::vector<std::string> replica_shard_ids; // replicas that acknowledged
    std::vector<std::string> failed_replicas;   // replicas that failed or timed out
};

/**
 * Shard Router - Routes keyed operations to their owning shard
 *
 * Responsible for:
 * - Resolving the routing key of a row from its table's shard key
 * - Writing the row to its primary shard (the operation of record)
 * - Fanning the write out to replica shards, best effort
 * - Forwarding single-shard queries by key
 *
 * Replication is eventually consistent: a failed replica write is logged
 * and counted but never fails the primary write.
 */
class ShardRouter {
public:
    struct Config {
        std::chrono::milliseconds adapter_timeout{5000};   // primary write / keyed query
        std::chrono::milliseconds replica_timeout{5000};   // each replica write
        std::string row_id_column = "id";
    };

    ShardRouter(ShardRegistry& registry, PrometheusMetrics& metrics, const Config& config);

    /**
     * Store a row on its primary shard and replicate it
     *
     * A row without a value in the row id column is given a random UUID
     * before the primary write, so every copy carries the same identity.
     * @throws ShardingError NO_SHARD_KEY_CONFIGURED, MISSING_SHARD_KEY_VALUE,
     *         INVALID_ARGUMENT, NO_SHARDS_AVAILABLE; AdapterError if the
     *         primary write fails or times out
     */
    WriteResult distributeData(const std::string& table, const Row& row);

    /**
     * Run a query on the shard owning `key`
     * @throws ShardingError NO_SHARDS_AVAILABLE; AdapterError from the shard
     */
    QueryResult queryShardByKey(const std::string& key,
                                const std::string& query,
                                const std::vector<nlohmann::json>& params = {});

    /**
     * Primary shard for a routing key (skips inactive shards)
     */
    std::string getShardForKey(const std::string& key) const;

    /**
     * Every shard that should hold a copy of `key`: the primary first,
     * then up to replicationFactor-1 ring successors
     */
    std::vector<std::string> getOwnersForKey(const std::string& key) const;

    /**
     * Routing key of a row for a table
     * @throws ShardingError NO_SHARD_KEY_CONFIGURED or MISSING_SHARD_KEY_VALUE
     */
    std::string routingKeyFor(const std::string& table, const Row& row) const;

    /**
     * Text form of a shard key value used for hashing: strings as-is,
     * numbers in shortest decimal form, booleans as true/false
     */
    static std::string stringifyKey(const nlohmann::json& value);

    /**
     * Random version 4 UUID in canonical text form
     * @throws std::runtime_error if the random source fails
     */
    static std::string generateRowId();

    /**
     * Get statistics about routing
     * @return Statistics (writes, keyed queries, replica failures, errors)
     */
    nlohmann::json getStatistics() const;

private:
    ShardRegistry& registry_;
    PrometheusMetrics& metrics_;
    Config config_;

    // Statistics
    mutable std::atomic<uint64_t> total_writes_{0};
    mutable std::atomic<uint64_t> keyed_queries_{0};
    mutable std::atomic<uint64_t> replica_writes_{0};
    mutable std::atomic<uint64_t> replica_failures_{0};
    mutable std::atomic<uint64_t> errors_{0};

    void replicate(const std::string& table, const Row& row,
                   const std::vector<std::string>& targets, WriteResult& result);
};

} // namespace sams::sharding
