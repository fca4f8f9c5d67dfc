#pragma once

#include "sharding/sharding_error.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sams::sharding {

/**
 * A row is an untyped mapping from column name to a tagged value
 * (string, number, bool, null or binary). No schema is imposed.
 */
using Row = nlohmann::json;

/**
 * Connection parameters for one physical backend. Immutable once the
 * shard has been created.
 */
struct ShardConfig {
    std::string kind = "memory";     // backend kind, resolved by AdapterFactory
    std::string host = "localhost";
    uint16_t port = 0;
    std::string database;
    std::string username;
    std::string password;
    bool ssl = false;
    uint32_t pool_size = 20;
    uint32_t timeout_ms = 30000;     // backend-side idle/connect timeout
};

/**
 * Result of a query against a single backend
 */
struct QueryResult {
    std::vector<Row> rows;
    uint64_t row_count = 0;
    double execution_time_ms = 0.0;
    std::vector<std::string> fields;

    nlohmann::json toJson() const;
};

/**
 * Per-connection metrics reported by an adapter
 */
struct AdapterMetrics {
    uint32_t active_connections = 0;
    uint32_t total_connections = 0;
    uint64_t query_count = 0;
    double average_query_time_ms = 0.0;
    uint64_t error_count = 0;
    std::string last_error;

    nlohmann::json toJson() const;
};

/**
 * Uniform interface to one physical backend.
 *
 * The shard manager treats every shard as exactly one adapter. Each call is
 * an atomic request/response unit; failures are reported by throwing
 * AdapterError. Implementations must be safe to call from several threads.
 */
class ShardAdapter {
public:
    virtual ~ShardAdapter() = default;

    virtual void connect(const ShardConfig& config) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    /**
     * Probe the backend.
     * @return true if the backend answers; false or throw on failure
     */
    virtual bool healthCheck() = 0;

    /**
     * Run a parametrized query ('?' placeholders)
     */
    virtual QueryResult query(const std::string& query,
                              const std::vector<nlohmann::json>& params = {}) = 0;

    virtual Row insert(const std::string& table, const Row& row) = 0;
    virtual Row update(const std::string& table, const nlohmann::json& id, const Row& row) = 0;

    /**
     * Delete a row by identity
     * @return true if a row was deleted
     */
    virtual bool remove(const std::string& table, const nlohmann::json& id) = 0;

    virtual std::optional<Row> findById(const std::string& table, const nlohmann::json& id) = 0;

    virtual std::vector<Row> bulkInsert(const std::string& table, const std::vector<Row>& rows) {
        std::vector<Row> inserted;
        inserted.reserve(rows.size());
        for (const auto& row : rows) {
            inserted.push_back(insert(table, row));
        }
        return inserted;
    }

    virtual AdapterMetrics getMetrics() = 0;

    /**
     * Calls started through callWithTimeout that have not returned yet,
     * including calls the caller stopped waiting for
     */
    std::atomic<size_t>& inFlight() noexcept { return in_flight_; }

private:
    std::atomic<size_t> in_flight_{0};
};

} // namespace sams::sharding
