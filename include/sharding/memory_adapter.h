#pragma once

#include "sharding/shard_adapter.h"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <random>

namespace sams::sharding {

/**
 * In-process table store implementing ShardAdapter (backend kind "memory").
 *
 * Understands the statement forms the shard manager issues:
 *   SELECT * FROM <table> [WHERE <col> = ?] [ORDER BY RANDOM()] [LIMIT <n>]
 *   SELECT COUNT(*) [AS <name>] FROM <table> [WHERE <col> = ?]
 *
 * Rows are keyed by an identity column; inserting a duplicate identity fails
 * like a primary-key violation, and rows without one get a generated
 * integer id. The adapter can be taken offline and given artificial latency
 * to simulate degraded backends.
 */
class MemoryAdapter : public ShardAdapter {
public:
    explicit MemoryAdapter(std::string id_column = "id");
    ~MemoryAdapter() override = default;

    void connect(const ShardConfig& config) override;
    void disconnect() override;
    bool isConnected() const override;
    bool healthCheck() override;

    QueryResult query(const std::string& query,
                      const std::vector<nlohmann::json>& params = {}) override;

    Row insert(const std::string& table, const Row& row) override;
    Row update(const std::string& table, const nlohmann::json& id, const Row& row) override;
    bool remove(const std::string& table, const nlohmann::json& id) override;
    std::optional<Row> findById(const std::string& table, const nlohmann::json& id) override;

    AdapterMetrics getMetrics() override;

    // Simulation controls
    void setOnline(bool online) { online_ = online; }
    bool isOnline() const { return online_; }
    void setLatency(std::chrono::milliseconds latency) { latency_ms_ = latency.count(); }
    // Refuse new connections (connect() throws) while set
    void setRefuseConnections(bool refuse) { refuse_connections_ = refuse; }

    size_t rowCount(const std::string& table) const;
    std::vector<Row> rows(const std::string& table) const;

private:
    std::string id_column_;
    std::map<std::string, std::vector<Row>> tables_;
    mutable std::mutex mutex_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> online_{true};
    std::atomic<bool> refuse_connections_{false};
    std::atomic<int64_t> latency_ms_{0};
    int64_t next_id_ = 1;
    std::mt19937 rng_;

    AdapterMetrics metrics_;

    // Throws AdapterError when disconnected or offline, applies latency
    void enterCall(const char* operation);
    void recordQuery(double elapsed_ms);
    void recordError(const std::string& message);

    std::vector<Row>::iterator findRow(std::vector<Row>& rows, const nlohmann::json& id);
};

} // namespace sams::sharding
