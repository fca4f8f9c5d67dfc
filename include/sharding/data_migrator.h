#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sams {
namespace sharding {

class ShardRegistry;
class ShardRouter;
class PrometheusMetrics;

// Progress information for data migration
struct MigrationProgress {
    std::string table;
    uint64_t records_migrated = 0;
    uint64_t total_records = 0;     // rows read from the source so far
    uint64_t skipped = 0;
    uint64_t errors = 0;
    double progress_percent = 0.0;  // of the current table
};

// Result of a migration operation
struct MigrationResult {
    bool success = false;           // true only if no row failed
    uint64_t records_migrated = 0;
    uint64_t skipped = 0;           // rows without shard-key value or identity
    uint64_t failed = 0;
    std::vector<std::string> errors;

    nlohmann::json toJson() const;
};

/**
 * Moves every row off a shard that is leaving the cluster.
 *
 * Expects the ring to have been rebuilt without the source shard already,
 * so each row's owners are computed on the surviving topology. A row is
 * copied to every owner that does not hold it yet and then deleted from
 * the source; this restores the replication factor for the moved rows.
 *
 * Not atomic: a failure leaves the row on the source and is reported in
 * the result, the logs and the metrics.
 */
class DataMigrator {
public:
    using ProgressCallback = std::function<void(const MigrationProgress&)>;

    struct Config {
        std::chrono::milliseconds adapter_timeout{5000};
        std::string row_id_column = "id";
    };

    DataMigrator(ShardRegistry& registry, ShardRouter& router,
                 PrometheusMetrics& metrics, const Config& config);

    /**
     * Migrate every sharded table of a shard to its new owners
     *
     * @param source_shard_id Shard being drained (must still be registered)
     * @param progress_callback Optional callback, invoked once per table
     * @return MigrationResult with per-row outcome counts
     * @throws ShardingError(SHARD_NOT_FOUND) if the shard is not registered
     */
    MigrationResult migrateShardData(const std::string& source_shard_id,
                                     ProgressCallback progress_callback = nullptr);

    /**
     * Move one row from `source_shard_id` to the owners of its routing key
     * An owner already holding an identical row is left alone. The source
     * copy is deleted only once every owner holds the row.
     * @return false if the row was already placed correctly (nothing moved)
     * @throws ShardingError(ROW_CONFLICT) if an owner holds a different row
     *         under the same id; ShardingError/AdapterError when a copy or
     *         the delete fails
     */
    bool relocateRow(const std::string& source_shard_id, const std::string& table,
                     const nlohmann::json& row);

private:
    ShardRegistry& registry_;
    ShardRouter& router_;
    PrometheusMetrics& metrics_;
    Config config_;

    void migrateTable(const std::string& source_shard_id, const std::string& table,
                      MigrationResult& result, const ProgressCallback& progress_callback);
};

} // namespace sharding
} // namespace sams
