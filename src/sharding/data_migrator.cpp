#define SAMS_LOG_COMPONENT "migration"

#include "sharding/data_migrator.h"
#include "sharding/adapter_call.h"
#include "sharding/prometheus_metrics.h"
#include "sharding/shard_registry.h"
#include "sharding/shard_router.h"
#include "utils/logger.h"
#include <algorithm>

namespace sams {
namespace sharding {

nlohmann::json MigrationResult::toJson() const {
    return nlohmann::json{
        {"success", success},
        {"recordsMigrated", records_migrated},
        {"skipped", skipped},
        {"failed", failed},
        {"errors", errors}
    };
}

DataMigrator::DataMigrator(ShardRegistry& registry, ShardRouter& router,
                           PrometheusMetrics& metrics, const Config& config)
    : registry_(registry), router_(router), metrics_(metrics), config_(config) {

    if (config_.row_id_column.empty()) {
        throw ShardingError(ErrorCode::INVALID_ARGUMENT, "Row id column must not be empty");
    }
}

MigrationResult DataMigrator::migrateShardData(const std::string& source_shard_id,
                                               ProgressCallback progress_callback) {
    if (!registry_.hasShard(source_shard_id)) {
        throw ShardingError(ErrorCode::SHARD_NOT_FOUND, "Shard not found: " + source_shard_id);
    }

    MigrationResult result;
    SAMS_INFO("Migrating data off shard {}", source_shard_id);

    for (const auto& shard_key : registry_.getShardKeys()) {
        migrateTable(source_shard_id, shard_key.table, result, progress_callback);
    }

    result.success = result.failed == 0 && result.errors.empty();
    metrics_.recordMigration(source_shard_id, result.records_migrated, result.skipped, result.failed);

    if (result.success) {
        SAMS_INFO("Migration of shard {} complete: {} migrated, {} skipped",
                  source_shard_id, result.records_migrated, result.skipped);
    } else {
        SAMS_ERROR("Migration of shard {} incomplete: {} migrated, {} skipped, {} failed, {} errors",
                   source_shard_id, result.records_migrated, result.skipped, result.failed,
                   result.errors.size());
    }
    return result;
}

bool DataMigrator::relocateRow(const std::string& source_shard_id, const std::string& table,
                               const nlohmann::json& row) {
    const auto id = row.at(config_.row_id_column);
    const auto owners = router_.getOwnersForKey(router_.routingKeyFor(table, row));

    if (std::find(owners.begin(), owners.end(), source_shard_id) != owners.end()) {
        return false;
    }

    for (const auto& owner : owners) {
        auto adapter = registry_.getAdapter(owner);
        auto present = callWithTimeout(adapter, config_.adapter_timeout,
                                       "lookup in " + table + " on " + owner,
                                       [table, id](ShardAdapter& a) { return a.findById(table, id); });
        if (!present) {
            callWithTimeout(adapter, config_.adapter_timeout,
                            "insert into " + table + " on " + owner,
                            [table, row](ShardAdapter& a) { return a.insert(table, row); });
        } else if (*present != row) {
            throw ShardingError(ErrorCode::ROW_CONFLICT,
                                "Shard " + owner + " holds a different " + table + " row with id " + id.dump());
        }
    }

    auto source = registry_.getAdapter(source_shard_id);
    callWithTimeout(source, config_.adapter_timeout,
                    "delete from " + table + " on " + source_shard_id,
                    [table, id](ShardAdapter& a) { return a.remove(table, id); });
    return true;
}

void DataMigrator::migrateTable(const std::string& source_shard_id, const std::string& table,
                                MigrationResult& result, const ProgressCallback& progress_callback) {
    auto source = registry_.getAdapter(source_shard_id);

    QueryResult rows;
    try {
        const std::string query = "SELECT * FROM " + table;
        rows = callWithTimeout(source, config_.adapter_timeout, "read " + table + " from " + source_shard_id,
                               [query](ShardAdapter& a) { return a.query(query); });
    } catch (const std::exception& e) {
        SAMS_ERROR("Failed to read table {} from shard {}: {}", table, source_shard_id, e.what());
        result.errors.push_back("read " + table + ": " + e.what());
        return;
    }

    MigrationProgress progress;
    progress.table = table;
    progress.total_records = rows.rows.size();

    for (const auto& row : rows.rows) {
        auto id_it = row.is_object() ? row.find(config_.row_id_column) : row.end();
        if (!row.is_object() || id_it == row.end() || id_it->is_null()) {
            result.skipped++;
            progress.skipped++;
            continue;
        }

        try {
            if (relocateRow(source_shard_id, table, row)) {
                result.records_migrated++;
                progress.records_migrated++;
            } else {
                result.skipped++;
                progress.skipped++;
            }
        } catch (const ShardingError& e) {
            if (e.code() == ErrorCode::MISSING_SHARD_KEY_VALUE) {
                result.skipped++;
                progress.skipped++;
                continue;
            }
            result.failed++;
            progress.errors++;
            result.errors.push_back(table + " " + id_it->dump() + ": " + e.what());
            SAMS_ERROR("Failed to migrate {} row {} from shard {}: {}",
                       table, id_it->dump(), source_shard_id, e.what());
        } catch (const std::exception& e) {
            result.failed++;
            progress.errors++;
            result.errors.push_back(table + " " + id_it->dump() + ": " + e.what());
            SAMS_ERROR("Failed to migrate {} row {} from shard {}: {}",
                       table, id_it->dump(), source_shard_id, e.what());
        }
    }

    progress.progress_percent = 100.0;
    if (progress_callback) {
        progress_callback(progress);
    }
    SAMS_DEBUG("Table {} on shard {}: {} rows, {} migrated", table, source_shard_id,
               progress.total_records, progress.records_migrated);
}

} // namespace sharding
} // namespace sams
