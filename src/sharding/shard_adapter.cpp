#include "sharding/shard_adapter.h"

namespace sams::sharding {

nlohmann::json QueryResult::toJson() const {
    return nlohmann::json{
        {"rows", rows},
        {"rowCount", row_count},
        {"executionTime", execution_time_ms},
        {"fields", fields}
    };
}

nlohmann::json AdapterMetrics::toJson() const {
    nlohmann::json j{
        {"activeConnections", active_connections},
        {"totalConnections", total_connections},
        {"queryCount", query_count},
        {"averageQueryTime", average_query_time_ms},
        {"errorCount", error_count}
    };
    if (!last_error.empty()) {
        j["lastError"] = last_error;
    }
    return j;
}

} // namespace sams::sharding
