#define SAMS_LOG_COMPONENT "adapter"

#include "sharding/memory_adapter.h"
#include "utils/logger.h"
#include <algorithm>
#include <regex>
#include <thread>

namespace sams::sharding {

namespace {

// SELECT * | COUNT(*) [AS alias] FROM table [WHERE col = value] [ORDER BY RANDOM()] [LIMIT n]
const std::regex& selectPattern() {
    static const std::regex pattern(
        R"(^\s*SELECT\s+(\*|COUNT\(\*\)(?:\s+AS\s+(\w+))?)\s+FROM\s+(\w+))"
        R"((?:\s+WHERE\s+(\w+)\s*=\s*(\?|'[^']*'|-?\d+(?:\.\d+)?))?)"
        R"(((?:\s+ORDER\s+BY\s+RANDOM\(\)))?(?:\s+LIMIT\s+(\d+))?\s*;?\s*$)",
        std::regex::icase | std::regex::ECMAScript);
    return pattern;
}

nlohmann::json parseLiteral(const std::string& literal,
                            const std::vector<nlohmann::json>& params) {
    if (literal == "?") {
        if (params.empty()) {
            throw AdapterError("Missing value for query parameter");
        }
        return params.front();
    }
    if (!literal.empty() && literal.front() == '\'') {
        return literal.substr(1, literal.size() - 2);
    }
    return nlohmann::json::parse(literal);
}

} // namespace

MemoryAdapter::MemoryAdapter(std::string id_column)
    : id_column_(std::move(id_column)),
      rng_(std::random_device{}()) {
}

void MemoryAdapter::connect(const ShardConfig& config) {
    if (latency_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms_.load()));
    }
    if (refuse_connections_) {
        recordError("connection refused");
        throw AdapterError(ErrorCode::CONNECTION_ERROR,
                           "Connection refused: " + config.host + ":" + std::to_string(config.port));
    }

    connected_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.active_connections = 1;
        metrics_.total_connections++;
    }
    SAMS_DEBUG("Memory backend connected ({}:{}/{})", config.host, config.port, config.database);
}

void MemoryAdapter::disconnect() {
    connected_ = false;
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.active_connections = 0;
}

bool MemoryAdapter::isConnected() const {
    return connected_;
}

bool MemoryAdapter::healthCheck() {
    if (latency_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms_.load()));
    }
    if (!connected_ || !online_) {
        recordError("health check failed: backend unreachable");
        return false;
    }
    return true;
}

QueryResult MemoryAdapter::query(const std::string& query,
                                 const std::vector<nlohmann::json>& params) {
    enterCall("query");
    auto start = std::chrono::steady_clock::now();

    std::smatch match;
    if (!std::regex_match(query, match, selectPattern())) {
        recordError("unsupported statement");
        throw AdapterError("Unsupported statement: " + query);
    }

    const bool is_count = match[1].str() != "*";
    const std::string alias = match[2].matched ? match[2].str() : "count";
    const std::string table = match[3].str();
    std::optional<std::pair<std::string, nlohmann::json>> where;
    if (match[4].matched) {
        where.emplace(match[4].str(), parseLiteral(match[5].str(), params));
    }
    const bool random_order = match[6].matched && !match[6].str().empty();
    std::optional<size_t> limit;
    if (match[7].matched) {
        limit = static_cast<size_t>(std::stoull(match[7].str()));
    }

    QueryResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tables_.find(table);
        if (it != tables_.end()) {
            for (const auto& row : it->second) {
                if (where) {
                    auto col = row.find(where->first);
                    if (col == row.end() || *col != where->second) {
                        continue;
                    }
                }
                result.rows.push_back(row);
            }
        }
        if (random_order) {
            std::shuffle(result.rows.begin(), result.rows.end(), rng_);
        }
    }

    if (is_count) {
        uint64_t count = result.rows.size();
        result.rows.clear();
        result.rows.push_back(nlohmann::json{{alias, count}});
        result.fields = {alias};
    } else if (limit && result.rows.size() > *limit) {
        result.rows.resize(*limit);
    }
    result.row_count = result.rows.size();

    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    recordQuery(result.execution_time_ms);
    return result;
}

Row MemoryAdapter::insert(const std::string& table, const Row& row) {
    enterCall("insert");
    if (!row.is_object()) {
        recordError("insert of non-object row");
        throw AdapterError("Row must be an object");
    }

    Row stored = row;
    std::string failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& rows = tables_[table];
        auto id = stored.find(id_column_);
        if (id != stored.end() && !id->is_null()) {
            if (findRow(rows, *id) != rows.end()) {
                failure = "duplicate key value violates unique constraint " + table + "." +
                          id_column_ + " = " + id->dump();
            }
        } else {
            while (findRow(rows, next_id_) != rows.end()) {
                ++next_id_;
            }
            stored[id_column_] = next_id_++;
        }
        if (failure.empty()) {
            rows.push_back(stored);
        }
    }

    if (!failure.empty()) {
        recordError(failure);
        throw AdapterError(failure);
    }
    recordQuery(0.0);
    return stored;
}

Row MemoryAdapter::update(const std::string& table, const nlohmann::json& id, const Row& row) {
    enterCall("update");
    std::optional<Row> updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& rows = tables_[table];
        auto it = findRow(rows, id);
        if (it != rows.end()) {
            it->update(row);
            (*it)[id_column_] = id;
            updated = *it;
        }
    }

    if (!updated) {
        recordError("update of missing row");
        throw AdapterError("No row in " + table + " with " + id_column_ + " = " + id.dump());
    }
    recordQuery(0.0);
    return *updated;
}

bool MemoryAdapter::remove(const std::string& table, const nlohmann::json& id) {
    enterCall("delete");
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto table_it = tables_.find(table);
        if (table_it != tables_.end()) {
            auto it = findRow(table_it->second, id);
            if (it != table_it->second.end()) {
                table_it->second.erase(it);
                removed = true;
            }
        }
    }
    recordQuery(0.0);
    return removed;
}

std::optional<Row> MemoryAdapter::findById(const std::string& table, const nlohmann::json& id) {
    enterCall("findById");
    std::optional<Row> found;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto table_it = tables_.find(table);
        if (table_it != tables_.end()) {
            auto it = findRow(table_it->second, id);
            if (it != table_it->second.end()) {
                found = *it;
            }
        }
    }
    recordQuery(0.0);
    return found;
}

AdapterMetrics MemoryAdapter::getMetrics() {
    enterCall("getMetrics");
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

size_t MemoryAdapter::rowCount(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(table);
    return it == tables_.end() ? 0 : it->second.size();
}

std::vector<Row> MemoryAdapter::rows(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tables_.find(table);
    return it == tables_.end() ? std::vector<Row>{} : it->second;
}

void MemoryAdapter::enterCall(const char* operation) {
    if (latency_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms_.load()));
    }
    if (!connected_) {
        recordError(std::string(operation) + " on closed connection");
        throw AdapterError(std::string("Database not connected (") + operation + ")");
    }
    if (!online_) {
        recordError(std::string(operation) + " on unreachable backend");
        throw AdapterError(std::string("Backend unreachable (") + operation + ")");
    }
}

void MemoryAdapter::recordQuery(double elapsed_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.query_count++;
    metrics_.average_query_time_ms +=
        (elapsed_ms - metrics_.average_query_time_ms) / static_cast<double>(metrics_.query_count);
}

void MemoryAdapter::recordError(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.error_count++;
    metrics_.last_error = message;
}

std::vector<Row>::iterator MemoryAdapter::findRow(std::vector<Row>& rows, const nlohmann::json& id) {
    return std::find_if(rows.begin(), rows.end(), [&](const Row& row) {
        auto it = row.find(id_column_);
        return it != row.end() && *it == id;
    });
}

} // namespace sams::sharding
