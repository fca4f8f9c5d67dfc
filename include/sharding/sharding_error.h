#pragma once

#include <stdexcept>
#include <string>

namespace sams::sharding {

/**
 * Error kinds surfaced by the shard manager.
 *
 * Configuration errors are caller mistakes and are never retried.
 * Connectivity errors are recovered locally where possible (health probe,
 * scatter-gather leg, replica write) and surfaced otherwise.
 * Exhaustion errors mean the cluster cannot serve the request at all.
 */
enum class ErrorCode {
    // Configuration
    DUPLICATE_SHARD,
    SHARD_NOT_FOUND,
    NO_SHARD_KEY_CONFIGURED,
    MISSING_SHARD_KEY_VALUE,
    INVALID_ARGUMENT,
    // Connectivity
    CONNECTION_ERROR,
    ADAPTER_ERROR,
    TIMEOUT,
    // Data
    ROW_CONFLICT,
    // Exhaustion
    NO_SHARDS_AVAILABLE,
    NO_ACTIVE_SHARDS
};

const char* errorCodeToString(ErrorCode code);

class ShardingError : public std::runtime_error {
public:
    ShardingError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

    bool isConfigurationError() const noexcept {
        return code_ == ErrorCode::DUPLICATE_SHARD ||
               code_ == ErrorCode::SHARD_NOT_FOUND ||
               code_ == ErrorCode::NO_SHARD_KEY_CONFIGURED ||
               code_ == ErrorCode::MISSING_SHARD_KEY_VALUE ||
               code_ == ErrorCode::INVALID_ARGUMENT;
    }

    bool isExhaustionError() const noexcept {
        return code_ == ErrorCode::NO_SHARDS_AVAILABLE ||
               code_ == ErrorCode::NO_ACTIVE_SHARDS;
    }

private:
    ErrorCode code_;
};

// Thrown by ShardAdapter implementations for any failed backend call
class AdapterError : public ShardingError {
public:
    explicit AdapterError(const std::string& message)
        : ShardingError(ErrorCode::ADAPTER_ERROR, message) {}

    AdapterError(ErrorCode code, const std::string& message)
        : ShardingError(code, message) {}
};

} // namespace sams::sharding
