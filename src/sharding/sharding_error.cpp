#include "sharding/sharding_error.h"

namespace sams::sharding {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::DUPLICATE_SHARD: return "DuplicateShard";
        case ErrorCode::SHARD_NOT_FOUND: return "ShardNotFound";
        case ErrorCode::NO_SHARD_KEY_CONFIGURED: return "NoShardKeyConfigured";
        case ErrorCode::MISSING_SHARD_KEY_VALUE: return "MissingShardKeyValue";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::CONNECTION_ERROR: return "ConnectionError";
        case ErrorCode::ADAPTER_ERROR: return "AdapterError";
        case ErrorCode::TIMEOUT: return "Timeout";
        case ErrorCode::ROW_CONFLICT: return "RowConflict";
        case ErrorCode::NO_SHARDS_AVAILABLE: return "NoShardsAvailable";
        case ErrorCode::NO_ACTIVE_SHARDS: return "NoActiveShards";
    }
    return "Unknown";
}

} // namespace sams::sharding
