#include "error.hpp"

namespace stash::cache {

auto to_string(ConfigError error) noexcept -> std::string_view {
    switch (error) {
        case ConfigError::ZeroCapacity:
            return "max capacity must be greater than zero";
        case ConfigError::ZeroShards:
            return "shard count must be greater than zero";
        case ConfigError::CapacityBelowShards:
            return "max capacity must be at least the shard count";
        case ConfigError::ZeroTtl:
            return "default ttl must be greater than zero";
        case ConfigError::MissingByteBudget:
            return "size-based eviction requires a byte budget";
        case ConfigError::ZeroAdaptiveWindow:
            return "adaptive eviction requires a non-empty window";
        case ConfigError::MissingTimeSource:
            return "time source must not be null";
        case ConfigError::UnknownPolicy:
            return "unknown eviction policy";
        case ConfigError::MalformedConfig:
            return "malformed cache configuration";
    }
    return "unknown configuration error";
}

auto to_string(CacheError error) noexcept -> std::string_view {
    switch (error) {
        case CacheError::CapacityExceeded:
            return "capacity exceeded and no entry could be evicted";
    }
    return "unknown cache error";
}

}  // namespace stash::cache
