#ifndef STASH_CACHE_ERROR_HPP
#define STASH_CACHE_ERROR_HPP

#include <string_view>

#include "stash/type/expected.hpp"

namespace stash::cache {

/**
 * @brief Reasons a cache configuration is rejected at construction time.
 *
 * None of these are recoverable automatically: the host must fix the
 * configuration and build again.
 */
enum class ConfigError {
    ZeroCapacity,         ///< max_capacity was set to zero.
    ZeroShards,           ///< shard count was zero.
    CapacityBelowShards,  ///< fewer capacity slots than shards.
    ZeroTtl,              ///< default TTL was zero or negative.
    MissingByteBudget,    ///< size-based eviction without a byte budget.
    ZeroAdaptiveWindow,   ///< adaptive eviction with an empty window.
    MissingTimeSource,    ///< time source pointer was null.
    UnknownPolicy,        ///< policy name in a config file is not known.
    MalformedConfig       ///< config document has the wrong shape.
};

/**
 * @brief Per-operation failures. Absent keys are not errors.
 */
enum class CacheError {
    CapacityExceeded  ///< eviction could not make room for the insertion.
};

[[nodiscard]] auto to_string(ConfigError error) noexcept -> std::string_view;
[[nodiscard]] auto to_string(CacheError error) noexcept -> std::string_view;

template <typename T>
using ConfigResult = type::expected<T, ConfigError>;

template <typename T>
using CacheResult = type::expected<T, CacheError>;

}  // namespace stash::cache

#endif  // STASH_CACHE_ERROR_HPP
