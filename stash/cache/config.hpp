/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: Cache configuration, its validation and JSON form

**************************************************/

#ifndef STASH_CACHE_CONFIG_HPP
#define STASH_CACHE_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include <nlohmann/json_fwd.hpp>

#include "stash/cache/error.hpp"
#include "stash/cache/eviction.hpp"
#include "stash/cache/ttl.hpp"

namespace stash::cache {

/**
 * @brief Settings of a single store, i.e. of one shard.
 */
struct StoreOptions {
    std::optional<std::size_t> max_capacity;
    std::optional<Duration> default_ttl;
    bool enable_stats{true};
    PolicyOptions policy;
    std::shared_ptr<TimeSource> time_source = default_time_source();
    std::size_t shard_index{0};  ///< only used to label log lines
};

/**
 * @brief Everything needed to construct a cache.
 *
 * A cache copies its configuration at construction; changing a CacheConfig
 * afterwards has no effect on caches already built from it.
 */
struct CacheConfig {
    std::optional<std::size_t> max_capacity;
    bool enable_stats{true};
    std::size_t shards{1};
    std::optional<Duration> default_ttl;
    PolicyKind policy{PolicyKind::Lru};
    std::size_t byte_budget{0};  ///< SizeBased only, split across shards
    std::size_t adaptive_window{32};
    std::optional<std::uint64_t> random_seed;
    std::shared_ptr<TimeSource> time_source = default_time_source();

    /**
     * @brief Checks the combination of settings.
     *
     * NoEviction with a capacity is valid: inserts past it fail per
     * operation instead.
     */
    [[nodiscard]] auto validate() const -> ConfigResult<void>;

    /**
     * @brief The share of this configuration that shard `index` receives.
     *
     * Shard i gets cap / n slots plus one when i < cap % n, so the shard
     * capacities sum to max_capacity. The byte budget is split the same way
     * and a random seed is offset by the shard index.
     */
    [[nodiscard]] auto store_options(std::size_t index) const -> StoreOptions;
};

void to_json(nlohmann::json& json, const CacheConfig& config);

/**
 * @throws stash::error::InvalidConfiguration on an unknown policy name or a
 * document of the wrong shape.
 */
void from_json(const nlohmann::json& json, CacheConfig& config);

/**
 * @brief Non-throwing variant of from_json. The result is not validated.
 */
[[nodiscard]] auto parse_config(const nlohmann::json& json)
    -> ConfigResult<CacheConfig>;

/**
 * @brief Reads and parses a JSON configuration file.
 *
 * An unreadable file or invalid JSON yields ConfigError::MalformedConfig.
 */
[[nodiscard]] auto load_config(const std::filesystem::path& path)
    -> ConfigResult<CacheConfig>;

}  // namespace stash::cache

#endif  // STASH_CACHE_CONFIG_HPP
