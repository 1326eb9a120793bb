/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: Cache configuration, its validation and JSON form

**************************************************/

#include "config.hpp"

#include <cstdint>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "stash/error/exception.hpp"

using json = nlohmann::json;

namespace stash::cache {

auto CacheConfig::validate() const -> ConfigResult<void> {
    if (shards == 0) {
        return type::make_unexpected(ConfigError::ZeroShards);
    }
    if (max_capacity) {
        if (*max_capacity == 0) {
            return type::make_unexpected(ConfigError::ZeroCapacity);
        }
        if (*max_capacity < shards) {
            return type::make_unexpected(ConfigError::CapacityBelowShards);
        }
    }
    if (default_ttl && default_ttl->count() <= 0) {
        return type::make_unexpected(ConfigError::ZeroTtl);
    }
    if (policy == PolicyKind::SizeBased && byte_budget < shards) {
        return type::make_unexpected(ConfigError::MissingByteBudget);
    }
    if (policy == PolicyKind::Adaptive && adaptive_window == 0) {
        return type::make_unexpected(ConfigError::ZeroAdaptiveWindow);
    }
    if (!time_source) {
        return type::make_unexpected(ConfigError::MissingTimeSource);
    }
    return {};
}

namespace {
auto split_evenly(std::size_t total, std::size_t parts, std::size_t index)
    -> std::size_t {
    return total / parts + (index < total % parts ? 1 : 0);
}

// nlohmann converts -1 to SIZE_MAX without complaint; counts must be
// non-negative integers.
auto is_count(const json& value) -> bool {
    if (value.is_number_unsigned()) {
        return true;
    }
    return value.is_number_integer() && value.get<std::int64_t>() >= 0;
}

// Leaves `out` untouched when the field is absent.
template <typename T>
auto read_count(const json& j, const char* name, T& out) -> bool {
    auto it = j.find(name);
    if (it == j.end()) {
        return true;
    }
    if (!is_count(*it)) {
        spdlog::error("Cache configuration field {} must be a non-negative "
                      "integer, got {}",
                      name, it->dump());
        return false;
    }
    out = it->get<T>();
    return true;
}
}  // namespace

auto CacheConfig::store_options(std::size_t index) const -> StoreOptions {
    auto parts = shards == 0 ? 1 : shards;
    StoreOptions options;
    if (max_capacity) {
        options.max_capacity = split_evenly(*max_capacity, parts, index);
    }
    options.default_ttl = default_ttl;
    options.enable_stats = enable_stats;
    options.policy.kind = policy;
    options.policy.byte_budget = split_evenly(byte_budget, parts, index);
    options.policy.adaptive_window = adaptive_window;
    if (random_seed) {
        options.policy.random_seed = *random_seed + index;
    }
    options.time_source = time_source;
    options.shard_index = index;
    return options;
}

void to_json(json& j, const CacheConfig& config) {
    j = json{{"enable_stats", config.enable_stats},
             {"shards", config.shards},
             {"policy", std::string(to_string(config.policy))},
             {"byte_budget", config.byte_budget},
             {"adaptive_window", config.adaptive_window}};
    j["max_capacity"] =
        config.max_capacity ? json(*config.max_capacity) : json(nullptr);
    j["default_ttl_ms"] = config.default_ttl
                              ? json(config.default_ttl->count())
                              : json(nullptr);
    j["random_seed"] =
        config.random_seed ? json(*config.random_seed) : json(nullptr);
}

auto parse_config(const json& j) -> ConfigResult<CacheConfig> {
    if (!j.is_object()) {
        return type::make_unexpected(ConfigError::MalformedConfig);
    }
    CacheConfig config;
    try {
        if (auto it = j.find("max_capacity"); it != j.end() && !it->is_null()) {
            std::size_t capacity = 0;
            if (!read_count(j, "max_capacity", capacity)) {
                return type::make_unexpected(ConfigError::MalformedConfig);
            }
            config.max_capacity = capacity;
        }
        config.enable_stats = j.value("enable_stats", config.enable_stats);
        if (!read_count(j, "shards", config.shards)) {
            return type::make_unexpected(ConfigError::MalformedConfig);
        }
        if (auto it = j.find("default_ttl_ms");
            it != j.end() && !it->is_null()) {
            config.default_ttl = Duration(it->get<Duration::rep>());
        }
        if (auto it = j.find("policy"); it != j.end()) {
            auto kind = policy_from_string(it->get<std::string>());
            if (!kind) {
                return type::make_unexpected(ConfigError::UnknownPolicy);
            }
            config.policy = *kind;
        }
        if (!read_count(j, "byte_budget", config.byte_budget) ||
            !read_count(j, "adaptive_window", config.adaptive_window)) {
            return type::make_unexpected(ConfigError::MalformedConfig);
        }
        if (auto it = j.find("random_seed"); it != j.end() && !it->is_null()) {
            std::uint64_t seed = 0;
            if (!read_count(j, "random_seed", seed)) {
                return type::make_unexpected(ConfigError::MalformedConfig);
            }
            config.random_seed = seed;
        }
    } catch (const json::exception& e) {
        spdlog::error("Malformed cache configuration: {}", e.what());
        return type::make_unexpected(ConfigError::MalformedConfig);
    }
    return config;
}

void from_json(const json& j, CacheConfig& config) {
    auto parsed = parse_config(j);
    if (!parsed) {
        THROW_INVALID_CONFIGURATION("Cannot read cache configuration: {}",
                                    to_string(parsed.error()));
    }
    config = std::move(parsed).value();
}

auto load_config(const std::filesystem::path& path)
    -> ConfigResult<CacheConfig> {
    std::ifstream inputFile(path);
    if (!inputFile.is_open()) {
        spdlog::error("Failed to open cache configuration: {}", path.string());
        return type::make_unexpected(ConfigError::MalformedConfig);
    }
    json document;
    try {
        inputFile >> document;
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse cache configuration {}: {}",
                      path.string(), e.what());
        return type::make_unexpected(ConfigError::MalformedConfig);
    }
    auto config = parse_config(document);
    if (!config) {
        spdlog::error("Invalid cache configuration {}: {}", path.string(),
                      to_string(config.error()));
    }
    return config;
}

}  // namespace stash::cache
