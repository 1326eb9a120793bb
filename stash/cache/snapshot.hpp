/*
 * snapshot.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: JSON export and import of cache contents

**************************************************/

#ifndef STASH_CACHE_SNAPSHOT_HPP
#define STASH_CACHE_SNAPSHOT_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "stash/cache/entry.hpp"
#include "stash/cache/ttl.hpp"
#include "stash/error/exception.hpp"

namespace stash::cache {

using json = nlohmann::json;

inline constexpr int kSnapshotVersion = 1;

/**
 * @brief Serialises the live entries of a cache.
 *
 * Works on anything exposing entries() and time_source(): Store,
 * ShardedCache and SharedCache. Expiry is written as the remaining time to
 * live, so a snapshot can be restored into a cache running on another
 * clock. Keys and values need nlohmann serializers.
 *
 * @code
 * {"version": 1,
 *  "entries": [{"key": "a", "value": 1, "ttl_ms": null}, ...]}
 * @endcode
 */
template <typename Cache>
[[nodiscard]] auto to_json_snapshot(const Cache& cache) -> json {
    auto now = cache.time_source()->now();
    json entries = json::array();
    for (const auto& entry : cache.entries()) {
        json item{{"key", entry.key}, {"value", entry.value}};
        if (entry.meta.expires_at) {
            item["ttl_ms"] = entry.meta.expires_at->remaining_from(now).count();
        } else {
            item["ttl_ms"] = nullptr;
        }
        entries.push_back(std::move(item));
    }
    return json{{"version", kSnapshotVersion}, {"entries", std::move(entries)}};
}

/**
 * @brief Replaces the contents of `cache` with a snapshot.
 *
 * @return The number of entries stored.
 * @throws stash::error::SnapshotError if the document is not a snapshot or
 * an entry cannot be converted to the cache's key or value type.
 */
template <typename Cache>
auto restore_json_snapshot(Cache& cache, const json& snapshot) -> std::size_t {
    using entry_type = typename Cache::entry_type;
    using key_type = decltype(std::declval<entry_type>().key);
    using value_type = decltype(std::declval<entry_type>().value);

    if (!snapshot.is_object() || !snapshot.contains("entries") ||
        !snapshot["entries"].is_array()) {
        spdlog::error("Cache snapshot has no entries array");
        THROW_SNAPSHOT_ERROR("Cache snapshot has no entries array");
    }
    if (auto version = snapshot.find("version");
        version != snapshot.end() &&
        (!version->is_number_integer() ||
         version->get<std::int64_t>() != kSnapshotVersion)) {
        spdlog::error("Unsupported cache snapshot version {}",
                      version->dump());
        THROW_SNAPSHOT_ERROR("Unsupported cache snapshot version {}",
                             version->dump());
    }

    auto now = cache.time_source()->now();
    std::vector<entry_type> entries;
    entries.reserve(snapshot["entries"].size());
    try {
        for (const auto& item : snapshot["entries"]) {
            EntryMetadata meta;
            if (auto ttl = item.find("ttl_ms");
                ttl != item.end() && !ttl->is_null()) {
                meta.expires_at = now.plus(Duration(ttl->get<Duration::rep>()));
            }
            entries.emplace_back(item.at("key").get<key_type>(),
                                 item.at("value").get<value_type>(), meta);
        }
    } catch (const json::exception& e) {
        spdlog::error("Malformed cache snapshot entry: {}", e.what());
        THROW_SNAPSHOT_ERROR("Malformed cache snapshot entry: {}", e.what());
    }
    return cache.load(std::move(entries));
}

/**
 * @throws stash::error::SnapshotError if the file cannot be written.
 */
template <typename Cache>
void save_snapshot(const Cache& cache, const std::filesystem::path& path) {
    std::ofstream outputFile(path);
    if (!outputFile.is_open()) {
        spdlog::error("Failed to open snapshot file for writing: {}",
                      path.string());
        THROW_SNAPSHOT_ERROR("Failed to open snapshot file for writing: {}",
                             path.string());
    }
    try {
        outputFile << to_json_snapshot(cache).dump(4);
    } catch (const json::exception& e) {
        spdlog::error("Serialization of cache snapshot failed: {}", e.what());
        THROW_SNAPSHOT_ERROR("Serialization of cache snapshot failed: {}",
                             e.what());
    }
    if (!outputFile) {
        spdlog::error("Error writing snapshot file {}", path.string());
        THROW_SNAPSHOT_ERROR("Error writing snapshot file {}", path.string());
    }
}

/**
 * @return The number of entries stored.
 * @throws stash::error::SnapshotError if the file cannot be read or is not
 * a valid snapshot.
 */
template <typename Cache>
auto load_snapshot(Cache& cache, const std::filesystem::path& path)
    -> std::size_t {
    std::ifstream inputFile(path);
    if (!inputFile.is_open()) {
        spdlog::error("Failed to open snapshot file for reading: {}",
                      path.string());
        THROW_SNAPSHOT_ERROR("Failed to open snapshot file for reading: {}",
                             path.string());
    }
    json snapshot;
    try {
        inputFile >> snapshot;
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse snapshot file {}: {}", path.string(),
                      e.what());
        THROW_SNAPSHOT_ERROR("Failed to parse snapshot file {}: {}",
                             path.string(), e.what());
    }
    return restore_json_snapshot(cache, snapshot);
}

}  // namespace stash::cache

#endif  // STASH_CACHE_SNAPSHOT_HPP
