/*
 * store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: Single-threaded key/value store with pluggable eviction and
             optional expiry

**************************************************/

#ifndef STASH_CACHE_STORE_HPP
#define STASH_CACHE_STORE_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "stash/cache/config.hpp"
#include "stash/cache/entry.hpp"
#include "stash/cache/error.hpp"
#include "stash/cache/eviction.hpp"
#include "stash/cache/stats.hpp"
#include "stash/cache/ttl.hpp"
#include "stash/macro.hpp"

namespace stash::cache {

template <typename V>
using Sizer = std::function<std::size_t(const V&)>;

/**
 * @brief Footprint used when no sizer is configured: sizeof(V), plus the
 * payload of contiguous ranges such as strings and vectors.
 */
template <typename V>
[[nodiscard]] auto estimate_size(const V& value) -> std::size_t {
    if constexpr (std::ranges::sized_range<V> &&
                  std::ranges::contiguous_range<V>) {
        return sizeof(V) +
               std::ranges::size(value) * sizeof(std::ranges::range_value_t<V>);
    } else {
        return sizeof(V);
    }
}

/**
 * @brief A key-sorted map of entries governed by one eviction policy.
 *
 * The store is not synchronised; ShardedCache puts one behind each shard
 * lock. The entry count never exceeds max_capacity, not even transiently:
 * room is made before an entry is added, and an insertion that cannot get
 * room fails with CacheError::CapacityExceeded without touching any entry.
 *
 * Expired entries are reclaimed lazily by the operation that finds them
 * and eagerly by sweep(). Either way the removal counts as an eviction and
 * as an expiration.
 *
 * @tparam K Key type, ordered by Compare
 * @tparam V Value type
 */
template <typename K, typename V, typename Compare = std::less<K>>
class Store {
public:
    using key_type = K;
    using mapped_type = V;
    using entry_type = Entry<K, V>;
    using insert_result = CacheResult<std::optional<V>>;

    explicit Store(StoreOptions options, Sizer<V> sizer = {})
        : options_(std::move(options)),
          policy_(EvictionPolicy<K, Compare>::make(options_.policy)),
          sizer_(std::move(sizer)) {
        if (!options_.time_source) {
            options_.time_source = default_time_source();
        }
    }

    /**
     * @brief Inserts or replaces a value, applying the default TTL if any.
     *
     * @return The previous value when the key was present.
     */
    auto insert(K key, V value) -> insert_result {
        std::optional<Timestamp> expiresAt;
        if (options_.default_ttl) {
            expiresAt = now().plus(*options_.default_ttl);
        }
        return insert_at(std::move(key), std::move(value), expiresAt);
    }

    /**
     * @brief Like insert(), with an explicit time to live. A non-positive
     * ttl makes the entry expire immediately.
     */
    auto insert_with_ttl(K key, V value, Duration ttl) -> insert_result {
        return insert_at(std::move(key), std::move(value), now().plus(ttl));
    }

    /**
     * @brief Looks up a value, counting a hit or a miss.
     *
     * The pointer stays valid until the next mutating call on this store.
     */
    auto get(const K& key) -> const V* {
        auto* entry = lookup(key);
        return entry != nullptr ? &entry->value : nullptr;
    }

    auto get_mut(const K& key) -> V* {
        auto* entry = lookup(key);
        return entry != nullptr ? &entry->value : nullptr;
    }

    auto remove(const K& key) -> std::optional<V> {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (expired(it->second)) {
            expire(it);
            return std::nullopt;
        }
        policy_.on_remove(it->first, it->second.meta);
        auto value = std::move(it->second.value);
        entries_.erase(it);
        return value;
    }

    /**
     * @brief Presence test that neither counts a lookup nor refreshes
     * recency.
     */
    [[nodiscard]] auto contains_key(const K& key) const -> bool {
        auto it = entries_.find(key);
        return it != entries_.end() && !expired(it->second);
    }

    /**
     * @brief Number of stored entries, including expired ones that have not
     * been reclaimed yet.
     */
    [[nodiscard]] auto len() const noexcept -> std::size_t {
        return entries_.size();
    }

    [[nodiscard]] auto is_empty() const noexcept -> bool {
        return entries_.empty();
    }

    /**
     * @brief Drops every entry. Statistics are kept.
     */
    void clear() {
        entries_.clear();
        policy_.clear();
    }

    /**
     * @brief Removes every entry that is expired at the moment it is
     * checked.
     *
     * @return The number of entries removed.
     */
    auto sweep() -> std::size_t {
        std::vector<K> candidates;
        candidates.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            if (entry.meta.expires_at) {
                candidates.push_back(key);
            }
        }
        std::size_t removed = 0;
        for (const auto& key : candidates) {
            auto it = entries_.find(key);
            if (it != entries_.end() && expired(it->second)) {
                expire(it);
                ++removed;
            }
        }
        if (removed > 0) {
            spdlog::info("Shard {}: sweep removed {} expired entries",
                         options_.shard_index, removed);
        }
        return removed;
    }

    [[nodiscard]] auto keys() const -> std::vector<K> {
        std::vector<K> result;
        result.reserve(entries_.size());
        auto current = now();
        for (const auto& [key, entry] : entries_) {
            if (!entry.is_expired(current)) {
                result.push_back(key);
            }
        }
        return result;
    }

    [[nodiscard]] auto values() const -> std::vector<V> {
        std::vector<V> result;
        result.reserve(entries_.size());
        auto current = now();
        for (const auto& [key, entry] : entries_) {
            if (!entry.is_expired(current)) {
                result.push_back(entry.value);
            }
        }
        return result;
    }

    /**
     * @brief Live entries in key order, metadata included. This is the
     * export half of load().
     */
    [[nodiscard]] auto entries() const -> std::vector<entry_type> {
        std::vector<entry_type> result;
        result.reserve(entries_.size());
        auto current = now();
        for (const auto& [key, entry] : entries_) {
            if (!entry.is_expired(current)) {
                result.push_back(entry);
            }
        }
        return result;
    }

    /**
     * @brief Replaces the contents with the given entries.
     *
     * Entries go through the normal insertion path in order, keeping their
     * expiry instant; insertion order, recency and frequency start afresh.
     * Entries already expired, or rejected for capacity, are skipped.
     *
     * @return The number of entries stored afterwards.
     */
    auto load(std::vector<entry_type> entries) -> std::size_t {
        clear();
        import_entries(std::move(entries), "load");
        return entries_.size();
    }

    /**
     * @brief Inserts the given entries on top of the current contents.
     *
     * Same path as load() without the clear: incoming values replace
     * existing ones for the same key, and may evict under the active
     * policy. Expired and rejected entries are skipped.
     *
     * @return The number of entries accepted.
     */
    auto merge(std::vector<entry_type> entries) -> std::size_t {
        return import_entries(std::move(entries), "merge");
    }

    [[nodiscard]] auto stats() const noexcept -> CacheStats { return stats_; }

    void reset_stats() noexcept { stats_.reset(); }

    /**
     * @brief Time left before the entry expires.
     *
     * @return Empty when the key is absent or the entry never expires.
     */
    [[nodiscard]] auto ttl_remaining(const K& key) const
        -> std::optional<Duration> {
        auto it = entries_.find(key);
        if (it == entries_.end() || !it->second.meta.expires_at) {
            return std::nullopt;
        }
        auto current = now();
        if (it->second.is_expired(current)) {
            return std::nullopt;
        }
        return it->second.meta.expires_at->remaining_from(current);
    }

    /**
     * @brief Restarts the entry's time to live from now.
     *
     * @return false if the key is absent or already expired.
     */
    auto update_ttl(const K& key, Duration ttl) -> bool {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        if (expired(it->second)) {
            expire(it);
            return false;
        }
        policy_.on_remove(it->first, it->second.meta);
        it->second.meta.expires_at = now().plus(ttl);
        policy_.on_insert(it->first, it->second.meta);
        return true;
    }

    [[nodiscard]] auto policy_kind() const noexcept -> PolicyKind {
        return policy_.kind();
    }

    [[nodiscard]] auto policy() const noexcept
        -> const EvictionPolicy<K, Compare>& {
        return policy_;
    }

    [[nodiscard]] auto max_capacity() const noexcept
        -> std::optional<std::size_t> {
        return options_.max_capacity;
    }

    [[nodiscard]] auto options() const noexcept -> const StoreOptions& {
        return options_;
    }

    [[nodiscard]] auto time_source() const noexcept
        -> const std::shared_ptr<TimeSource>& {
        return options_.time_source;
    }

private:
    using map_type = std::map<K, entry_type, Compare>;
    using iterator = typename map_type::iterator;

    [[nodiscard]] auto now() const -> Timestamp {
        return options_.time_source->now();
    }

    [[nodiscard]] auto expired(const entry_type& entry) const -> bool {
        return entry.meta.expires_at && entry.is_expired(now());
    }

    auto next_tick() noexcept -> std::uint64_t { return ++tick_; }

    [[nodiscard]] auto size_of(const V& value) const -> std::size_t {
        return sizer_ ? sizer_(value) : estimate_size(value);
    }

    [[nodiscard]] auto at_capacity() const noexcept -> bool {
        return options_.max_capacity &&
               entries_.size() >= *options_.max_capacity;
    }

    auto insert_at(K key, V value, std::optional<Timestamp> expiresAt)
        -> insert_result {
        auto bytes = size_of(value);
        auto it = entries_.find(key);
        if (it != entries_.end() && expired(it->second)) {
            expire(it);
            it = entries_.end();
        }

        if (it != entries_.end()) {
            return replace(it, std::move(value), expiresAt, bytes);
        }

        if (STASH_UNLIKELY(!make_room(bytes, true))) {
            return reject();
        }
        EntryMetadata meta;
        meta.insertion_seq = next_tick();
        meta.last_access = meta.insertion_seq;
        meta.expires_at = expiresAt;
        meta.size_bytes = bytes;
        auto pos =
            entries_.try_emplace(key, key, std::move(value), meta).first;
        policy_.on_insert(pos->first, pos->second.meta);
        record_insertion();
        return std::optional<V>{};
    }

    // The entry is detached from the policy while room is made, so it can
    // never pick itself. It keeps its FIFO position.
    auto replace(iterator it, V value, std::optional<Timestamp> expiresAt,
                 std::size_t bytes) -> insert_result {
        auto& entry = it->second;
        auto updated = entry.meta;
        updated.expires_at = expiresAt;
        updated.size_bytes = bytes;
        if (policy_.tracks_access()) {
            updated.last_access = next_tick();
            ++updated.frequency;
        }

        policy_.on_remove(it->first, entry.meta);
        if (STASH_UNLIKELY(!make_room(bytes, false))) {
            policy_.on_insert(it->first, entry.meta);
            return reject();
        }
        entry.meta = updated;
        policy_.on_insert(it->first, entry.meta);
        auto previous = std::exchange(entry.value, std::move(value));
        record_insertion();
        return std::optional<V>{std::move(previous)};
    }

    auto make_room(std::size_t bytes, bool addsEntry) -> bool {
        if (!policy_.admits(bytes)) {
            return false;
        }
        while ((addsEntry && at_capacity()) || policy_.over_budget(bytes)) {
            auto victim = policy_.select_victim(now());
            if (!victim) {
                return false;
            }
            auto it = entries_.find(*victim);
            if (it == entries_.end()) {
                return false;
            }
            evict(it);
        }
        return true;
    }

    auto import_entries(std::vector<entry_type> entries,
                        std::string_view operation) -> std::size_t {
        std::size_t accepted = 0;
        auto current = now();
        for (auto& entry : entries) {
            if (entry.is_expired(current)) {
                spdlog::debug("Shard {}: skipped expired entry during {}",
                              options_.shard_index, operation);
                continue;
            }
            auto result = insert_at(std::move(entry.key),
                                    std::move(entry.value),
                                    entry.meta.expires_at);
            if (!result) {
                spdlog::warn("Shard {}: skipped entry during {}: {}",
                             options_.shard_index, operation,
                             to_string(result.error()));
                continue;
            }
            ++accepted;
        }
        return accepted;
    }

    auto reject() -> insert_result {
        spdlog::warn("Shard {}: insertion rejected under {} policy: {}",
                     options_.shard_index, to_string(policy_.kind()),
                     to_string(CacheError::CapacityExceeded));
        return type::make_unexpected(CacheError::CapacityExceeded);
    }

    void evict(iterator it) {
        if (expired(it->second)) {
            expire(it);
            return;
        }
        spdlog::debug("Shard {}: evicted entry under {} policy",
                      options_.shard_index, to_string(policy_.kind()));
        policy_.on_evict(it->first, it->second.meta);
        entries_.erase(it);
        if (options_.enable_stats) {
            ++stats_.evictions;
        }
    }

    void expire(iterator it) {
        spdlog::debug("Shard {}: reclaimed expired entry",
                      options_.shard_index);
        policy_.on_remove(it->first, it->second.meta);
        entries_.erase(it);
        if (options_.enable_stats) {
            ++stats_.evictions;
            ++stats_.expirations;
        }
    }

    auto lookup(const K& key) -> entry_type* {
        auto it = entries_.find(key);
        if (it != entries_.end() && expired(it->second)) {
            expire(it);
            it = entries_.end();
        }
        if (it == entries_.end()) {
            policy_.on_miss(key);
            if (options_.enable_stats) {
                ++stats_.misses;
            }
            return nullptr;
        }
        auto& entry = it->second;
        if (policy_.tracks_access()) {
            entry.meta.last_access = next_tick();
            ++entry.meta.frequency;
            policy_.on_access(it->first, entry.meta);
        }
        if (options_.enable_stats) {
            ++stats_.hits;
        }
        return &entry;
    }

    void record_insertion() noexcept {
        if (options_.enable_stats) {
            ++stats_.insertions;
        }
    }

    StoreOptions options_;
    EvictionPolicy<K, Compare> policy_;
    Sizer<V> sizer_;
    map_type entries_;
    CacheStats stats_;
    std::uint64_t tick_{0};
};

}  // namespace stash::cache

#endif  // STASH_CACHE_STORE_HPP
