/*
 * sharded_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: Lock-striped cache built from independently locked stores

**************************************************/

#ifndef STASH_CACHE_SHARDED_CACHE_HPP
#define STASH_CACHE_SHARDED_CACHE_HPP

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "stash/cache/batch.hpp"
#include "stash/cache/config.hpp"
#include "stash/cache/shard.hpp"
#include "stash/cache/stats.hpp"
#include "stash/cache/store.hpp"
#include "stash/error/exception.hpp"

namespace stash::cache {

namespace detail {
/**
 * @brief Boost-style hash mixing, spreads weak hashes such as the identity
 * hash of integers before the modulo.
 */
[[nodiscard]] constexpr auto hash_combine(std::size_t seed,
                                          std::size_t hash) noexcept
    -> std::size_t {
    return seed ^ (hash + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}
}  // namespace detail

/**
 * @brief A cache split into a fixed number of shards, each with its own
 * lock, store, policy and statistics.
 *
 * Operations on one key take exactly one shard lock for their duration and
 * are linearizable per key. Operations spanning the whole cache visit the
 * shards one at a time in index order and never hold two locks, so their
 * result is a union of per-shard snapshots taken at slightly different
 * times.
 *
 * @tparam K Key type, hashed by Hash to pick a shard and ordered by Compare
 * within it
 * @tparam V Value type, copied out by get()
 */
template <typename K, typename V, typename Hash = std::hash<K>,
          typename Compare = std::less<K>>
class ShardedCache {
public:
    using key_type = K;
    using mapped_type = V;
    using shard_type = Shard<K, V, Compare>;
    using store_type = Store<K, V, Compare>;
    using entry_type = Entry<K, V>;
    using insert_result = CacheResult<std::optional<V>>;
    using op_type = Op<K, V>;
    using batch_result = BatchResult<K, V, Compare>;

    /**
     * @throws stash::error::InvalidConfiguration if the configuration does
     * not validate. Use CacheBuilder for a non-throwing construction.
     */
    explicit ShardedCache(CacheConfig config, Sizer<V> sizer = {},
                          Hash hash = Hash{})
        : config_(std::move(config)), hash_(std::move(hash)) {
        if (auto valid = config_.validate(); !valid) {
            THROW_INVALID_CONFIGURATION("Invalid cache configuration: {}",
                                        to_string(valid.error()));
        }
        shards_.reserve(config_.shards);
        for (std::size_t i = 0; i < config_.shards; ++i) {
            shards_.push_back(std::make_unique<shard_type>(
                i, config_.store_options(i), sizer));
        }
        spdlog::info("Created cache: {} shards, {} policy, capacity {}",
                     shards_.size(), to_string(config_.policy),
                     config_.max_capacity
                         ? std::to_string(*config_.max_capacity)
                         : std::string("unbounded"));
    }

    ShardedCache(ShardedCache&&) noexcept = default;
    auto operator=(ShardedCache&&) noexcept -> ShardedCache& = default;

    /**
     * @brief Index of the shard owning `key`. Pure and stable for the
     * lifetime of the cache.
     */
    [[nodiscard]] auto shard_for(const K& key) const -> std::size_t {
        return detail::hash_combine(shards_.size(), hash_(key)) %
               shards_.size();
    }

    auto insert(K key, V value) -> insert_result {
        auto& shard = shard_of(key);
        return shard.with_lock([&](store_type& store) {
            return store.insert(std::move(key), std::move(value));
        });
    }

    auto insert_with_ttl(K key, V value, Duration ttl) -> insert_result {
        auto& shard = shard_of(key);
        return shard.with_lock([&](store_type& store) {
            return store.insert_with_ttl(std::move(key), std::move(value),
                                         ttl);
        });
    }

    /**
     * @brief Copies the value out while the shard lock is held.
     */
    auto get(const K& key) -> std::optional<V> {
        return shard_of(key).with_lock(
            [&](store_type& store) -> std::optional<V> {
                if (const auto* value = store.get(key)) {
                    return *value;
                }
                return std::nullopt;
            });
    }

    /**
     * @brief Runs `func` on the stored value under the shard lock.
     *
     * `func` must not call back into this cache: the shard lock is not
     * recursive, so touching a key of the same shard deadlocks.
     *
     * @return false if the key was absent, in which case `func` is not
     * called.
     */
    template <typename Func>
        requires std::invocable<Func, V&>
    auto get_mut(const K& key, Func&& func) -> bool {
        return shard_of(key).with_lock([&](store_type& store) {
            auto* value = store.get_mut(key);
            if (value == nullptr) {
                return false;
            }
            std::invoke(std::forward<Func>(func), *value);
            return true;
        });
    }

    auto remove(const K& key) -> std::optional<V> {
        return shard_of(key).with_lock(
            [&](store_type& store) { return store.remove(key); });
    }

    [[nodiscard]] auto contains_key(const K& key) const -> bool {
        return shard_of(key).with_lock(
            [&](const store_type& store) { return store.contains_key(key); });
    }

    [[nodiscard]] auto ttl_remaining(const K& key) const
        -> std::optional<Duration> {
        return shard_of(key).with_lock([&](const store_type& store) {
            return store.ttl_remaining(key);
        });
    }

    auto update_ttl(const K& key, Duration ttl) -> bool {
        return shard_of(key).with_lock(
            [&](store_type& store) { return store.update_ttl(key, ttl); });
    }

    [[nodiscard]] auto len() const -> std::size_t {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            total += shard->with_lock(
                [](const store_type& store) { return store.len(); });
        }
        return total;
    }

    [[nodiscard]] auto is_empty() const -> bool {
        return std::ranges::all_of(shards_, [](const auto& shard) {
            return shard->with_lock(
                [](const store_type& store) { return store.is_empty(); });
        });
    }

    void clear() {
        for (auto& shard : shards_) {
            shard->with_lock([](store_type& store) { store.clear(); });
        }
    }

    /**
     * @brief Statistics summed over all shards.
     */
    [[nodiscard]] auto stats() const -> CacheStats {
        CacheStats total;
        for (const auto& shard : shards_) {
            total += shard->with_lock(
                [](const store_type& store) { return store.stats(); });
        }
        return total;
    }

    void reset_stats() {
        for (auto& shard : shards_) {
            shard->with_lock([](store_type& store) { store.reset_stats(); });
        }
    }

    /**
     * @brief Live keys of all shards, sorted by Compare.
     */
    [[nodiscard]] auto keys() const -> std::vector<K> {
        std::vector<K> result;
        for (const auto& shard : shards_) {
            auto part = shard->with_lock(
                [](const store_type& store) { return store.keys(); });
            std::move(part.begin(), part.end(), std::back_inserter(result));
        }
        std::sort(result.begin(), result.end(), Compare{});
        return result;
    }

    /**
     * @brief Live values, in the key order of keys().
     */
    [[nodiscard]] auto values() const -> std::vector<V> {
        auto snapshot = entries();
        std::vector<V> result;
        result.reserve(snapshot.size());
        for (auto& entry : snapshot) {
            result.push_back(std::move(entry.value));
        }
        return result;
    }

    [[nodiscard]] auto entries() const -> std::vector<entry_type> {
        std::vector<entry_type> result;
        for (const auto& shard : shards_) {
            auto part = shard->with_lock(
                [](const store_type& store) { return store.entries(); });
            std::move(part.begin(), part.end(), std::back_inserter(result));
        }
        std::sort(result.begin(), result.end(),
                  [](const entry_type& lhs, const entry_type& rhs) {
                      return Compare{}(lhs.key, rhs.key);
                  });
        return result;
    }

    /**
     * @brief Removes expired entries shard by shard.
     *
     * Entries inserted into a shard after it was swept are left alone.
     */
    auto sweep() -> std::size_t {
        std::size_t removed = 0;
        for (auto& shard : shards_) {
            removed += shard->with_lock(
                [](store_type& store) { return store.sweep(); });
        }
        return removed;
    }

    /**
     * @brief Replaces the contents of every shard with the given entries,
     * each routed to the shard owning its key.
     *
     * @return The number of entries stored afterwards.
     */
    auto load(std::vector<entry_type> entries) -> std::size_t {
        std::vector<std::vector<entry_type>> routed(shards_.size());
        for (auto& entry : entries) {
            auto index = shard_for(entry.key);
            routed[index].push_back(std::move(entry));
        }
        std::size_t stored = 0;
        for (std::size_t i = 0; i < shards_.size(); ++i) {
            stored += shards_[i]->with_lock([&](store_type& store) {
                return store.load(std::move(routed[i]));
            });
        }
        return stored;
    }

    /**
     * @brief Adds the given entries to the current contents, each routed to
     * the shard owning its key. Nothing is cleared first.
     *
     * @return The number of entries accepted.
     */
    auto merge(std::vector<entry_type> entries) -> std::size_t {
        std::vector<std::vector<entry_type>> routed(shards_.size());
        for (auto& entry : entries) {
            auto index = shard_for(entry.key);
            routed[index].push_back(std::move(entry));
        }
        std::size_t accepted = 0;
        for (std::size_t i = 0; i < shards_.size(); ++i) {
            accepted += shards_[i]->with_lock([&](store_type& store) {
                return store.merge(std::move(routed[i]));
            });
        }
        return accepted;
    }

    /**
     * @brief Applies each operation independently, in order.
     *
     * A failing operation does not stop the batch and nothing is rolled
     * back; the report says what happened to every operation.
     */
    auto apply_batch(std::vector<op_type> ops) -> batch_result {
        batch_result result;
        for (auto& op : ops) {
            result.push_back(apply(op));
        }
        return result;
    }

    [[nodiscard]] auto shard_count() const noexcept -> std::size_t {
        return shards_.size();
    }

    /**
     * @throws std::out_of_range if index is not a shard index.
     */
    [[nodiscard]] auto shard_len(std::size_t index) const -> std::size_t {
        return shards_.at(index)->with_lock(
            [](const store_type& store) { return store.len(); });
    }

    /**
     * @throws std::out_of_range if index is not a shard index.
     */
    [[nodiscard]] auto shard_stats(std::size_t index) const -> CacheStats {
        return shards_.at(index)->with_lock(
            [](const store_type& store) { return store.stats(); });
    }

    [[nodiscard]] auto config() const noexcept -> const CacheConfig& {
        return config_;
    }

    [[nodiscard]] auto policy_kind() const noexcept -> PolicyKind {
        return config_.policy;
    }

    [[nodiscard]] auto time_source() const noexcept
        -> const std::shared_ptr<TimeSource>& {
        return config_.time_source;
    }

    [[nodiscard]] auto max_capacity() const noexcept
        -> std::optional<std::size_t> {
        return config_.max_capacity;
    }

private:
    [[nodiscard]] auto shard_of(const K& key) -> shard_type& {
        return *shards_[shard_for(key)];
    }

    [[nodiscard]] auto shard_of(const K& key) const -> const shard_type& {
        return *shards_[shard_for(key)];
    }

    auto apply(op_type& op) -> OpOutcome<K, V> {
        auto kind = op.kind();
        return std::visit(
            [&](auto& concrete) -> OpOutcome<K, V> {
                using T = std::decay_t<decltype(concrete)>;
                if constexpr (std::is_same_v<T, InsertOp<K, V>>) {
                    auto key = concrete.key;
                    auto inserted =
                        concrete.ttl
                            ? insert_with_ttl(std::move(concrete.key),
                                              std::move(concrete.value),
                                              *concrete.ttl)
                            : insert(std::move(concrete.key),
                                     std::move(concrete.value));
                    if (!inserted) {
                        return {std::move(key), kind,
                                OpStatus::CapacityExceeded, std::nullopt};
                    }
                    return {std::move(key), kind, OpStatus::Ok,
                            std::move(inserted).value()};
                } else if constexpr (std::is_same_v<T, RemoveOp<K>>) {
                    auto removed = remove(concrete.key);
                    auto status =
                        removed ? OpStatus::Ok : OpStatus::NotFound;
                    return {std::move(concrete.key), kind, status,
                            std::move(removed)};
                } else {
                    auto value = get(concrete.key);
                    auto status = value ? OpStatus::Ok : OpStatus::NotFound;
                    return {std::move(concrete.key), kind, status,
                            std::move(value)};
                }
            },
            op.variant());
    }

    CacheConfig config_;
    Hash hash_;
    std::vector<std::unique_ptr<shard_type>> shards_;
};

}  // namespace stash::cache

#endif  // STASH_CACHE_SHARDED_CACHE_HPP
