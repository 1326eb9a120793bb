#ifndef STASH_CACHE_ENTRY_HPP
#define STASH_CACHE_ENTRY_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "stash/cache/ttl.hpp"

namespace stash::cache {

/**
 * @brief Bookkeeping the eviction policies and the TTL layer decide on.
 *
 * insertion_seq and last_access are drawn from the same per-store counter,
 * so they are unique within a store and never tie.
 */
struct EntryMetadata {
    std::uint64_t insertion_seq{0};   ///< FIFO order
    std::uint64_t last_access{0};     ///< LRU order (logical tick)
    std::uint64_t frequency{1};       ///< LFU order
    std::optional<Timestamp> expires_at;  ///< TTL, empty when immortal
    std::size_t size_bytes{0};        ///< SizeBased budget accounting

    [[nodiscard]] auto is_expired(Timestamp now) const noexcept -> bool {
        return expires_at.has_value() && now >= *expires_at;
    }
};

/**
 * @brief The unit of storage: one key, its value and its metadata.
 *
 * An entry carrying an expiry instant is what the TTL layer calls a TTL
 * entry; there is no separate type for it.
 */
template <typename K, typename V>
struct Entry {
    K key;
    V value;
    EntryMetadata meta;

    Entry(K k, V v, EntryMetadata m)
        : key(std::move(k)), value(std::move(v)), meta(std::move(m)) {}

    [[nodiscard]] auto is_expired(Timestamp now) const noexcept -> bool {
        return meta.is_expired(now);
    }
};

}  // namespace stash::cache

#endif  // STASH_CACHE_ENTRY_HPP
