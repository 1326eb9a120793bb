#ifndef STASH_CACHE_STATS_HPP
#define STASH_CACHE_STATS_HPP

#include <cstdint>

namespace stash::cache {

/**
 * @brief Monotonic counters of one store, or the sum over several shards.
 *
 * evictions counts every entry the cache removed on its own, expired ones
 * included; expirations is the expired subset of it.
 */
struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t insertions{0};
    std::uint64_t evictions{0};
    std::uint64_t expirations{0};

    [[nodiscard]] constexpr auto lookups() const noexcept -> std::uint64_t {
        return hits + misses;
    }

    [[nodiscard]] constexpr auto capacity_evictions() const noexcept
        -> std::uint64_t {
        return evictions - expirations;
    }

    /**
     * @brief Fraction of lookups that hit, 0.0 before the first lookup.
     */
    [[nodiscard]] constexpr auto hit_rate() const noexcept -> double {
        auto total = lookups();
        return total == 0 ? 0.0
                          : static_cast<double>(hits) /
                                static_cast<double>(total);
    }

    [[nodiscard]] constexpr auto miss_rate() const noexcept -> double {
        auto total = lookups();
        return total == 0 ? 0.0
                          : static_cast<double>(misses) /
                                static_cast<double>(total);
    }

    constexpr auto operator+=(const CacheStats& other) noexcept
        -> CacheStats& {
        hits += other.hits;
        misses += other.misses;
        insertions += other.insertions;
        evictions += other.evictions;
        expirations += other.expirations;
        return *this;
    }

    constexpr void reset() noexcept { *this = CacheStats{}; }

    constexpr auto operator==(const CacheStats&) const -> bool = default;
};

[[nodiscard]] constexpr auto operator+(CacheStats lhs,
                                       const CacheStats& rhs) noexcept
    -> CacheStats {
    lhs += rhs;
    return lhs;
}

}  // namespace stash::cache

#endif  // STASH_CACHE_STATS_HPP
