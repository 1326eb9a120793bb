#ifndef STASH_CACHE_EVICTION_HPP
#define STASH_CACHE_EVICTION_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "stash/cache/entry.hpp"
#include "stash/cache/ttl.hpp"

namespace stash::cache {

/**
 * @brief The closed set of eviction strategies.
 */
enum class PolicyKind {
    None,
    Fifo,
    Lru,
    Lfu,
    TtlLru,
    TtlLfu,
    SizeBased,
    Adaptive,
    Random
};

[[nodiscard]] auto to_string(PolicyKind kind) noexcept -> std::string_view;
[[nodiscard]] auto policy_from_string(std::string_view name) noexcept
    -> std::optional<PolicyKind>;

/**
 * @brief Parameters needed to instantiate one shard's policy.
 */
struct PolicyOptions {
    PolicyKind kind{PolicyKind::Lru};
    std::size_t byte_budget{0};
    std::size_t adaptive_window{32};
    std::optional<std::uint64_t> random_seed;
};

namespace detail {

/**
 * @brief Keys ordered by a per-key rank; the smallest rank is the victim.
 *
 * Ranks always end with the insertion sequence number, so two keys never
 * share a rank.
 */
template <typename K, typename Rank, typename Compare>
class RankedIndex {
public:
    void upsert(const K& key, Rank rank) {
        auto it = ranks_.find(key);
        if (it != ranks_.end()) {
            order_.erase({it->second, key});
            it->second = rank;
        } else {
            ranks_.emplace(key, rank);
        }
        order_.emplace(std::move(rank), key);
    }

    void erase(const K& key) {
        auto it = ranks_.find(key);
        if (it == ranks_.end()) {
            return;
        }
        order_.erase({it->second, key});
        ranks_.erase(it);
    }

    [[nodiscard]] auto front() const -> std::optional<K> {
        if (order_.empty()) {
            return std::nullopt;
        }
        return order_.begin()->second;
    }

    [[nodiscard]] auto front_rank() const -> std::optional<Rank> {
        if (order_.empty()) {
            return std::nullopt;
        }
        return order_.begin()->first;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return ranks_.size();
    }

    void clear() noexcept {
        order_.clear();
        ranks_.clear();
    }

private:
    struct OrderLess {
        bool operator()(const std::pair<Rank, K>& lhs,
                        const std::pair<Rank, K>& rhs) const {
            if (lhs.first < rhs.first) {
                return true;
            }
            if (rhs.first < lhs.first) {
                return false;
            }
            return Compare{}(lhs.second, rhs.second);
        }
    };

    std::map<K, Rank, Compare> ranks_;
    std::set<std::pair<Rank, K>, OrderLess> order_;
};

template <typename K, typename Compare>
[[nodiscard]] auto keys_equal(const K& lhs, const K& rhs) -> bool {
    Compare cmp{};
    return !cmp(lhs, rhs) && !cmp(rhs, lhs);
}

using RecencyRank = std::pair<std::uint64_t, std::uint64_t>;
using FrequencyRank = std::tuple<std::uint64_t, std::uint64_t, std::uint64_t>;
using ExpiryRank = std::pair<std::uint64_t, std::uint64_t>;
using SizeRank = std::pair<std::size_t, std::uint64_t>;

inline auto recency_rank(const EntryMetadata& meta) -> RecencyRank {
    return {meta.last_access, meta.insertion_seq};
}

inline auto frequency_rank(const EntryMetadata& meta) -> FrequencyRank {
    return {meta.frequency, meta.last_access, meta.insertion_seq};
}

// Largest entry first: invert the size so the smallest rank is the biggest.
inline auto size_rank(const EntryMetadata& meta) -> SizeRank {
    return {std::numeric_limits<std::size_t>::max() - meta.size_bytes,
            meta.insertion_seq};
}

/**
 * @brief No-op hooks shared by every policy; policies hide the ones they
 * care about.
 */
template <typename K>
struct PolicyHooks {
    static constexpr bool kTracksAccess = false;

    void on_access(const K& /*key*/, const EntryMetadata& /*meta*/) {}
    void on_miss(const K& /*key*/) {}
    [[nodiscard]] auto over_budget(std::size_t /*incoming*/) const -> bool {
        return false;
    }
    [[nodiscard]] auto admits(std::size_t /*incoming*/) const -> bool {
        return true;
    }
};

}  // namespace detail

/**
 * @brief Never selects a victim; inserts beyond capacity fail.
 */
template <typename K, typename Compare = std::less<K>>
class NoEviction : public detail::PolicyHooks<K> {
public:
    static constexpr PolicyKind kKind = PolicyKind::None;

    void on_insert(const K& /*key*/, const EntryMetadata& /*meta*/) {}
    void on_remove(const K& /*key*/, const EntryMetadata& /*meta*/) {}
    void on_evict(const K& /*key*/, const EntryMetadata& /*meta*/) {}
    [[nodiscard]] auto select_victim(Timestamp /*now*/) -> std::optional<K> {
        return std::nullopt;
    }
    void clear() {}
};

/**
 * @brief Evicts the entry inserted first. Reads are ignored.
 */
template <typename K, typename Compare = std::less<K>>
class FifoPolicy : public detail::PolicyHooks<K> {
public:
    static constexpr PolicyKind kKind = PolicyKind::Fifo;

    void on_insert(const K& key, const EntryMetadata& meta) {
        index_.upsert(key, meta.insertion_seq);
    }
    void on_remove(const K& key, const EntryMetadata& /*meta*/) {
        index_.erase(key);
    }
    void on_evict(const K& key, const EntryMetadata& meta) {
        on_remove(key, meta);
    }
    [[nodiscard]] auto select_victim(Timestamp /*now*/) -> std::optional<K> {
        return index_.front();
    }
    void clear() { index_.clear(); }

private:
    detail::RankedIndex<K, std::uint64_t, Compare> index_;
};

/**
 * @brief Evicts the least recently used entry; ties go to the older
 * insertion.
 */
template <typename K, typename Compare = std::less<K>>
class LruPolicy : public detail::PolicyHooks<K> {
public:
    static constexpr PolicyKind kKind = PolicyKind::Lru;
    static constexpr bool kTracksAccess = true;

    void on_insert(const K& key, const EntryMetadata& meta) {
        index_.upsert(key, detail::recency_rank(meta));
    }
    void on_access(const K& key, const EntryMetadata& meta) {
        index_.upsert(key, detail::recency_rank(meta));
    }
    void on_remove(const K& key, const EntryMetadata& /*meta*/) {
        index_.erase(key);
    }
    void on_evict(const K& key, const EntryMetadata& meta) {
        on_remove(key, meta);
    }
    [[nodiscard]] auto select_victim(Timestamp /*now*/) -> std::optional<K> {
        return index_.front();
    }
    void clear() { index_.clear(); }

private:
    detail::RankedIndex<K, detail::RecencyRank, Compare> index_;
};

/**
 * @brief Evicts the least frequently used entry; ties go to the least
 * recently used one.
 */
template <typename K, typename Compare = std::less<K>>
class LfuPolicy : public detail::PolicyHooks<K> {
public:
    static constexpr PolicyKind kKind = PolicyKind::Lfu;
    static constexpr bool kTracksAccess = true;

    void on_insert(const K& key, const EntryMetadata& meta) {
        index_.upsert(key, detail::frequency_rank(meta));
    }
    void on_access(const K& key, const EntryMetadata& meta) {
        index_.upsert(key, detail::frequency_rank(meta));
    }
    void on_remove(const K& key, const EntryMetadata& /*meta*/) {
        index_.erase(key);
    }
    void on_evict(const K& key, const EntryMetadata& meta) {
        on_remove(key, meta);
    }
    [[nodiscard]] auto select_victim(Timestamp /*now*/) -> std::optional<K> {
        return index_.front();
    }
    void clear() { index_.clear(); }

private:
    detail::RankedIndex<K, detail::FrequencyRank, Compare> index_;
};

/**
 * @brief Wraps LRU or LFU so that an already expired entry is always the
 * first victim, earliest expiry first.
 */
template <typename Base, PolicyKind Kind, typename K,
          typename Compare = std::less<K>>
class TtlAwarePolicy : public detail::PolicyHooks<K> {
public:
    static constexpr PolicyKind kKind = Kind;
    static constexpr bool kTracksAccess = Base::kTracksAccess;

    void on_insert(const K& key, const EntryMetadata& meta) {
        base_.on_insert(key, meta);
        if (meta.expires_at) {
            expiry_.upsert(key, {meta.expires_at->millis, meta.insertion_seq});
        }
    }
    void on_access(const K& key, const EntryMetadata& meta) {
        base_.on_access(key, meta);
    }
    void on_remove(const K& key, const EntryMetadata& meta) {
        base_.on_remove(key, meta);
        expiry_.erase(key);
    }
    void on_evict(const K& key, const EntryMetadata& meta) {
        on_remove(key, meta);
    }
    [[nodiscard]] auto select_victim(Timestamp now) -> std::optional<K> {
        auto soonest = expiry_.front_rank();
        if (soonest && Timestamp{soonest->first} <= now) {
            return expiry_.front();
        }
        return base_.select_victim(now);
    }
    void clear() {
        base_.clear();
        expiry_.clear();
    }

private:
    Base base_;
    detail::RankedIndex<K, detail::ExpiryRank, Compare> expiry_;
};

template <typename K, typename Compare = std::less<K>>
using TtlLruPolicy =
    TtlAwarePolicy<LruPolicy<K, Compare>, PolicyKind::TtlLru, K, Compare>;

template <typename K, typename Compare = std::less<K>>
using TtlLfuPolicy =
    TtlAwarePolicy<LfuPolicy<K, Compare>, PolicyKind::TtlLfu, K, Compare>;

/**
 * @brief Keeps the summed entry size under a byte budget by evicting the
 * largest entries first.
 *
 * The store asks over_budget() before every insertion and keeps evicting
 * until it returns false, so one insertion may evict several entries.
 */
template <typename K, typename Compare = std::less<K>>
class SizeBasedPolicy : public detail::PolicyHooks<K> {
public:
    static constexpr PolicyKind kKind = PolicyKind::SizeBased;

    explicit SizeBasedPolicy(std::size_t byte_budget)
        : byte_budget_(byte_budget) {}

    void on_insert(const K& key, const EntryMetadata& meta) {
        index_.upsert(key, detail::size_rank(meta));
        total_bytes_ += meta.size_bytes;
    }
    void on_remove(const K& key, const EntryMetadata& meta) {
        index_.erase(key);
        total_bytes_ -= std::min(total_bytes_, meta.size_bytes);
    }
    void on_evict(const K& key, const EntryMetadata& meta) {
        on_remove(key, meta);
    }
    [[nodiscard]] auto over_budget(std::size_t incoming) const -> bool {
        return incoming > byte_budget_ ||
               total_bytes_ > byte_budget_ - incoming;
    }
    [[nodiscard]] auto admits(std::size_t incoming) const -> bool {
        return incoming <= byte_budget_;
    }
    [[nodiscard]] auto select_victim(Timestamp /*now*/) -> std::optional<K> {
        return index_.front();
    }
    void clear() {
        index_.clear();
        total_bytes_ = 0;
    }

    [[nodiscard]] auto total_bytes() const noexcept -> std::size_t {
        return total_bytes_;
    }
    [[nodiscard]] auto byte_budget() const noexcept -> std::size_t {
        return byte_budget_;
    }

private:
    std::size_t byte_budget_;
    std::size_t total_bytes_{0};
    detail::RankedIndex<K, detail::SizeRank, Compare> index_;
};

/**
 * @brief Switches between LRU-like and LFU-like victims depending on which
 * one caused fewer misses recently.
 *
 * Keys evicted in each mode are remembered in a ghost list of at most
 * `window` keys. A later miss on a ghost key is charged to the mode that
 * evicted it. The last `window` lookups are kept; whenever that window is
 * full and the active mode has been charged more misses than the other, the
 * policy switches mode. It starts in LRU mode.
 */
template <typename K, typename Compare = std::less<K>>
class AdaptivePolicy : public detail::PolicyHooks<K> {
public:
    static constexpr PolicyKind kKind = PolicyKind::Adaptive;
    static constexpr bool kTracksAccess = true;

    enum class Mode { Lru, Lfu };

    explicit AdaptivePolicy(std::size_t window) : window_(window) {}

    void on_insert(const K& key, const EntryMetadata& meta) {
        lru_.upsert(key, detail::recency_rank(meta));
        lfu_.upsert(key, detail::frequency_rank(meta));
    }
    void on_access(const K& key, const EntryMetadata& meta) {
        lru_.upsert(key, detail::recency_rank(meta));
        lfu_.upsert(key, detail::frequency_rank(meta));
        record(Outcome::Hit);
    }
    void on_miss(const K& key) {
        if (take_ghost(lru_ghost_, key)) {
            record(Outcome::LruMiss);
        } else if (take_ghost(lfu_ghost_, key)) {
            record(Outcome::LfuMiss);
        } else {
            record(Outcome::ColdMiss);
        }
    }
    void on_remove(const K& key, const EntryMetadata& /*meta*/) {
        lru_.erase(key);
        lfu_.erase(key);
    }
    void on_evict(const K& key, const EntryMetadata& meta) {
        on_remove(key, meta);
        auto& ghost = mode_ == Mode::Lru ? lru_ghost_ : lfu_ghost_;
        ghost.push_back(key);
        if (ghost.size() > window_) {
            ghost.pop_front();
        }
    }
    [[nodiscard]] auto select_victim(Timestamp /*now*/) -> std::optional<K> {
        return mode_ == Mode::Lru ? lru_.front() : lfu_.front();
    }
    void clear() {
        lru_.clear();
        lfu_.clear();
        lru_ghost_.clear();
        lfu_ghost_.clear();
        history_.clear();
        mode_ = Mode::Lru;
    }

    [[nodiscard]] auto mode() const noexcept -> Mode { return mode_; }

private:
    enum class Outcome { Hit, LruMiss, LfuMiss, ColdMiss };

    static auto take_ghost(std::deque<K>& ghost, const K& key) -> bool {
        for (auto it = ghost.begin(); it != ghost.end(); ++it) {
            if (detail::keys_equal<K, Compare>(*it, key)) {
                ghost.erase(it);
                return true;
            }
        }
        return false;
    }

    void record(Outcome outcome) {
        history_.push_back(outcome);
        if (history_.size() > window_) {
            history_.pop_front();
        }
        if (history_.size() == window_) {
            adapt();
        }
    }

    void adapt() {
        std::size_t lruMisses = 0;
        std::size_t lfuMisses = 0;
        for (auto outcome : history_) {
            if (outcome == Outcome::LruMiss) {
                ++lruMisses;
            } else if (outcome == Outcome::LfuMiss) {
                ++lfuMisses;
            }
        }
        if (mode_ == Mode::Lru && lruMisses > lfuMisses) {
            mode_ = Mode::Lfu;
        } else if (mode_ == Mode::Lfu && lfuMisses > lruMisses) {
            mode_ = Mode::Lru;
        }
    }

    std::size_t window_;
    Mode mode_{Mode::Lru};
    detail::RankedIndex<K, detail::RecencyRank, Compare> lru_;
    detail::RankedIndex<K, detail::FrequencyRank, Compare> lfu_;
    std::deque<K> lru_ghost_;
    std::deque<K> lfu_ghost_;
    std::deque<Outcome> history_;
};

/**
 * @brief Evicts a uniformly chosen live key.
 *
 * Seeded sources make the victim sequence reproducible.
 */
template <typename K, typename Compare = std::less<K>>
class RandomPolicy : public detail::PolicyHooks<K> {
public:
    static constexpr PolicyKind kKind = PolicyKind::Random;

    explicit RandomPolicy(std::optional<std::uint64_t> seed)
        : engine_(seed ? *seed : std::random_device{}()) {}

    void on_insert(const K& key, const EntryMetadata& /*meta*/) {
        if (positions_.contains(key)) {
            return;
        }
        positions_.emplace(key, keys_.size());
        keys_.push_back(key);
    }
    void on_remove(const K& key, const EntryMetadata& /*meta*/) {
        auto it = positions_.find(key);
        if (it == positions_.end()) {
            return;
        }
        auto slot = it->second;
        positions_.erase(it);
        if (slot != keys_.size() - 1) {
            keys_[slot] = std::move(keys_.back());
            positions_[keys_[slot]] = slot;
        }
        keys_.pop_back();
    }
    void on_evict(const K& key, const EntryMetadata& meta) {
        on_remove(key, meta);
    }
    [[nodiscard]] auto select_victim(Timestamp /*now*/) -> std::optional<K> {
        if (keys_.empty()) {
            return std::nullopt;
        }
        std::uniform_int_distribution<std::size_t> pick(0, keys_.size() - 1);
        return keys_[pick(engine_)];
    }
    void clear() {
        keys_.clear();
        positions_.clear();
    }

private:
    std::mt19937_64 engine_;
    std::vector<K> keys_;
    std::map<K, std::size_t, Compare> positions_;
};

/**
 * @brief Tagged union over the policy family.
 *
 * The owning store calls every hook synchronously while it mutates its
 * entry set, so the policy's view never drifts from the stored keys.
 */
template <typename K, typename Compare = std::less<K>>
class EvictionPolicy {
public:
    using Variant =
        std::variant<NoEviction<K, Compare>, FifoPolicy<K, Compare>,
                     LruPolicy<K, Compare>, LfuPolicy<K, Compare>,
                     TtlLruPolicy<K, Compare>, TtlLfuPolicy<K, Compare>,
                     SizeBasedPolicy<K, Compare>, AdaptivePolicy<K, Compare>,
                     RandomPolicy<K, Compare>>;

    template <typename Policy>
        requires std::is_constructible_v<Variant, Policy>
    explicit EvictionPolicy(Policy policy) : policy_(std::move(policy)) {}

    [[nodiscard]] static auto make(const PolicyOptions& options)
        -> EvictionPolicy {
        switch (options.kind) {
            case PolicyKind::None:
                return EvictionPolicy(NoEviction<K, Compare>{});
            case PolicyKind::Fifo:
                return EvictionPolicy(FifoPolicy<K, Compare>{});
            case PolicyKind::Lru:
                return EvictionPolicy(LruPolicy<K, Compare>{});
            case PolicyKind::Lfu:
                return EvictionPolicy(LfuPolicy<K, Compare>{});
            case PolicyKind::TtlLru:
                return EvictionPolicy(TtlLruPolicy<K, Compare>{});
            case PolicyKind::TtlLfu:
                return EvictionPolicy(TtlLfuPolicy<K, Compare>{});
            case PolicyKind::SizeBased:
                return EvictionPolicy(
                    SizeBasedPolicy<K, Compare>{options.byte_budget});
            case PolicyKind::Adaptive:
                return EvictionPolicy(
                    AdaptivePolicy<K, Compare>{options.adaptive_window});
            case PolicyKind::Random:
                return EvictionPolicy(
                    RandomPolicy<K, Compare>{options.random_seed});
        }
        return EvictionPolicy(LruPolicy<K, Compare>{});
    }

    void on_insert(const K& key, const EntryMetadata& meta) {
        std::visit([&](auto& policy) { policy.on_insert(key, meta); },
                   policy_);
    }

    void on_access(const K& key, const EntryMetadata& meta) {
        std::visit([&](auto& policy) { policy.on_access(key, meta); },
                   policy_);
    }

    void on_miss(const K& key) {
        std::visit([&](auto& policy) { policy.on_miss(key); }, policy_);
    }

    void on_remove(const K& key, const EntryMetadata& meta) {
        std::visit([&](auto& policy) { policy.on_remove(key, meta); },
                   policy_);
    }

    /**
     * @brief Like on_remove, but the key left because the cache chose it.
     */
    void on_evict(const K& key, const EntryMetadata& meta) {
        std::visit([&](auto& policy) { policy.on_evict(key, meta); },
                   policy_);
    }

    [[nodiscard]] auto select_victim(Timestamp now) -> std::optional<K> {
        return std::visit(
            [&](auto& policy) { return policy.select_victim(now); }, policy_);
    }

    [[nodiscard]] auto over_budget(std::size_t incoming) const -> bool {
        return std::visit(
            [&](const auto& policy) { return policy.over_budget(incoming); },
            policy_);
    }

    /**
     * @brief False when no amount of eviction could make room for an entry
     * of this size.
     */
    [[nodiscard]] auto admits(std::size_t incoming) const -> bool {
        return std::visit(
            [&](const auto& policy) { return policy.admits(incoming); },
            policy_);
    }

    /**
     * @brief Whether reads must refresh recency/frequency metadata.
     */
    [[nodiscard]] auto tracks_access() const noexcept -> bool {
        return std::visit(
            [](const auto& policy) {
                return std::decay_t<decltype(policy)>::kTracksAccess;
            },
            policy_);
    }

    [[nodiscard]] auto kind() const noexcept -> PolicyKind {
        return std::visit(
            [](const auto& policy) {
                return std::decay_t<decltype(policy)>::kKind;
            },
            policy_);
    }

    void clear() {
        std::visit([](auto& policy) { policy.clear(); }, policy_);
    }

    /**
     * @brief Access to the concrete policy, nullptr if another one is active.
     */
    template <typename Policy>
    [[nodiscard]] auto get_if() noexcept -> Policy* {
        return std::get_if<Policy>(&policy_);
    }

    template <typename Policy>
    [[nodiscard]] auto get_if() const noexcept -> const Policy* {
        return std::get_if<Policy>(&policy_);
    }

private:
    Variant policy_;
};

}  // namespace stash::cache

#endif  // STASH_CACHE_EVICTION_HPP
