#ifndef STASH_CACHE_TTL_HPP
#define STASH_CACHE_TTL_HPP

#include <atomic>
#include <chrono>
#include <compare>
#include <cstdint>
#include <limits>
#include <memory>

namespace stash::cache {

using Duration = std::chrono::milliseconds;

/**
 * @brief A point on a TimeSource's axis, in milliseconds.
 *
 * Only timestamps produced by the same time source are comparable.
 */
struct Timestamp {
    std::uint64_t millis{0};

    constexpr auto operator<=>(const Timestamp&) const = default;

    /**
     * @brief Adds a duration, saturating at the end of the axis. Negative
     * durations are treated as zero.
     */
    [[nodiscard]] constexpr auto plus(Duration duration) const noexcept
        -> Timestamp {
        if (duration.count() <= 0) {
            return *this;
        }
        auto delta = static_cast<std::uint64_t>(duration.count());
        if (millis > std::numeric_limits<std::uint64_t>::max() - delta) {
            return Timestamp{std::numeric_limits<std::uint64_t>::max()};
        }
        return Timestamp{millis + delta};
    }

    /**
     * @brief Time left until this instant, zero if it already passed.
     */
    [[nodiscard]] constexpr auto remaining_from(Timestamp now) const noexcept
        -> Duration {
        if (now.millis >= millis) {
            return Duration::zero();
        }
        return Duration(static_cast<Duration::rep>(millis - now.millis));
    }
};

/**
 * @brief Clock abstraction consulted by the TTL layer.
 *
 * Implementations must be safe to call from several shards at once.
 */
class TimeSource {
public:
    virtual ~TimeSource() = default;

    [[nodiscard]] virtual auto now() const noexcept -> Timestamp = 0;
};

/**
 * @brief Production clock backed by std::chrono::steady_clock.
 */
class SteadyTimeSource final : public TimeSource {
public:
    [[nodiscard]] auto now() const noexcept -> Timestamp override;
};

/**
 * @brief Logical clock that only moves when told to.
 *
 * Used to make expiry deterministic in tests and simulations.
 */
class ManualTimeSource final : public TimeSource {
public:
    explicit ManualTimeSource(Timestamp start = Timestamp{}) noexcept;

    [[nodiscard]] auto now() const noexcept -> Timestamp override;

    void advance(Duration duration) noexcept;
    void set(Timestamp when) noexcept;

private:
    std::atomic<std::uint64_t> millis_;
};

/**
 * @brief The process-wide steady clock shared by caches that were not given
 * their own time source.
 */
[[nodiscard]] auto default_time_source() -> std::shared_ptr<TimeSource>;

}  // namespace stash::cache

#endif  // STASH_CACHE_TTL_HPP
