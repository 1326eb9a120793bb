#include "ttl.hpp"

namespace stash::cache {

auto SteadyTimeSource::now() const noexcept -> Timestamp {
    auto sinceEpoch = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now().time_since_epoch());
    return Timestamp{static_cast<std::uint64_t>(sinceEpoch.count())};
}

ManualTimeSource::ManualTimeSource(Timestamp start) noexcept
    : millis_(start.millis) {}

auto ManualTimeSource::now() const noexcept -> Timestamp {
    return Timestamp{millis_.load(std::memory_order_acquire)};
}

void ManualTimeSource::advance(Duration duration) noexcept {
    if (duration.count() > 0) {
        millis_.fetch_add(static_cast<std::uint64_t>(duration.count()),
                          std::memory_order_acq_rel);
    }
}

void ManualTimeSource::set(Timestamp when) noexcept {
    millis_.store(when.millis, std::memory_order_release);
}

auto default_time_source() -> std::shared_ptr<TimeSource> {
    static auto source = std::make_shared<SteadyTimeSource>();
    return source;
}

}  // namespace stash::cache
