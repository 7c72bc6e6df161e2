/**
 * @file expiry.cpp
 * @brief Expiry aggregation over tolerated-with-expiry taints.
 * @author Dimitris Kafetzis
 */

#include "scheduler/expiry.hpp"

#include <algorithm>

namespace placement_engine {

namespace {

// Windows beyond this are effectively forever; the clamp keeps the
// millisecond conversion and the elapsed subtraction inside int64.
constexpr int64_t kMaxWindowSeconds = Duration::max().count() / 2000;

}  // namespace

Duration remaining_for(const ExpiringTaint& entry, Timestamp now) noexcept {
    if (!entry.taint.time_added) {
        return Duration::zero();
    }
    auto elapsed = std::chrono::ceil<Duration>(now - *entry.taint.time_added);
    auto window = std::clamp(entry.toleration_seconds, -kMaxWindowSeconds, kMaxWindowSeconds);
    return std::chrono::duration_cast<Duration>(Seconds{window}) - elapsed;
}

std::optional<Expiry> soonest_expiry(const std::vector<ExpiringTaint>& expiring,
                                     Timestamp now) noexcept {
    std::optional<Expiry> best;
    for (size_t i = 0; i < expiring.size(); ++i) {
        auto remaining = remaining_for(expiring[i], now);
        if (!best || remaining < best->remaining) {
            best = Expiry{.remaining = remaining, .index = i};
        }
    }
    return best;
}

std::optional<Duration> minimum_remaining(const std::vector<ExpiringTaint>& expiring,
                                          Timestamp now) noexcept {
    auto soonest = soonest_expiry(expiring, now);
    if (!soonest) return std::nullopt;
    return soonest->remaining;
}

}  // namespace placement_engine
