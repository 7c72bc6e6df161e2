/**
 * @file expiry.hpp
 * @brief Remaining toleration time for expiring taints.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "scheduler/toleration_matcher.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace placement_engine {

/**
 * @brief The soonest-expiring entry of a set of expiring taints.
 */
struct Expiry {
    Duration remaining{0};
    size_t index = 0;           ///< Position in the input sequence
};

/**
 * @brief toleration_seconds − (now − time_added), in milliseconds.
 *
 * A taint without time_added is due immediately (zero). Elapsed time is
 * rounded up to the next millisecond so an expiry is never reported late.
 * The result may be negative. Windows too long to represent are clamped,
 * so an out-of-range toleration_seconds never wraps.
 */
[[nodiscard]] Duration remaining_for(const ExpiringTaint& entry, Timestamp now) noexcept;

/**
 * @brief Entry with the smallest remaining time; nullopt for an empty input.
 *
 * Ties keep the earliest entry.
 */
[[nodiscard]] std::optional<Expiry> soonest_expiry(const std::vector<ExpiringTaint>& expiring,
                                                   Timestamp now) noexcept;

/**
 * @brief Minimum remaining time, or nullopt when nothing expires.
 */
[[nodiscard]] std::optional<Duration> minimum_remaining(const std::vector<ExpiringTaint>& expiring,
                                                        Timestamp now) noexcept;

}  // namespace placement_engine
