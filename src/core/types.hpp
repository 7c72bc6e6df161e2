/**
 * @file types.hpp
 * @brief Fundamental types used throughout the placement engine.
 * @author Dimitris Kafetzis
 *
 * Defines ClusterId, PlacementId, Timestamp, and the duration vocabulary.
 * All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace placement_engine {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ClusterId = std::string;
using PlacementId = std::string;          ///< "namespace/name"

// ─────────────────────────────────────────────
// Time
// ─────────────────────────────────────────────

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

/**
 * @brief Build a PlacementId from its namespace and name.
 */
[[nodiscard]] inline PlacementId make_placement_id(std::string_view ns, std::string_view name) {
    PlacementId id;
    id.reserve(ns.size() + name.size() + 1);
    id.append(ns).append("/").append(name);
    return id;
}

/**
 * @brief Timestamp from whole seconds since the Unix epoch.
 */
[[nodiscard]] constexpr Timestamp from_unix_seconds(int64_t seconds) noexcept {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(Seconds{seconds})};
}

[[nodiscard]] constexpr int64_t to_unix_seconds(Timestamp ts) noexcept {
    return std::chrono::duration_cast<Seconds>(ts.time_since_epoch()).count();
}

[[nodiscard]] constexpr int64_t to_unix_millis(Timestamp ts) noexcept {
    return std::chrono::duration_cast<Duration>(ts.time_since_epoch()).count();
}

}  // namespace placement_engine
