/**
 * @file toleration_matcher.hpp
 * @brief Taint/toleration matching: decides whether a cluster may be selected.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "model/taint.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace placement_engine {

/**
 * @brief A taint that is tolerated only for a bounded time.
 */
struct ExpiringTaint {
    Taint taint;
    int64_t toleration_seconds = 0;
    size_t toleration_index = 0;     ///< Which toleration granted the window
};

/**
 * @brief Outcome of checking one cluster's taints against one placement.
 */
struct TolerationCheck {
    bool admitted = true;
    std::vector<ExpiringTaint> expiring;        ///< In taint order
    std::optional<size_t> untolerated_taint;    ///< First taint nothing matched
};

/**
 * @brief Does `toleration` match `taint`?
 *
 * An empty toleration key matches every key. Exists needs only the key to
 * match; Equal also needs equal values. A toleration naming an effect only
 * matches taints with that effect.
 */
[[nodiscard]] bool matches(const Taint& taint, const Toleration& toleration) noexcept;

/**
 * @brief Index of the first toleration, in declaration order, matching `taint`.
 */
[[nodiscard]] std::optional<size_t> first_match(const Taint& taint,
                                                const std::vector<Toleration>& tolerations) noexcept;

/**
 * @brief Whether `taint` takes part in filtering.
 *
 * PreferNoSelect never filters; NoSelectIfNew only filters clusters that
 * are not already part of the placement's decision.
 */
[[nodiscard]] bool is_filtering(const Taint& taint, bool in_decision) noexcept;

/**
 * @brief Check every taint of a cluster against a placement's tolerations.
 *
 * The cluster is admitted iff each filtering taint is matched by at least
 * one toleration. For each matched taint the first matching toleration
 * decides; if it carries toleration_seconds the taint is reported as
 * expiring, regardless of what later tolerations would have granted.
 */
[[nodiscard]] TolerationCheck tolerated(const std::vector<Taint>& taints,
                                        const std::vector<Toleration>& tolerations,
                                        bool in_decision = false);

}  // namespace placement_engine
