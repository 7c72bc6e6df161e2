/**
 * @file scheduler.hpp
 * @brief Schedule outcome structures and the filter stage interface.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "model/cluster.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace placement_engine {

using ClusterSet = std::unordered_set<ClusterId>;

// ─────────────────────────────────────────────
// Per-cluster Verdict
// ─────────────────────────────────────────────

struct ClusterVerdict {
    ClusterId cluster;
    bool admitted = false;

    enum class Reason : uint8_t {
        Tolerated,               ///< No taints, or every taint tolerated forever
        ToleratedUntilExpiry,    ///< Admitted; `remaining` is the time left
        NoMatchingToleration,    ///< `taint` has no matching toleration
        TolerationExpired        ///< `taint` was tolerated but its grace period elapsed
    } reason = Reason::Tolerated;

    std::optional<Duration> remaining;
    std::string taint;          ///< Offending or soonest-expiring taint, empty otherwise

    bool operator==(const ClusterVerdict&) const = default;
};

[[nodiscard]] constexpr std::string_view to_string(ClusterVerdict::Reason reason) noexcept {
    switch (reason) {
        case ClusterVerdict::Reason::Tolerated:            return "tolerated";
        case ClusterVerdict::Reason::ToleratedUntilExpiry: return "tolerated_until_expiry";
        case ClusterVerdict::Reason::NoMatchingToleration: return "no_matching_toleration";
        case ClusterVerdict::Reason::TolerationExpired:    return "toleration_expired";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Schedule Outcome
// ─────────────────────────────────────────────

/**
 * @brief Result of one evaluation cycle for one placement.
 *
 * `admitted` and `rejected` keep the order the candidates were given in.
 * `requeue_after` is meaningful only when `requeue` is set.
 */
struct ScheduleOutcome {
    PlacementId placement;
    std::vector<ClusterId> admitted;
    std::vector<ClusterId> rejected;
    std::vector<ClusterVerdict> verdicts;
    bool requeue = false;
    Duration requeue_after{0};
    Timestamp evaluated_at;

    /// evaluated_at + requeue_after, saturating at Timestamp::max().
    [[nodiscard]] Timestamp requeue_at() const noexcept;
    [[nodiscard]] bool is_admitted(const ClusterId& cluster) const;
    [[nodiscard]] const ClusterVerdict* verdict_for(const ClusterId& cluster) const;

    bool operator==(const ScheduleOutcome&) const = default;
};

/**
 * @brief Outcome with every candidate rejected and no requeue.
 */
ScheduleOutcome reject_all(const PlacementId& placement,
                           const std::vector<ManagedCluster>& candidates,
                           Timestamp now);

// ─────────────────────────────────────────────
// Filter Stage Interface
// ─────────────────────────────────────────────

/**
 * @brief A stage of the scheduling pipeline that narrows the candidate set.
 *
 * Implementations must be pure: the same inputs and the same `now` give the
 * same outcome, and no state is kept between calls, so one instance may be
 * shared by concurrent workers.
 */
class IFilterStage {
public:
    virtual ~IFilterStage() = default;

    /// `decided` holds the clusters in the placement's current decision.
    virtual Result<ScheduleOutcome> filter(const Placement& placement,
                                           const std::vector<ManagedCluster>& candidates,
                                           const ClusterSet& decided,
                                           Timestamp now) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace placement_engine
