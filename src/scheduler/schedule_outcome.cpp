/**
 * @file schedule_outcome.cpp
 * @brief ScheduleOutcome helper method implementations.
 * @author Dimitris Kafetzis
 */

#include "scheduler/scheduler.hpp"

#include <algorithm>

namespace placement_engine {

bool ScheduleOutcome::is_admitted(const ClusterId& cluster) const {
    return std::find(admitted.begin(), admitted.end(), cluster) != admitted.end();
}

Timestamp ScheduleOutcome::requeue_at() const noexcept {
    auto headroom = std::chrono::floor<Duration>(Timestamp::max() - evaluated_at);
    if (requeue_after >= headroom) return Timestamp::max();
    return evaluated_at + requeue_after;
}

const ClusterVerdict* ScheduleOutcome::verdict_for(const ClusterId& cluster) const {
    auto it = std::find_if(verdicts.begin(), verdicts.end(),
                           [&](const ClusterVerdict& v) { return v.cluster == cluster; });
    return it == verdicts.end() ? nullptr : &*it;
}

ScheduleOutcome reject_all(const PlacementId& placement,
                           const std::vector<ManagedCluster>& candidates,
                           Timestamp now) {
    ScheduleOutcome outcome;
    outcome.placement = placement;
    outcome.evaluated_at = now;
    outcome.rejected.reserve(candidates.size());
    for (const auto& cluster : candidates) {
        outcome.rejected.push_back(cluster.name);
    }
    return outcome;
}

}  // namespace placement_engine
