/**
 * @file decision_extender.hpp
 * @brief Taint/toleration filter stage producing the placement-wide requeue signal.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "scheduler/scheduler.hpp"

namespace placement_engine {

/**
 * @brief Reject structurally inconsistent tolerations.
 *
 * An empty key requires Exists; Exists requires an empty value.
 * The error names the placement and the index of the offending toleration.
 */
Result<void> validate_tolerations(const Placement& placement);

/**
 * @brief Filters candidate clusters by taints and computes when to look again.
 *
 * Stateless; one instance can serve every worker.
 */
class DecisionExtender : public IFilterStage {
public:
    Result<ScheduleOutcome> filter(const Placement& placement,
                                   const std::vector<ManagedCluster>& candidates,
                                   const ClusterSet& decided,
                                   Timestamp now) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "taint_toleration"; }
};

}  // namespace placement_engine
