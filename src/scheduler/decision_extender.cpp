/**
 * @file decision_extender.cpp
 * @brief DecisionExtender: admits clusters whose taints are all tolerated
 *        and reports the soonest toleration expiry across them.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   Validate the placement's tolerations, fail the placement if malformed
 *   For each candidate cluster:
 *     Not tolerated:            reject (no matching toleration)
 *     Tolerated, no expiry:     admit
 *     Soonest remaining <= 0:   reject (toleration expired), no timer
 *     Soonest remaining  > 0:   admit, candidate for the requeue delay
 *   requeue_after = minimum positive remaining over admitted clusters
 */

#include "scheduler/decision_extender.hpp"

#include "scheduler/expiry.hpp"
#include "scheduler/toleration_matcher.hpp"

#include <algorithm>

namespace placement_engine {

Result<void> validate_tolerations(const Placement& placement) {
    for (size_t i = 0; i < placement.tolerations.size(); ++i) {
        const auto& toleration = placement.tolerations[i];
        if (toleration.key.empty() && toleration.op != TolerationOperator::Exists) {
            return Error{ErrorCode::InvalidToleration,
                         "placement " + placement.id() + " toleration #" + std::to_string(i)
                         + ": an empty key requires operator Exists"};
        }
        if (toleration.op == TolerationOperator::Exists && !toleration.value.empty()) {
            return Error{ErrorCode::InvalidToleration,
                         "placement " + placement.id() + " toleration #" + std::to_string(i)
                         + ": operator Exists requires an empty value"};
        }
    }
    return Result<void>{};
}

Result<ScheduleOutcome> DecisionExtender::filter(const Placement& placement,
                                                 const std::vector<ManagedCluster>& candidates,
                                                 const ClusterSet& decided,
                                                 Timestamp now) const {
    if (auto valid = validate_tolerations(placement); !valid) {
        return valid.error();
    }

    ScheduleOutcome outcome;
    outcome.placement = placement.id();
    outcome.evaluated_at = now;
    outcome.verdicts.reserve(candidates.size());

    std::optional<Duration> min_remaining;

    for (const auto& cluster : candidates) {
        ClusterVerdict verdict;
        verdict.cluster = cluster.name;

        auto check = tolerated(cluster.taints, placement.tolerations,
                               decided.contains(cluster.name));

        if (!check.admitted) {
            verdict.reason = ClusterVerdict::Reason::NoMatchingToleration;
            verdict.taint = describe(cluster.taints[*check.untolerated_taint]);
            outcome.rejected.push_back(cluster.name);
            outcome.verdicts.push_back(std::move(verdict));
            continue;
        }

        for (const auto& entry : check.expiring) {
            if (entry.toleration_seconds < 0 && entry.taint.time_added
                && *entry.taint.time_added > now) {
                return Error{ErrorCode::InvalidToleration,
                             "placement " + placement.id() + " toleration #"
                             + std::to_string(entry.toleration_index)
                             + ": negative toleration_seconds matches taint "
                             + describe(entry.taint) + " on cluster " + cluster.name
                             + " whose time_added is in the future"};
            }
        }

        auto soonest = soonest_expiry(check.expiring, now);
        if (!soonest) {
            verdict.admitted = true;
            verdict.reason = ClusterVerdict::Reason::Tolerated;
            outcome.admitted.push_back(cluster.name);
        } else if (soonest->remaining <= Duration::zero()) {
            verdict.reason = ClusterVerdict::Reason::TolerationExpired;
            verdict.remaining = Duration::zero();
            verdict.taint = describe(check.expiring[soonest->index].taint);
            outcome.rejected.push_back(cluster.name);
        } else {
            verdict.admitted = true;
            verdict.reason = ClusterVerdict::Reason::ToleratedUntilExpiry;
            verdict.remaining = soonest->remaining;
            verdict.taint = describe(check.expiring[soonest->index].taint);
            outcome.admitted.push_back(cluster.name);
            min_remaining = min_remaining
                ? std::min(*min_remaining, soonest->remaining)
                : soonest->remaining;
        }
        outcome.verdicts.push_back(std::move(verdict));
    }

    if (min_remaining) {
        outcome.requeue = true;
        outcome.requeue_after = *min_remaining;
    }

    return outcome;
}

}  // namespace placement_engine
