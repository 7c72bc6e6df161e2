/**
 * @file toleration_matcher.cpp
 * @brief Taint/toleration matching.
 * @author Dimitris Kafetzis
 *
 * Algorithm:
 *   For each taint on the cluster:
 *     Skip it if its effect does not filter this cluster
 *     Scan tolerations in declaration order, stop at the first match
 *     No match: reject, remember the taint
 *     Match with toleration_seconds: record (taint, seconds)
 *
 * Complexity: O(taints × tolerations); both are expected to stay tiny.
 */

#include "scheduler/toleration_matcher.hpp"

namespace placement_engine {

bool matches(const Taint& taint, const Toleration& toleration) noexcept {
    if (toleration.effect && *toleration.effect != taint.effect) {
        return false;
    }
    if (!toleration.key.empty() && toleration.key != taint.key) {
        return false;
    }
    switch (toleration.op) {
        case TolerationOperator::Exists:
            return true;
        case TolerationOperator::Equal:
            return toleration.value == taint.value;
    }
    return false;
}

std::optional<size_t> first_match(const Taint& taint,
                                  const std::vector<Toleration>& tolerations) noexcept {
    for (size_t i = 0; i < tolerations.size(); ++i) {
        if (matches(taint, tolerations[i])) return i;
    }
    return std::nullopt;
}

bool is_filtering(const Taint& taint, bool in_decision) noexcept {
    switch (taint.effect) {
        case TaintEffect::NoSelect:       return true;
        case TaintEffect::PreferNoSelect: return false;
        case TaintEffect::NoSelectIfNew:  return !in_decision;
    }
    return true;
}

TolerationCheck tolerated(const std::vector<Taint>& taints,
                          const std::vector<Toleration>& tolerations,
                          bool in_decision) {
    TolerationCheck check;

    for (size_t t = 0; t < taints.size(); ++t) {
        const auto& taint = taints[t];
        if (!is_filtering(taint, in_decision)) continue;

        auto match = first_match(taint, tolerations);
        if (!match) {
            check.admitted = false;
            check.untolerated_taint = t;
            check.expiring.clear();
            return check;
        }

        const auto& toleration = tolerations[*match];
        if (toleration.toleration_seconds) {
            check.expiring.push_back({
                .taint = taint,
                .toleration_seconds = *toleration.toleration_seconds,
                .toleration_index = *match
            });
        }
    }

    return check;
}

}  // namespace placement_engine
