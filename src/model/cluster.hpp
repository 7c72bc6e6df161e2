/**
 * @file cluster.hpp
 * @brief Managed clusters and placements as seen by the scheduler.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "model/taint.hpp"

#include <string>
#include <vector>

namespace placement_engine {

/**
 * @brief A remote cluster registered with the control plane.
 *
 * Taint order is preserved from the source object.
 */
struct ManagedCluster {
    ClusterId name;
    std::vector<Taint> taints;

    bool operator==(const ManagedCluster&) const = default;
};

/**
 * @brief Policy object selecting managed clusters for a workload.
 *
 * Toleration order is part of the contract: when several tolerations match
 * one taint, the first one declared decides.
 */
struct Placement {
    std::string ns = "default";
    std::string name;
    std::vector<Toleration> tolerations;

    [[nodiscard]] PlacementId id() const { return make_placement_id(ns, name); }

    bool operator==(const Placement&) const = default;
};

}  // namespace placement_engine
