/**
 * @file inventory_cache.hpp
 * @brief Thread-safe view of managed clusters and placements.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "model/cluster.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace placement_engine {

using ClusterSnapshot = std::shared_ptr<const std::vector<ManagedCluster>>;

/**
 * @brief Holds the latest known clusters and placements.
 *
 * Written by whatever feeds the engine (inventory file, watch stream), read
 * by the controller. Thread-safe via shared_mutex. Cluster snapshots are
 * immutable and sorted by name, so a scheduling cycle sees one consistent
 * candidate list.
 */
class InventoryCache {
public:
    InventoryCache();

    /**
     * @brief Insert or replace a cluster.
     *
     * Taints arriving without time_added inherit it from the identical taint
     * already stored, or are stamped with `observed_at` if they are new.
     */
    void upsert_cluster(ManagedCluster cluster, Timestamp observed_at);
    bool remove_cluster(const ClusterId& name);

    void upsert_placement(Placement placement);
    bool remove_placement(const PlacementId& id);

    void clear();

    [[nodiscard]] ClusterSnapshot clusters() const;
    [[nodiscard]] std::optional<ManagedCluster> cluster(const ClusterId& name) const;
    [[nodiscard]] std::optional<Placement> placement(const PlacementId& id) const;
    [[nodiscard]] std::vector<PlacementId> placement_ids() const;
    [[nodiscard]] size_t cluster_count() const;
    [[nodiscard]] size_t placement_count() const;

private:
    void rebuild_snapshot();

    mutable std::shared_mutex mutex_;
    std::map<ClusterId, ManagedCluster> clusters_;
    std::map<PlacementId, Placement> placements_;
    ClusterSnapshot snapshot_;
};

}  // namespace placement_engine
