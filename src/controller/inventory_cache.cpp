/**
 * @file inventory_cache.cpp
 * @brief InventoryCache implementation.
 * @author Dimitris Kafetzis
 */

#include "controller/inventory_cache.hpp"

#include <mutex>

namespace placement_engine {

InventoryCache::InventoryCache()
    : snapshot_(std::make_shared<const std::vector<ManagedCluster>>()) {}

void InventoryCache::upsert_cluster(ManagedCluster cluster, Timestamp observed_at) {
    std::unique_lock lock(mutex_);

    auto existing = clusters_.find(cluster.name);
    for (auto& taint : cluster.taints) {
        if (taint.time_added) continue;
        taint.time_added = observed_at;
        if (existing == clusters_.end()) continue;
        for (const auto& known : existing->second.taints) {
            if (known.same_identity(taint) && known.time_added) {
                taint.time_added = known.time_added;
                break;
            }
        }
    }

    auto name = cluster.name;
    clusters_[name] = std::move(cluster);
    rebuild_snapshot();
}

bool InventoryCache::remove_cluster(const ClusterId& name) {
    std::unique_lock lock(mutex_);
    if (clusters_.erase(name) == 0) return false;
    rebuild_snapshot();
    return true;
}

void InventoryCache::upsert_placement(Placement placement) {
    std::unique_lock lock(mutex_);
    auto id = placement.id();
    placements_[id] = std::move(placement);
}

bool InventoryCache::remove_placement(const PlacementId& id) {
    std::unique_lock lock(mutex_);
    return placements_.erase(id) > 0;
}

void InventoryCache::clear() {
    std::unique_lock lock(mutex_);
    clusters_.clear();
    placements_.clear();
    rebuild_snapshot();
}

ClusterSnapshot InventoryCache::clusters() const {
    std::shared_lock lock(mutex_);
    return snapshot_;
}

std::optional<ManagedCluster> InventoryCache::cluster(const ClusterId& name) const {
    std::shared_lock lock(mutex_);
    auto it = clusters_.find(name);
    if (it == clusters_.end()) return std::nullopt;
    return it->second;
}

std::optional<Placement> InventoryCache::placement(const PlacementId& id) const {
    std::shared_lock lock(mutex_);
    auto it = placements_.find(id);
    if (it == placements_.end()) return std::nullopt;
    return it->second;
}

std::vector<PlacementId> InventoryCache::placement_ids() const {
    std::shared_lock lock(mutex_);
    std::vector<PlacementId> ids;
    ids.reserve(placements_.size());
    for (const auto& [id, placement] : placements_) {
        ids.push_back(id);
    }
    return ids;
}

size_t InventoryCache::cluster_count() const {
    std::shared_lock lock(mutex_);
    return clusters_.size();
}

size_t InventoryCache::placement_count() const {
    std::shared_lock lock(mutex_);
    return placements_.size();
}

void InventoryCache::rebuild_snapshot() {
    auto view = std::make_shared<std::vector<ManagedCluster>>();
    view->reserve(clusters_.size());
    for (const auto& [name, cluster] : clusters_) {
        view->push_back(cluster);
    }
    snapshot_ = std::move(view);
}

}  // namespace placement_engine
