/**
 * @file requeue_queue.hpp
 * @brief Delay queue of placements awaiting re-evaluation.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace placement_engine {

/**
 * @brief Holds at most one pending entry per placement.
 *
 * Adding a placement that is already queued keeps the sooner of the two
 * ready times. Thread-safe.
 */
class RequeueQueue {
public:
    /// Returns true if the placement's ready time changed.
    bool add(const PlacementId& id, Timestamp ready_at);

    /// Remove and return every entry due at `now`, earliest first
    /// (ties broken by placement id).
    std::vector<PlacementId> pop_due(Timestamp now);

    bool remove(const PlacementId& id);
    void clear();

    [[nodiscard]] std::optional<Timestamp> next_due() const;
    [[nodiscard]] std::optional<Timestamp> due_at(const PlacementId& id) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<PlacementId, Timestamp> ready_at_;
    std::set<std::pair<Timestamp, PlacementId>> order_;
};

}  // namespace placement_engine
