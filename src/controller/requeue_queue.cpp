/**
 * @file requeue_queue.cpp
 * @brief RequeueQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "controller/requeue_queue.hpp"

namespace placement_engine {

bool RequeueQueue::add(const PlacementId& id, Timestamp ready_at) {
    std::lock_guard lock(mutex_);
    auto it = ready_at_.find(id);
    if (it != ready_at_.end()) {
        if (it->second <= ready_at) return false;
        order_.erase({it->second, id});
        it->second = ready_at;
    } else {
        ready_at_.emplace(id, ready_at);
    }
    order_.emplace(ready_at, id);
    return true;
}

std::vector<PlacementId> RequeueQueue::pop_due(Timestamp now) {
    std::lock_guard lock(mutex_);
    std::vector<PlacementId> due;
    while (!order_.empty() && order_.begin()->first <= now) {
        auto node = order_.extract(order_.begin());
        ready_at_.erase(node.value().second);
        due.push_back(std::move(node.value().second));
    }
    return due;
}

bool RequeueQueue::remove(const PlacementId& id) {
    std::lock_guard lock(mutex_);
    auto it = ready_at_.find(id);
    if (it == ready_at_.end()) return false;
    order_.erase({it->second, id});
    ready_at_.erase(it);
    return true;
}

void RequeueQueue::clear() {
    std::lock_guard lock(mutex_);
    ready_at_.clear();
    order_.clear();
}

std::optional<Timestamp> RequeueQueue::next_due() const {
    std::lock_guard lock(mutex_);
    if (order_.empty()) return std::nullopt;
    return order_.begin()->first;
}

std::optional<Timestamp> RequeueQueue::due_at(const PlacementId& id) const {
    std::lock_guard lock(mutex_);
    auto it = ready_at_.find(id);
    if (it == ready_at_.end()) return std::nullopt;
    return it->second;
}

size_t RequeueQueue::size() const {
    std::lock_guard lock(mutex_);
    return ready_at_.size();
}

bool RequeueQueue::empty() const {
    std::lock_guard lock(mutex_);
    return ready_at_.empty();
}

}  // namespace placement_engine
