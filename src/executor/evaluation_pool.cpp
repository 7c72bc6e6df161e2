/**
 * @file evaluation_pool.cpp
 * @brief EvaluationPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/evaluation_pool.hpp"

namespace placement_engine {

EvaluationPool::EvaluationPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

EvaluationPool::~EvaluationPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    workers_.clear();  // join before the queue and its mutex go away
}

void EvaluationPool::worker_loop(std::stop_token stop) {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !jobs_.empty(); });

            // Queued jobs are drained before a stop request is honoured.
            if (jobs_.empty()) return;

            job = std::move(jobs_.front());
            jobs_.pop();
        }
        job();
    }
}

size_t EvaluationPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace placement_engine
