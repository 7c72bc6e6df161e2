/**
 * @file evaluation_pool.hpp
 * @brief std::jthread worker pool for evaluating independent placements.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace placement_engine {

/**
 * @brief Fixed-size pool; each job runs on exactly one worker.
 *
 * `map` fans a batch out over the workers and blocks until every item is
 * done, returning results in input order.
 */
class EvaluationPool {
public:
    explicit EvaluationPool(size_t num_threads = 0);
    ~EvaluationPool();

    EvaluationPool(const EvaluationPool&) = delete;
    EvaluationPool& operator=(const EvaluationPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Apply `func` to every item in parallel; results keep input order.
    template <typename In, typename F>
    auto map(const std::vector<In>& items, F func)
        -> std::vector<std::invoke_result_t<F&, const In&>>;

    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> EvaluationPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(func));
    auto future = task->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        jobs_.push([task] { (*task)(); });
    }
    queue_cv_.notify_one();
    return future;
}

template <typename In, typename F>
auto EvaluationPool::map(const std::vector<In>& items, F func)
    -> std::vector<std::invoke_result_t<F&, const In&>> {
    using Out = std::invoke_result_t<F&, const In&>;

    std::vector<std::future<Out>> futures;
    futures.reserve(items.size());
    for (const auto& item : items) {
        futures.push_back(submit([&func, &item]() { return func(item); }));
    }

    std::vector<Out> results;
    results.reserve(items.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

}  // namespace placement_engine
