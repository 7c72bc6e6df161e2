/**
 * @file placement_controller.hpp
 * @brief Re-evaluates placements when they change or a toleration expires.
 * @author Dimitris Kafetzis
 *
 * Ties the inventory cache, the requeue queue and a filter stage together:
 *   1. Placements are queued on change, on resync, or at their requeue time
 *   2. sync_once() pops every due placement and evaluates them in parallel
 *      against one cluster snapshot, at one "now" read from the clock
 *   3. Outcomes replace the stored status; a requeue re-adds the placement
 *      at the time its soonest toleration runs out
 */

#pragma once

#include "controller/inventory_cache.hpp"
#include "controller/requeue_queue.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/evaluation_pool.hpp"
#include "scheduler/scheduler.hpp"
#include "telemetry/decision_recorder.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace placement_engine {

/**
 * @brief The decision currently in effect for one placement.
 */
struct PlacementStatus {
    ScheduleOutcome outcome;
    std::optional<Error> last_error;     ///< Set while the placement is invalid
    Timestamp last_evaluated;
    uint64_t evaluations = 0;
};

class PlacementController {
public:
    struct Options {
        ControllerConfig controller;
        EvictionConfig eviction;
    };

    PlacementController(InventoryCache& inventory,
                        const IClock& clock,
                        Logger logger,
                        Options options,
                        std::shared_ptr<DecisionRecorder> recorder = nullptr,
                        std::unique_ptr<IFilterStage> filter = nullptr);
    ~PlacementController();

    PlacementController(const PlacementController&) = delete;
    PlacementController& operator=(const PlacementController&) = delete;

    // ── Triggers ─────────────────────────────
    void enqueue(const PlacementId& id);
    void enqueue_all();
    /// Placement deleted: drop its status and pending requeue. An evaluation
    /// of it already in flight is discarded when it completes.
    void forget(const PlacementId& id);

    /// Evaluate every due placement once. Returns how many were evaluated.
    size_t sync_once();

    // ── Background loop ──────────────────────
    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Accessors ────────────────────────────
    [[nodiscard]] std::optional<PlacementStatus> status(const PlacementId& id) const;
    [[nodiscard]] std::vector<PlacementId> known_placements() const;
    [[nodiscard]] const RequeueQueue& queue() const noexcept { return queue_; }

private:
    struct Job {
        PlacementId id;
        std::optional<Placement> placement;
        ClusterSet decided;
    };

    void apply(const Job& job,
               std::optional<Result<ScheduleOutcome>> result,
               const std::vector<ManagedCluster>& candidates,
               Timestamp now);
    /// Caller holds status_mutex_.
    void apply_error(const PlacementId& id,
                     const Error& error,
                     const std::vector<ManagedCluster>& candidates,
                     Timestamp now);
    void maybe_resync(Timestamp now);
    void run_loop(std::stop_token stop);
    void kick();

    InventoryCache& inventory_;
    const IClock& clock_;
    Logger logger_;
    Options options_;
    std::shared_ptr<DecisionRecorder> recorder_;
    std::unique_ptr<IFilterStage> filter_;

    RequeueQueue queue_;
    EvaluationPool pool_;

    mutable std::mutex status_mutex_;
    std::unordered_map<PlacementId, PlacementStatus> statuses_;
    std::unordered_set<PlacementId> in_flight_;     ///< Evaluating this cycle, not forgotten

    std::mutex sync_mutex_;
    std::optional<Timestamp> last_resync_;

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    bool kicked_{false};

    std::atomic<bool> running_{false};
    std::jthread loop_;
};

}  // namespace placement_engine
