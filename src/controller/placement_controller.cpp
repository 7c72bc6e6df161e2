/**
 * @file placement_controller.cpp
 * @brief PlacementController implementation.
 * @author Dimitris Kafetzis
 */

#include "controller/placement_controller.hpp"

#include "scheduler/decision_extender.hpp"

#include <algorithm>
#include <exception>

namespace placement_engine {

PlacementController::PlacementController(InventoryCache& inventory,
                                         const IClock& clock,
                                         Logger logger,
                                         Options options,
                                         std::shared_ptr<DecisionRecorder> recorder,
                                         std::unique_ptr<IFilterStage> filter)
    : inventory_(inventory)
    , clock_(clock)
    , logger_(std::move(logger))
    , options_(options)
    , recorder_(std::move(recorder))
    , filter_(filter ? std::move(filter) : std::make_unique<DecisionExtender>())
    , pool_(options_.controller.worker_count) {
}

PlacementController::~PlacementController() {
    stop();
}

// ── Triggers ─────────────────────────────────

void PlacementController::enqueue(const PlacementId& id) {
    queue_.add(id, clock_.now());
    kick();
}

void PlacementController::enqueue_all() {
    auto now = clock_.now();
    for (const auto& id : inventory_.placement_ids()) {
        queue_.add(id, now);
    }
    kick();
}

void PlacementController::forget(const PlacementId& id) {
    std::lock_guard lock(status_mutex_);
    queue_.remove(id);
    statuses_.erase(id);
    in_flight_.erase(id);
}

// ── Evaluation ───────────────────────────────

size_t PlacementController::sync_once() {
    std::lock_guard sync_lock(sync_mutex_);

    auto now = clock_.now();
    maybe_resync(now);

    auto due = queue_.pop_due(now);
    if (due.empty()) return 0;

    auto clusters = inventory_.clusters();

    std::vector<Job> jobs;
    jobs.reserve(due.size());
    {
        std::lock_guard lock(status_mutex_);
        for (auto& id : due) {
            Job job{.id = std::move(id), .placement = std::nullopt, .decided = {}};
            job.placement = inventory_.placement(job.id);
            in_flight_.insert(job.id);
            if (auto it = statuses_.find(job.id); it != statuses_.end()) {
                const auto& admitted = it->second.outcome.admitted;
                job.decided.insert(admitted.begin(), admitted.end());
            }
            jobs.push_back(std::move(job));
        }
    }

    auto results = pool_.map(jobs, [&](const Job& job) -> std::optional<Result<ScheduleOutcome>> {
        if (!job.placement) return std::nullopt;
        try {
            return filter_->filter(*job.placement, *clusters, job.decided, now);
        } catch (const std::exception& e) {
            return Result<ScheduleOutcome>(Error{ErrorCode::Unknown,
                "placement " + job.id + ": evaluation failed: " + e.what()});
        }
    });

    size_t evaluated = 0;
    for (size_t i = 0; i < jobs.size(); ++i) {
        if (results[i]) ++evaluated;
        apply(jobs[i], std::move(results[i]), *clusters, now);
    }
    {
        std::lock_guard lock(status_mutex_);
        in_flight_.clear();
    }

    logger_.debug("Evaluated " + std::to_string(evaluated) + " placement(s), "
                  + std::to_string(queue_.size()) + " pending requeue");
    return evaluated;
}

void PlacementController::apply(const Job& job,
                                std::optional<Result<ScheduleOutcome>> result,
                                const std::vector<ManagedCluster>& candidates,
                                Timestamp now) {
    std::lock_guard lock(status_mutex_);
    if (in_flight_.erase(job.id) == 0) {
        logger_.debug("Placement " + job.id + " was forgotten during evaluation, dropping");
        return;
    }

    if (!result) {
        // Deleted while queued; nothing to decide.
        logger_.debug("Placement " + job.id + " no longer exists, dropping");
        statuses_.erase(job.id);
        return;
    }

    if (!result->has_value()) {
        apply_error(job.id, result->error(), candidates, now);
        return;
    }

    ScheduleOutcome outcome = std::move(*result).value();

    auto it = statuses_.find(job.id);
    uint64_t evaluations = 0;

    if (it != statuses_.end()) {
        evaluations = it->second.evaluations;
        const auto& previous = it->second.outcome;
        for (const auto& verdict : outcome.verdicts) {
            if (verdict.reason != ClusterVerdict::Reason::TolerationExpired) continue;
            if (!previous.is_admitted(verdict.cluster)) continue;
            logger_.info("Evicting cluster " + verdict.cluster + " from placement " + job.id
                         + ": toleration of taint " + verdict.taint + " expired");
            if (recorder_) recorder_->record_eviction(job.id, verdict, now);
        }
        if (it->second.last_error) {
            logger_.info("Placement " + job.id + " tolerations are valid again");
        }
    }

    if (outcome.requeue) {
        auto ready_at = outcome.requeue_at();
        queue_.add(job.id, ready_at);
        logger_.debug("Placement " + job.id + " requeued in "
                      + std::to_string(outcome.requeue_after.count()) + "ms");
        if (recorder_) recorder_->record_requeue(job.id, ready_at);
    }
    if (recorder_) recorder_->record_outcome(outcome);

    statuses_[job.id] = PlacementStatus{
        .outcome = std::move(outcome),
        .last_error = std::nullopt,
        .last_evaluated = now,
        .evaluations = evaluations + 1
    };
}

void PlacementController::apply_error(const PlacementId& id,
                                      const Error& error,
                                      const std::vector<ManagedCluster>& candidates,
                                      Timestamp now) {
    logger_.warn(error.message);
    if (recorder_) recorder_->record_validation_error(id, error, now);

    auto it = statuses_.find(id);
    bool keep_previous =
        options_.eviction.invalid_toleration_policy == InvalidTolerationPolicy::KeepPrevious
        && it != statuses_.end();

    PlacementStatus status;
    if (it != statuses_.end()) status = it->second;
    if (!keep_previous) {
        status.outcome = reject_all(id, candidates, now);
    }
    status.last_error = error;
    status.last_evaluated = now;
    ++status.evaluations;
    statuses_[id] = std::move(status);
}

void PlacementController::maybe_resync(Timestamp now) {
    auto interval = Seconds{options_.controller.resync_interval_s};
    if (interval == Seconds::zero()) return;
    if (last_resync_ && now - *last_resync_ < interval) return;

    last_resync_ = now;
    for (const auto& id : inventory_.placement_ids()) {
        queue_.add(id, now);
    }
}

// ── Background loop ──────────────────────────

void PlacementController::start() {
    if (running_.exchange(true)) return;
    logger_.info("Placement controller starting with "
                 + std::to_string(pool_.thread_count()) + " worker(s)");
    loop_ = std::jthread([this](std::stop_token stop) { run_loop(stop); });
}

void PlacementController::stop() {
    if (!running_.exchange(false)) return;
    loop_.request_stop();
    wake_cv_.notify_all();
    if (loop_.joinable()) loop_.join();
    logger_.info("Placement controller stopped");
}

void PlacementController::kick() {
    {
        std::lock_guard lock(wake_mutex_);
        kicked_ = true;
    }
    wake_cv_.notify_all();
}

void PlacementController::run_loop(std::stop_token stop) {
    const auto max_wait = std::chrono::milliseconds{options_.controller.max_idle_wait_ms};

    while (!stop.stop_requested()) {
        sync_once();

        auto wait = max_wait;
        if (auto next = queue_.next_due()) {
            auto until = std::chrono::ceil<std::chrono::milliseconds>(*next - clock_.now());
            wait = std::clamp(until, std::chrono::milliseconds::zero(), max_wait);
        }

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, wait, [this] { return kicked_; });
        kicked_ = false;
    }
}

// ── Accessors ────────────────────────────────

std::optional<PlacementStatus> PlacementController::status(const PlacementId& id) const {
    std::lock_guard lock(status_mutex_);
    auto it = statuses_.find(id);
    if (it == statuses_.end()) return std::nullopt;
    return it->second;
}

std::vector<PlacementId> PlacementController::known_placements() const {
    std::lock_guard lock(status_mutex_);
    std::vector<PlacementId> ids;
    ids.reserve(statuses_.size());
    for (const auto& [id, status] : statuses_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace placement_engine
