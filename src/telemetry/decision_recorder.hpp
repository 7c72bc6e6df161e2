/**
 * @file decision_recorder.hpp
 * @brief Structured event collection for scheduling decisions.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/scheduler.hpp"

#include <memory>
#include <mutex>

namespace placement_engine {

/**
 * @brief Records decision events as NDJSON, one object per line.
 *
 * Events: schedule_outcome, cluster_evicted, validation_error,
 * requeue_scheduled.
 */
class DecisionRecorder {
public:
    explicit DecisionRecorder(std::shared_ptr<ILogSink> sink);

    void record_outcome(const ScheduleOutcome& outcome);
    void record_eviction(const PlacementId& placement, const ClusterVerdict& verdict, Timestamp at);
    void record_validation_error(const PlacementId& placement, const Error& error, Timestamp at);
    void record_requeue(const PlacementId& placement, Timestamp ready_at);

    void flush();

private:
    std::shared_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace placement_engine
