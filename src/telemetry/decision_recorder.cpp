/**
 * @file decision_recorder.cpp
 * @brief DecisionRecorder implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/decision_recorder.hpp"

#include <sstream>

namespace placement_engine {

namespace {

void write_id_array(std::ostringstream& oss, const std::vector<ClusterId>& ids) {
    oss << '[';
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ',';
        oss << '"' << json_escape(ids[i]) << '"';
    }
    oss << ']';
}

}  // namespace

DecisionRecorder::DecisionRecorder(std::shared_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void DecisionRecorder::record_outcome(const ScheduleOutcome& outcome) {
    std::ostringstream oss;
    oss << R"({"event":"schedule_outcome")"
        << R"(,"placement":")" << json_escape(outcome.placement) << "\""
        << R"(,"at_ms":)" << to_unix_millis(outcome.evaluated_at)
        << R"(,"admitted":)";
    write_id_array(oss, outcome.admitted);
    oss << R"(,"rejected":)";
    write_id_array(oss, outcome.rejected);
    oss << R"(,"requeue":)" << (outcome.requeue ? "true" : "false");
    if (outcome.requeue) {
        oss << R"(,"requeue_after_ms":)" << outcome.requeue_after.count();
    }
    oss << "}";
    emit(oss.str());
}

void DecisionRecorder::record_eviction(const PlacementId& placement,
                                       const ClusterVerdict& verdict,
                                       Timestamp at) {
    std::ostringstream oss;
    oss << R"({"event":"cluster_evicted")"
        << R"(,"placement":")" << json_escape(placement) << "\""
        << R"(,"cluster":")" << json_escape(verdict.cluster) << "\""
        << R"(,"reason":")" << to_string(verdict.reason) << "\""
        << R"(,"taint":")" << json_escape(verdict.taint) << "\""
        << R"(,"at_ms":)" << to_unix_millis(at)
        << "}";
    emit(oss.str());
}

void DecisionRecorder::record_validation_error(const PlacementId& placement,
                                               const Error& error,
                                               Timestamp at) {
    std::ostringstream oss;
    oss << R"({"event":"validation_error")"
        << R"(,"placement":")" << json_escape(placement) << "\""
        << R"(,"code":")" << to_string(error.code) << "\""
        << R"(,"message":")" << json_escape(error.message) << "\""
        << R"(,"at_ms":)" << to_unix_millis(at)
        << "}";
    emit(oss.str());
}

void DecisionRecorder::record_requeue(const PlacementId& placement, Timestamp ready_at) {
    std::ostringstream oss;
    oss << R"({"event":"requeue_scheduled")"
        << R"(,"placement":")" << json_escape(placement) << "\""
        << R"(,"ready_at_ms":)" << to_unix_millis(ready_at)
        << "}";
    emit(oss.str());
}

void DecisionRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void DecisionRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace placement_engine
