/**
 * @file event_recorder.cpp
 * @brief EventRecorder implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/event_recorder.hpp"
#include "process/worker_handle.hpp"

#include <sstream>

namespace wave_delegator {

EventRecorder::EventRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void EventRecorder::record_spawn(const AgentTaskId& agent_task_id, WorkerType type,
                                 const std::optional<TaskId>& task_id) {
    std::ostringstream oss;
    oss << R"({"event":"task_spawned")"
        << R"(,"agent_task_id":")" << json_escape(agent_task_id) << "\""
        << R"(,"worker_type":")" << to_string(type) << "\"";
    if (task_id) {
        oss << R"(,"task":")" << json_escape(*task_id) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void EventRecorder::record_process_exit(const HandleSnapshot& handle) {
    std::ostringstream oss;
    oss << R"({"event":"process_exit")"
        << R"(,"agent_task_id":")" << json_escape(handle.agent_task_id) << "\""
        << R"(,"status":")" << to_string(handle.status) << "\""
        << R"(,"exit_code":)" << (handle.exit_code ? std::to_string(*handle.exit_code) : "null")
        << R"(,"elapsed_ms":)" << handle.elapsed.count()
        << R"(,"output_bytes":)" << handle.output.size()
        << "}";
    emit(oss.str());
}

void EventRecorder::record_wave_check(size_t wave_index, Millis spread, Millis window,
                                      bool compliant) {
    std::ostringstream oss;
    oss << R"({"event":"wave_checked")"
        << R"(,"wave":)" << wave_index
        << R"(,"spread_ms":)" << spread.count()
        << R"(,"window_ms":)" << window.count()
        << R"(,"compliant":)" << (compliant ? "true" : "false")
        << "}";
    emit(oss.str());
}

void EventRecorder::record_wave_advanced(size_t from_wave, size_t to_wave) {
    std::ostringstream oss;
    oss << R"({"event":"wave_advanced")"
        << R"(,"from":)" << from_wave
        << R"(,"to":)" << to_wave
        << "}";
    emit(oss.str());
}

void EventRecorder::record_cascade_failure(const TaskId& task_id, const TaskId& cause) {
    std::ostringstream oss;
    oss << R"({"event":"task_cascade_failed")"
        << R"(,"task":")" << json_escape(task_id) << "\""
        << R"(,"cause":")" << json_escape(cause) << "\""
        << "}";
    emit(oss.str());
}

void EventRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void EventRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace wave_delegator
