/**
 * @file event_recorder.hpp
 * @brief Structured delegation events for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace wave_delegator {

struct HandleSnapshot;

/**
 * @brief Collects and logs structured delegation events as NDJSON.
 */
class EventRecorder {
public:
    explicit EventRecorder(std::unique_ptr<ILogSink> sink);

    void record_spawn(const AgentTaskId& agent_task_id, WorkerType type,
                      const std::optional<TaskId>& task_id);
    void record_process_exit(const HandleSnapshot& handle);
    void record_wave_check(size_t wave_index, Millis spread, Millis window, bool compliant);
    void record_wave_advanced(size_t from_wave, size_t to_wave);
    void record_cascade_failure(const TaskId& task_id, const TaskId& cause);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace wave_delegator
