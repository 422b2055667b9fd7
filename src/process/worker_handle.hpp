/**
 * @file worker_handle.hpp
 * @brief Live-state record of one externally spawned worker process.
 * @author Dimitris Kafetzis
 *
 * A WorkerHandle is written by exactly one monitor thread (output, exit
 * status) plus cancel(), which may flip a running handle to Cancelled.
 * Readers take value snapshots. Completion is signalled through a
 * per-handle condition variable, so waiting on one handle never blocks
 * monitors or waiters of other handles.
 */

#pragma once

#include "core/types.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace wave_delegator {

/**
 * @brief Immutable copy of a handle's state at one instant.
 */
struct HandleSnapshot {
    AgentTaskId agent_task_id;
    WorkerType worker_type = WorkerType::General;
    std::string description;
    pid_t process_id = -1;
    ProcessStatus status = ProcessStatus::Running;
    std::string output;
    Timestamp start_time;
    std::optional<Timestamp> end_time;
    std::optional<int> exit_code;
    Millis elapsed{0};
};

class WorkerHandle {
public:
    WorkerHandle(AgentTaskId agent_task_id,
                 WorkerType worker_type,
                 std::string description,
                 std::string payload,
                 pid_t process_id);

    WorkerHandle(const WorkerHandle&) = delete;
    WorkerHandle& operator=(const WorkerHandle&) = delete;

    // ── Monitor side ─────────────────────────
    void append_output(std::string_view chunk);

    /**
     * @brief Publish the process exit. A cancelled handle stays Cancelled
     *        but still records the exit code.
     */
    HandleSnapshot finish(ProcessStatus status, std::optional<int> exit_code);

    // ── Caller side ──────────────────────────

    /// Flip Running → Cancelled. Returns false if already terminal.
    bool request_cancel();

    /// Time at which cancel was requested, if any.
    [[nodiscard]] std::optional<SteadyTime> cancel_requested_at() const;

    /// Wait for a terminal status. Returns false on timeout.
    bool wait(std::optional<Millis> timeout) const;

    [[nodiscard]] HandleSnapshot snapshot() const;
    [[nodiscard]] std::string tail(size_t lines) const;
    [[nodiscard]] ProcessStatus status() const;

    [[nodiscard]] const AgentTaskId& agent_task_id() const noexcept { return agent_task_id_; }
    [[nodiscard]] WorkerType worker_type() const noexcept { return worker_type_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] const std::string& payload() const noexcept { return payload_; }
    [[nodiscard]] pid_t process_id() const noexcept { return process_id_; }

private:
    HandleSnapshot snapshot_locked() const;

    const AgentTaskId agent_task_id_;
    const WorkerType worker_type_;
    const std::string description_;
    const std::string payload_;
    const pid_t process_id_;
    const Timestamp start_time_;
    const SteadyTime start_steady_;

    mutable std::mutex mutex_;
    mutable std::condition_variable terminal_cv_;
    ProcessStatus status_{ProcessStatus::Running};
    std::string output_;
    std::optional<Timestamp> end_time_;
    std::optional<SteadyTime> end_steady_;
    std::optional<int> exit_code_;
    std::optional<SteadyTime> cancel_requested_at_;
};

/**
 * @brief Last @p lines lines of @p text (a trailing newline does not count
 *        as an empty line).
 */
[[nodiscard]] std::string tail_lines(std::string_view text, size_t lines);

}  // namespace wave_delegator
