/**
 * @file delegation_enforcer.hpp
 * @brief Wave gating and parallel-spawn compliance over one TaskGraph.
 * @author Dimitris Kafetzis
 *
 * The enforcer owns the graph for one orchestration session. It decides
 * whether a task may be spawned now, records when it was spawned, and once
 * every task of the current wave is terminal, judges from the recorded
 * timestamps whether the wave was really issued in parallel before moving
 * on to the next one.
 *
 * State machine:
 *   AWAITING_WAVE_N → (wave N terminal) → WAVE_N_CHECKED → AWAITING_WAVE_N+1
 *   ... → ALL_WAVES_COMPLETE
 * A strict-mode violation parks the enforcer in HALTED instead.
 *
 * All public methods are thread-safe: the caller thread spawning tasks and
 * the lifecycle monitors reporting exits share one internal mutex, held only
 * for the duration of each state mutation.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "workload/task_graph.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wave_delegator {

class EventRecorder;

struct EnforcerOptions {
    Millis parallel_window{500};        ///< Max spawn spread within one wave
    bool strict = true;                 ///< Violation → hard error and halt
    bool cascade_failures = true;       ///< Dependents of failed tasks auto-fail
};

/**
 * @brief Verdict of one wave's parallelism check.
 */
struct ComplianceReport {
    size_t wave_index = 0;
    bool compliant = true;
    Millis spread{0};
    Millis window{0};
    size_t spawned_count = 0;
    std::string detail;
};

struct EnforcementStatus {
    size_t current_wave = 0;            ///< 1-based; total_waves + 1 once complete
    size_t total_waves = 0;
    std::vector<TaskId> current_wave_tasks;
    std::map<TaskId, TaskStatus> task_statuses;
    std::map<TaskId, SteadyTime> spawn_log;
    bool halted = false;
    bool complete = false;
};

class DelegationEnforcer {
public:
    explicit DelegationEnforcer(TaskGraph graph,
                                EnforcerOptions options = {},
                                Logger* logger = nullptr,
                                EventRecorder* recorder = nullptr);

    DelegationEnforcer(const DelegationEnforcer&) = delete;
    DelegationEnforcer& operator=(const DelegationEnforcer&) = delete;

    // ── Spawn Gating ─────────────────────────

    /**
     * @brief Side-effect-free pre-check: may @p task_id be spawned now?
     *
     * Checks, in order: halted, unknown task, task not pending, unmet
     * dependencies, task outside the current wave. Failed prerequisites
     * are reported as ErrorCode::DependencyFailed, everything else as
     * ErrorCode::Validation (ParallelExecution while halted).
     */
    [[nodiscard]] Result<void> validate_spawn(const TaskId& task_id) const;

    /// Record a successful spawn and link the task to its handle.
    Result<void> record_spawn(const TaskId& task_id,
                              const AgentTaskId& agent_task_id,
                              SteadyTime spawned_at = std::chrono::steady_clock::now());

    Result<void> mark_task_running(const TaskId& task_id);

    // ── Wave Progression ─────────────────────

    /**
     * @brief Judge the current wave's spawn spread against the window.
     *
     * In strict mode a violation halts the enforcer and returns
     * ErrorCode::ParallelExecution; otherwise the report comes back with
     * compliant = false.
     */
    Result<ComplianceReport> check_parallel_compliance();

    /**
     * @brief Move past the current wave once every task in it is terminal.
     *
     * Terminal transitions already advance the cursor, so by the time a
     * caller could see a finished wave it has moved on. An explicit call
     * therefore only reports WaveIncomplete, InvalidState after the last
     * wave, or the halt error; do not rely on it to move the cursor.
     */
    Result<void> advance_wave();

    /// Terminal transitions; the wave advances automatically once it is done.
    Result<void> mark_task_completed(const TaskId& task_id);
    Result<void> mark_task_failed(const TaskId& task_id,
                                  std::optional<std::string> reason = std::nullopt);

    // ── Queries ──────────────────────────────
    [[nodiscard]] std::vector<TaskId> get_current_wave() const;
    /// Pending tasks of the current wave whose dependencies all completed.
    [[nodiscard]] std::vector<TaskId> get_ready_tasks() const;
    [[nodiscard]] size_t current_wave_index() const;
    [[nodiscard]] size_t wave_count() const;
    [[nodiscard]] bool is_complete() const;
    [[nodiscard]] bool is_halted() const;
    [[nodiscard]] std::optional<Task> get_task(const TaskId& task_id) const;
    [[nodiscard]] std::vector<TaskId> task_ids() const;
    [[nodiscard]] std::optional<ComplianceReport> last_compliance() const;
    [[nodiscard]] std::vector<ComplianceReport> compliance_history() const;
    [[nodiscard]] EnforcementStatus status() const;

    [[nodiscard]] const EnforcerOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] Result<void> validate_locked(const TaskId& task_id) const;
    Result<ComplianceReport> check_compliance_locked();
    void record_compliance_locked(const ComplianceReport& report);
    Result<void> advance_locked();
    Result<void> auto_advance_locked();
    [[nodiscard]] bool complete_locked() const noexcept;
    void log(LogLevel level, std::string_view message) const;

    mutable std::mutex mutex_;
    TaskGraph graph_;
    EnforcerOptions options_;
    Logger* logger_;
    EventRecorder* recorder_;

    size_t current_wave_ = 0;
    std::unordered_map<TaskId, SteadyTime> spawn_log_;
    std::vector<ComplianceReport> compliance_history_;
    std::optional<Error> halt_error_;
};

}  // namespace wave_delegator
