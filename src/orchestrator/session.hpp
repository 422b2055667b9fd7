/**
 * @file session.hpp
 * @brief Orchestration entry point: the one place where spawn gating and
 *        process launching meet.
 * @author Dimitris Kafetzis
 *
 * spawn_task() is the free-standing entry point. It checks the optional
 * enforcer before launching and records the spawn afterwards.
 *
 * OrchestrationSession scopes an enforcer to one session (there is no
 * process-wide "current enforcer") and wires process exits back into it,
 * so waves advance on their own as workers finish.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "enforcer/delegation_enforcer.hpp"
#include "process/lifecycle_manager.hpp"
#include "workload/task_graph.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wave_delegator {

class EventRecorder;

/**
 * @brief Validate (when @p enforcer is given), spawn, then record the spawn.
 *
 * A validation failure returns before the lifecycle manager is touched.
 * Without an enforcer this is an unconstrained spawn. Process exits are not
 * forwarded to the enforcer here; OrchestrationSession does that.
 */
Result<AgentTaskId> spawn_task(ProcessLifecycleManager& manager,
                               const TaskId& task_id,
                               WorkerType worker_type,
                               std::string payload,
                               DelegationEnforcer* enforcer = nullptr,
                               SpawnOptions options = {});

/// Builds the payload handed to a task's worker.
using PayloadFn = std::function<std::string(const Task&)>;

struct TaskOutcome {
    TaskId task_id;
    TaskStatus status = TaskStatus::Pending;
    std::optional<AgentTaskId> agent_task_id;
    std::optional<int> exit_code;
    std::string output;
    std::optional<std::string> failure_reason;
};

struct SessionReport {
    bool success = false;                   ///< Every task completed, no violation
    std::vector<TaskOutcome> outcomes;      ///< Declaration order
    std::vector<ComplianceReport> compliance;
    std::optional<Error> error;
    Millis elapsed{0};
};

class OrchestrationSession {
public:
    /// Ad-hoc session: spawns are unconstrained.
    explicit OrchestrationSession(ProcessLifecycleManager& manager,
                                  Logger* logger = nullptr);

    /// Graph-tracked session owning its DelegationEnforcer.
    OrchestrationSession(ProcessLifecycleManager& manager,
                         TaskGraph graph,
                         EnforcerOptions options,
                         Logger* logger = nullptr,
                         EventRecorder* recorder = nullptr);

    OrchestrationSession(const OrchestrationSession&) = delete;
    OrchestrationSession& operator=(const OrchestrationSession&) = delete;

    Result<AgentTaskId> spawn_task(const TaskId& task_id,
                                   WorkerType worker_type,
                                   std::string payload);

    /// Spawn every ready task of the current wave in one burst.
    Result<std::vector<AgentTaskId>> spawn_ready_wave(const PayloadFn& payload_fn);

    /**
     * @brief Drive every wave: spawn, wait for the wave to finish, repeat.
     *
     * Stops early on a strict-mode violation, a spawn failure, a wave with
     * nothing spawnable, request_stop(), or @p timeout (which cancels the
     * session's running workers).
     */
    Result<SessionReport> run_to_completion(const PayloadFn& payload_fn,
                                            std::optional<Millis> timeout = std::nullopt);

    /**
     * @brief Stop the session: no further spawns, running workers cancelled.
     *
     * run_to_completion() returns at its next check with a "Session stopped"
     * error. Safe to call from any thread, including a signal watcher.
     */
    void request_stop();
    [[nodiscard]] bool stop_requested() const;

    [[nodiscard]] bool has_enforcer() const noexcept;
    [[nodiscard]] DelegationEnforcer* enforcer() noexcept;
    [[nodiscard]] const DelegationEnforcer* enforcer() const noexcept;
    [[nodiscard]] ProcessLifecycleManager& manager() noexcept { return manager_; }

    /// Most recent error raised while forwarding a process exit.
    [[nodiscard]] std::optional<Error> last_error() const;

    /// Agent ids spawned through this session, in spawn order.
    [[nodiscard]] std::vector<AgentTaskId> spawned_agents() const;

private:
    struct State;

    SessionReport build_report(std::optional<Error> error, Millis elapsed) const;
    /// Record an ad-hoc spawn; cancels it and returns false if stopped meanwhile.
    bool track_agent(const AgentTaskId& agent);
    void log(LogLevel level, std::string_view message) const;

    ProcessLifecycleManager& manager_;
    Logger* logger_;
    std::shared_ptr<State> state_;
};

}  // namespace wave_delegator
