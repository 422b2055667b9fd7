/**
 * @file session.cpp
 * @brief spawn_task() and OrchestrationSession implementation.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/session.hpp"
#include "telemetry/event_recorder.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace wave_delegator {

// ─────────────────────────────────────────────
// Free Entry Point
// ─────────────────────────────────────────────

Result<AgentTaskId> spawn_task(ProcessLifecycleManager& manager,
                               const TaskId& task_id,
                               WorkerType worker_type,
                               std::string payload,
                               DelegationEnforcer* enforcer,
                               SpawnOptions options) {
    if (enforcer) {
        if (auto valid = enforcer->validate_spawn(task_id); !valid) {
            return valid.error();
        }
    }

    if (!options.task_id) options.task_id = task_id;

    auto agent = manager.spawn(worker_type, std::move(payload), std::move(options));
    if (!agent) {
        return agent.error();
    }

    if (enforcer) {
        auto recorded = enforcer->record_spawn(task_id, *agent, std::chrono::steady_clock::now());
        if (!recorded) {
            // Lost a race with another spawn of the same task
            manager.cancel(*agent);
            return recorded.error();
        }
    }
    return agent;
}

// ─────────────────────────────────────────────
// Shared Session State
// ─────────────────────────────────────────────

/**
 * @brief State reachable from exit callbacks.
 *
 * Monitors hold only a weak reference, so a session that is gone simply
 * stops receiving exits.
 */
struct OrchestrationSession::State {
    std::unique_ptr<DelegationEnforcer> enforcer;
    Logger* logger = nullptr;

    mutable std::mutex mutex;
    std::condition_variable changed;
    std::unordered_set<TaskId> in_flight;                  // spawned, not yet recorded
    std::unordered_map<TaskId, HandleSnapshot> early_exits;
    std::vector<AgentTaskId> agents;
    std::optional<Error> last_error;
    bool stopped = false;

    void on_exit(const TaskId& task_id, const HandleSnapshot& snap) {
        {
            std::lock_guard lock(mutex);
            if (in_flight.contains(task_id)) {
                early_exits.insert_or_assign(task_id, snap);
                return;
            }
        }
        forward_exit(task_id, snap);
    }

    void forward_exit(const TaskId& task_id, const HandleSnapshot& snap) {
        auto task = enforcer->get_task(task_id);
        if (!task || task->handle_ref != snap.agent_task_id) {
            if (logger) {
                logger->debug("Ignoring exit of " + snap.agent_task_id
                              + ": not the recorded worker of task '" + task_id + "'");
            }
            return;
        }

        Result<void> forwarded;
        switch (snap.status) {
            case ProcessStatus::Completed:
                forwarded = enforcer->mark_task_completed(task_id);
                break;
            case ProcessStatus::Cancelled:
                forwarded = enforcer->mark_task_failed(task_id, "worker cancelled");
                break;
            case ProcessStatus::Failed:
                forwarded = enforcer->mark_task_failed(
                    task_id, snap.exit_code
                        ? "worker exited with code " + std::to_string(*snap.exit_code)
                        : std::string{"worker exited abnormally"});
                break;
            case ProcessStatus::Running:
                return;
        }

        {
            std::lock_guard lock(mutex);
            if (!forwarded) last_error = forwarded.error();
        }
        if (!forwarded && logger) {
            logger->error("Exit of task '" + task_id + "' raised: " + forwarded.error().message);
        }
        changed.notify_all();
    }
};

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

OrchestrationSession::OrchestrationSession(ProcessLifecycleManager& manager, Logger* logger)
    : manager_(manager)
    , logger_(logger)
    , state_(std::make_shared<State>()) {
    state_->logger = logger;
}

OrchestrationSession::OrchestrationSession(ProcessLifecycleManager& manager,
                                           TaskGraph graph,
                                           EnforcerOptions options,
                                           Logger* logger,
                                           EventRecorder* recorder)
    : OrchestrationSession(manager, logger) {
    state_->enforcer = std::make_unique<DelegationEnforcer>(
        std::move(graph), options, logger, recorder);
}

bool OrchestrationSession::has_enforcer() const noexcept {
    return state_->enforcer != nullptr;
}

DelegationEnforcer* OrchestrationSession::enforcer() noexcept {
    return state_->enforcer.get();
}

const DelegationEnforcer* OrchestrationSession::enforcer() const noexcept {
    return state_->enforcer.get();
}

// ─────────────────────────────────────────────
// Spawning
// ─────────────────────────────────────────────

Result<AgentTaskId> OrchestrationSession::spawn_task(const TaskId& task_id,
                                                     WorkerType worker_type,
                                                     std::string payload) {
    auto* enforcer = state_->enforcer.get();

    SpawnOptions options;
    options.task_id = task_id;

    if (stop_requested()) {
        return Error{ErrorCode::InvalidState,
                     "Session stopped; not spawning task '" + task_id + "'"};
    }

    if (!enforcer) {
        options.description = task_id;
        auto agent = wave_delegator::spawn_task(manager_, task_id, worker_type,
                                                std::move(payload), nullptr, std::move(options));
        if (agent && !track_agent(*agent)) {
            return Error{ErrorCode::InvalidState,
                         "Session stopped while spawning task '" + task_id + "'"};
        }
        return agent;
    }

    if (auto task = enforcer->get_task(task_id); task && !task->description.empty()) {
        options.description = task->description;
    }

    std::weak_ptr<State> weak = state_;
    options.on_exit = [weak, task_id](const HandleSnapshot& snap) {
        if (auto state = weak.lock()) state->on_exit(task_id, snap);
    };

    {
        std::lock_guard lock(state_->mutex);
        state_->in_flight.insert(task_id);
    }

    auto agent = wave_delegator::spawn_task(manager_, task_id, worker_type,
                                            std::move(payload), enforcer, std::move(options));

    std::optional<HandleSnapshot> early_exit;
    bool stopped = false;
    {
        std::lock_guard lock(state_->mutex);
        state_->in_flight.erase(task_id);
        if (auto it = state_->early_exits.find(task_id); it != state_->early_exits.end()) {
            early_exit = std::move(it->second);
            state_->early_exits.erase(it);
        }
        if (agent) state_->agents.push_back(*agent);
        stopped = state_->stopped;
    }

    // request_stop() may have run while this spawn was in progress
    if (agent && stopped) {
        manager_.cancel(*agent);
    }

    if (!agent) {
        log(LogLevel::Warn, "spawn_task('" + task_id + "') rejected: " + agent.error().message);
        return agent;
    }

    if (early_exit) {
        state_->forward_exit(task_id, *early_exit);
    } else if (auto running = enforcer->mark_task_running(task_id); !running) {
        log(LogLevel::Warn, running.error().message);
    }
    return agent;
}

Result<std::vector<AgentTaskId>> OrchestrationSession::spawn_ready_wave(const PayloadFn& payload_fn) {
    auto* enforcer = state_->enforcer.get();
    if (!enforcer) {
        return Error{ErrorCode::InvalidState, "spawn_ready_wave requires a task graph"};
    }

    // Build every payload first so the spawns themselves go out back to back
    std::vector<std::pair<Task, std::string>> batch;
    for (const auto& id : enforcer->get_ready_tasks()) {
        if (auto task = enforcer->get_task(id)) {
            auto payload = payload_fn(*task);
            batch.emplace_back(std::move(*task), std::move(payload));
        }
    }

    std::vector<AgentTaskId> agents;
    agents.reserve(batch.size());
    for (auto& [task, payload] : batch) {
        auto agent = spawn_task(task.id, task.worker_type, std::move(payload));
        if (!agent) {
            return agent.error();
        }
        agents.push_back(std::move(*agent));
    }

    if (!agents.empty()) {
        log(LogLevel::Info, "Spawned " + std::to_string(agents.size()) + " task(s) of wave "
                            + std::to_string(enforcer->current_wave_index() + 1));
    }
    return agents;
}

// ─────────────────────────────────────────────
// Driving a Whole Graph
// ─────────────────────────────────────────────

Result<SessionReport> OrchestrationSession::run_to_completion(const PayloadFn& payload_fn,
                                                              std::optional<Millis> timeout) {
    auto* enforcer = state_->enforcer.get();
    if (!enforcer) {
        return Error{ErrorCode::InvalidState, "run_to_completion requires a task graph"};
    }

    const auto start = std::chrono::steady_clock::now();
    std::optional<SteadyTime> deadline;
    if (timeout) deadline = start + *timeout;

    std::optional<Error> failure;

    while (!enforcer->is_complete()) {
        if (stop_requested()) {
            failure = Error{ErrorCode::Generic, "Session stopped"};
            break;
        }
        if (enforcer->is_halted()) {
            failure = last_error();
            if (!failure || !failure->is(ErrorCode::ParallelExecution)) {
                auto report = enforcer->last_compliance();
                failure = Error{ErrorCode::ParallelExecution,
                                report ? report->detail : std::string{"enforcement halted"}};
            }
            break;
        }

        const size_t wave = enforcer->current_wave_index();
        auto spawned = spawn_ready_wave(payload_fn);
        if (!spawned) {
            failure = spawned.error();
            break;
        }

        if (spawned->empty()) {
            auto status = enforcer->status();
            bool in_progress = std::any_of(
                status.current_wave_tasks.begin(), status.current_wave_tasks.end(),
                [&](const TaskId& id) {
                    auto s = status.task_statuses.at(id);
                    return s == TaskStatus::Spawned || s == TaskStatus::Running;
                });
            if (!in_progress && !status.complete && !status.halted
                && status.current_wave == wave + 1) {
                failure = Error{ErrorCode::DependencyFailed,
                                "Wave " + std::to_string(wave + 1) + " has no spawnable tasks"};
                break;
            }
        }

        std::unique_lock lock(state_->mutex);
        auto wave_done = [&] {
            return state_->stopped
                || enforcer->current_wave_index() != wave
                || enforcer->is_complete()
                || enforcer->is_halted();
        };
        if (deadline) {
            if (!state_->changed.wait_until(lock, *deadline, wave_done)) {
                lock.unlock();
                failure = Error{ErrorCode::Generic,
                                "Session timed out after " + std::to_string(timeout->count()) + "ms"};
                for (const auto& agent : spawned_agents()) {
                    manager_.cancel(agent);
                }
                break;
            }
        } else {
            state_->changed.wait(lock, wave_done);
        }
    }

    auto elapsed = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
    auto report = build_report(std::move(failure), elapsed);

    log(report.success ? LogLevel::Info : LogLevel::Error,
        std::string{"Session finished "} + (report.success ? "successfully" : "with failures")
        + " in " + std::to_string(elapsed.count()) + "ms"
        + (report.error ? ": " + report.error->message : std::string{}));
    return report;
}

SessionReport OrchestrationSession::build_report(std::optional<Error> error, Millis elapsed) const {
    const auto* enforcer = state_->enforcer.get();

    SessionReport report;
    report.error = std::move(error);
    report.elapsed = elapsed;
    report.compliance = enforcer->compliance_history();

    bool all_completed = true;
    for (const auto& id : enforcer->task_ids()) {
        auto task = enforcer->get_task(id);
        TaskOutcome outcome{
            .task_id = id,
            .status = task->status,
            .agent_task_id = task->handle_ref,
            .failure_reason = task->failure_reason
        };
        if (task->handle_ref) {
            if (auto handle = manager_.get_handle(*task->handle_ref)) {
                outcome.exit_code = handle->exit_code;
                outcome.output = std::move(handle->output);
            }
        }
        all_completed = all_completed && task->status == TaskStatus::Completed;
        report.outcomes.push_back(std::move(outcome));
    }

    report.success = all_completed && !report.error && !enforcer->is_halted();
    return report;
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

void OrchestrationSession::request_stop() {
    std::vector<AgentTaskId> agents;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->stopped) return;
        state_->stopped = true;
        agents = state_->agents;
    }
    state_->changed.notify_all();

    log(LogLevel::Warn, "Session stop requested; cancelling "
                        + std::to_string(agents.size()) + " worker(s)");
    for (const auto& agent : agents) {
        manager_.cancel(agent);
    }
}

bool OrchestrationSession::stop_requested() const {
    std::lock_guard lock(state_->mutex);
    return state_->stopped;
}

bool OrchestrationSession::track_agent(const AgentTaskId& agent) {
    bool stopped = false;
    {
        std::lock_guard lock(state_->mutex);
        state_->agents.push_back(agent);
        stopped = state_->stopped;
    }
    if (stopped) manager_.cancel(agent);
    return !stopped;
}

std::optional<Error> OrchestrationSession::last_error() const {
    std::lock_guard lock(state_->mutex);
    return state_->last_error;
}

std::vector<AgentTaskId> OrchestrationSession::spawned_agents() const {
    std::lock_guard lock(state_->mutex);
    return state_->agents;
}

void OrchestrationSession::log(LogLevel level, std::string_view message) const {
    if (logger_) logger_->log(level, message);
}

}  // namespace wave_delegator
