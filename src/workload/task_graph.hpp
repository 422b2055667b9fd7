/**
 * @file task_graph.hpp
 * @brief Dependency graph of delegated tasks and its wave partition.
 * @author Dimitris Kafetzis
 *
 * Models a delegation session as a DAG where nodes are tasks and edges are
 * "must complete before" dependencies. Construction validates the graph
 * (unknown dependencies, duplicates, cycles) and partitions it into waves:
 * every task sits in the earliest wave its dependencies permit, so tasks
 * sharing a wave are mutually independent and expected to run concurrently.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wave_delegator {

/**
 * @brief Declaration of one unit of work, as read from a task specification.
 */
struct TaskSpec {
    TaskId id;
    WorkerType worker_type = WorkerType::General;
    std::string description;
    std::vector<TaskId> dependencies;

    bool operator==(const TaskSpec&) const = default;
};

/**
 * @brief A single task node in the graph together with its runtime state.
 */
struct Task {
    TaskId id;
    std::string description;
    WorkerType worker_type = WorkerType::General;
    std::vector<TaskId> dependencies;
    TaskStatus status = TaskStatus::Pending;
    std::optional<AgentTaskId> handle_ref;      ///< Lookup only, not ownership
    std::optional<SteadyTime> spawn_time;       ///< Set once, on spawn
    std::optional<std::string> failure_reason;
    std::optional<TaskId> failed_dependency;    ///< Set only by cascading failure
};

/**
 * @brief Immutable-after-construction DAG with mutable per-task status.
 *
 * Not internally synchronized: the owner (DelegationEnforcer) serializes
 * access.
 */
class TaskGraph {
public:
    /**
     * @brief Validate specs and compute the wave partition.
     *
     * Fails with ErrorCode::DuplicateTask, ErrorCode::UnknownDependency or
     * ErrorCode::Cycle.
     */
    [[nodiscard]] static Result<TaskGraph> build(std::vector<TaskSpec> specs);

    // ── Queries ───────────────────────────────
    [[nodiscard]] const std::vector<std::vector<TaskId>>& waves() const noexcept { return waves_; }
    [[nodiscard]] size_t wave_count() const noexcept { return waves_.size(); }
    [[nodiscard]] std::optional<size_t> wave_of(const TaskId& id) const;
    [[nodiscard]] size_t task_count() const noexcept { return tasks_.size(); }
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] std::optional<Task> get_task(const TaskId& id) const;
    [[nodiscard]] const std::vector<TaskId>& task_ids() const noexcept { return order_; }
    [[nodiscard]] std::vector<TaskId> dependents(const TaskId& id) const;

    /// Pending tasks of the given wave.
    [[nodiscard]] std::vector<TaskId> get_ready_tasks(size_t wave_index) const;

    /// Pending tasks whose dependencies have all completed, regardless of wave.
    [[nodiscard]] std::vector<TaskId> ready_tasks() const;

    [[nodiscard]] bool is_wave_terminal(size_t wave_index) const;
    [[nodiscard]] bool all_terminal() const;

    // ── State Updates ─────────────────────────
    Result<void> mark_spawned(const TaskId& id, SteadyTime spawn_time);
    Result<void> link_handle(const TaskId& id, const AgentTaskId& agent_task_id);
    Result<void> mark_running(const TaskId& id);
    Result<void> mark_completed(const TaskId& id);
    Result<void> mark_failed(const TaskId& id, std::optional<std::string> reason = std::nullopt);

    /**
     * @brief Fail every pending transitive dependent of @p id.
     * @return Ids of the tasks that were transitioned, in wave order.
     */
    std::vector<TaskId> fail_dependents(const TaskId& id);

private:
    TaskGraph() = default;

    Result<void> compute_waves();
    [[nodiscard]] bool has_cycle() const;
    Task* find(const TaskId& id);

    std::unordered_map<TaskId, Task> tasks_;
    std::vector<TaskId> order_;                                      // declaration order
    std::unordered_map<TaskId, std::vector<TaskId>> dependents_;     // forward edges
    std::vector<std::vector<TaskId>> waves_;
    std::unordered_map<TaskId, size_t> wave_index_;
};

}  // namespace wave_delegator
