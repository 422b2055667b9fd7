/**
 * @file task_graph.cpp
 * @brief TaskGraph implementation: validation, cycle detection, layering.
 * @author Dimitris Kafetzis
 *
 * Uses DFS three-colour cycle detection and a level-synchronous Kahn pass
 * for the earliest-layer wave partition. Both are O(V+E).
 */

#include "workload/task_graph.hpp"

#include <algorithm>
#include <queue>
#include <stack>
#include <unordered_set>

namespace wave_delegator {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<TaskGraph> TaskGraph::build(std::vector<TaskSpec> specs) {
    TaskGraph graph;
    graph.order_.reserve(specs.size());

    for (auto& spec : specs) {
        if (graph.tasks_.contains(spec.id)) {
            return Error{ErrorCode::DuplicateTask, "Duplicate task id: " + spec.id};
        }

        // Repeated dependency ids collapse to one edge
        std::vector<TaskId> deps;
        for (auto& dep : spec.dependencies) {
            if (std::find(deps.begin(), deps.end(), dep) == deps.end()) {
                deps.push_back(std::move(dep));
            }
        }

        graph.order_.push_back(spec.id);
        graph.dependents_[spec.id];
        graph.tasks_.emplace(spec.id, Task{
            .id = spec.id,
            .description = std::move(spec.description),
            .worker_type = spec.worker_type,
            .dependencies = std::move(deps),
        });
    }

    for (const auto& id : graph.order_) {
        for (const auto& dep : graph.tasks_.at(id).dependencies) {
            if (!graph.tasks_.contains(dep)) {
                return Error{ErrorCode::UnknownDependency,
                             "Task '" + id + "' depends on unknown task '" + dep + "'"};
            }
            graph.dependents_[dep].push_back(id);
        }
    }

    if (graph.has_cycle()) {
        return Error{ErrorCode::Cycle, "Task dependencies contain a cycle"};
    }

    if (auto waves = graph.compute_waves(); !waves) {
        return waves.error();
    }

    return Result<TaskGraph>{std::move(graph)};
}

// ─────────────────────────────────────────────
// Cycle Detection (iterative DFS)
// ─────────────────────────────────────────────

bool TaskGraph::has_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;

    for (const auto& id : order_) {
        color[id] = Color::White;
    }

    for (const auto& start_id : order_) {
        if (color[start_id] != Color::White) continue;

        struct Frame {
            TaskId node;
            size_t neighbor_idx;
        };

        std::stack<Frame> dfs_stack;
        dfs_stack.push({start_id, 0});
        color[start_id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.top();

            const auto& next = dependents_.at(node);
            if (idx >= next.size()) {
                color[node] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            const auto& neighbor = next[idx];
            ++idx;

            if (color[neighbor] == Color::Gray) {
                return true;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push({neighbor, 0});
            }
        }
    }

    return false;
}

// ─────────────────────────────────────────────
// Wave Partition (earliest layer)
// ─────────────────────────────────────────────

Result<void> TaskGraph::compute_waves() {
    std::unordered_map<TaskId, size_t> position;
    std::unordered_map<TaskId, size_t> remaining;
    for (size_t i = 0; i < order_.size(); ++i) {
        position[order_[i]] = i;
        remaining[order_[i]] = tasks_.at(order_[i]).dependencies.size();
    }

    std::vector<TaskId> frontier;
    for (const auto& id : order_) {
        if (remaining[id] == 0) frontier.push_back(id);
    }

    size_t placed = 0;
    while (!frontier.empty()) {
        std::sort(frontier.begin(), frontier.end(),
                  [&](const TaskId& a, const TaskId& b) { return position[a] < position[b]; });

        std::vector<TaskId> next;
        for (const auto& id : frontier) {
            wave_index_[id] = waves_.size();
            for (const auto& dependent : dependents_.at(id)) {
                if (--remaining[dependent] == 0) {
                    next.push_back(dependent);
                }
            }
        }

        placed += frontier.size();
        waves_.push_back(std::move(frontier));
        frontier = std::move(next);
    }

    // Cycles are rejected before layering; this only guards the invariant.
    if (placed != tasks_.size()) {
        waves_.clear();
        wave_index_.clear();
        return Error{ErrorCode::Cycle, "Wave partition left tasks unplaced"};
    }
    return {};
}

// ─────────────────────────────────────────────
// Query Methods
// ─────────────────────────────────────────────

std::optional<size_t> TaskGraph::wave_of(const TaskId& id) const {
    auto it = wave_index_.find(id);
    if (it == wave_index_.end()) return std::nullopt;
    return it->second;
}

bool TaskGraph::contains(const TaskId& id) const {
    return tasks_.contains(id);
}

std::optional<Task> TaskGraph::get_task(const TaskId& id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::vector<TaskId> TaskGraph::dependents(const TaskId& id) const {
    auto it = dependents_.find(id);
    if (it == dependents_.end()) return {};
    return it->second;
}

std::vector<TaskId> TaskGraph::get_ready_tasks(size_t wave_index) const {
    std::vector<TaskId> ready;
    if (wave_index >= waves_.size()) return ready;

    for (const auto& id : waves_[wave_index]) {
        if (tasks_.at(id).status == TaskStatus::Pending) {
            ready.push_back(id);
        }
    }
    return ready;
}

std::vector<TaskId> TaskGraph::ready_tasks() const {
    std::vector<TaskId> ready;

    for (const auto& id : order_) {
        const auto& task = tasks_.at(id);
        if (task.status != TaskStatus::Pending) continue;

        bool all_deps_met = std::all_of(
            task.dependencies.begin(), task.dependencies.end(),
            [this](const TaskId& dep) { return tasks_.at(dep).status == TaskStatus::Completed; });

        if (all_deps_met) {
            ready.push_back(id);
        }
    }

    return ready;
}

bool TaskGraph::is_wave_terminal(size_t wave_index) const {
    if (wave_index >= waves_.size()) return true;
    return std::all_of(waves_[wave_index].begin(), waves_[wave_index].end(),
                       [this](const TaskId& id) { return is_terminal(tasks_.at(id).status); });
}

bool TaskGraph::all_terminal() const {
    return std::all_of(tasks_.begin(), tasks_.end(),
                       [](const auto& entry) { return is_terminal(entry.second.status); });
}

// ─────────────────────────────────────────────
// State Updates
// ─────────────────────────────────────────────

Task* TaskGraph::find(const TaskId& id) {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

Result<void> TaskGraph::mark_spawned(const TaskId& id, SteadyTime spawn_time) {
    auto* task = find(id);
    if (!task) return Error{ErrorCode::NotFound, "Unknown task: " + id};
    if (task->status != TaskStatus::Pending) {
        return Error{ErrorCode::InvalidState,
                     "Task '" + id + "' is already " + std::string{to_string(task->status)}};
    }
    task->status = TaskStatus::Spawned;
    task->spawn_time = spawn_time;
    return {};
}

Result<void> TaskGraph::link_handle(const TaskId& id, const AgentTaskId& agent_task_id) {
    auto* task = find(id);
    if (!task) return Error{ErrorCode::NotFound, "Unknown task: " + id};
    task->handle_ref = agent_task_id;
    return {};
}

Result<void> TaskGraph::mark_running(const TaskId& id) {
    auto* task = find(id);
    if (!task) return Error{ErrorCode::NotFound, "Unknown task: " + id};
    if (task->status == TaskStatus::Running || is_terminal(task->status)) return {};
    if (task->status != TaskStatus::Spawned) {
        return Error{ErrorCode::InvalidState, "Task '" + id + "' has not been spawned"};
    }
    task->status = TaskStatus::Running;
    return {};
}

Result<void> TaskGraph::mark_completed(const TaskId& id) {
    auto* task = find(id);
    if (!task) return Error{ErrorCode::NotFound, "Unknown task: " + id};
    if (is_terminal(task->status)) return {};  // duplicate notification
    task->status = TaskStatus::Completed;
    return {};
}

Result<void> TaskGraph::mark_failed(const TaskId& id, std::optional<std::string> reason) {
    auto* task = find(id);
    if (!task) return Error{ErrorCode::NotFound, "Unknown task: " + id};
    if (is_terminal(task->status)) return {};
    task->status = TaskStatus::Failed;
    task->failure_reason = std::move(reason);
    return {};
}

std::vector<TaskId> TaskGraph::fail_dependents(const TaskId& id) {
    std::vector<TaskId> failed;
    if (!tasks_.contains(id)) return failed;

    std::queue<std::pair<TaskId, TaskId>> pending;   // (task, failed prerequisite)
    for (const auto& dependent : dependents_.at(id)) {
        pending.emplace(dependent, id);
    }

    while (!pending.empty()) {
        auto [current, cause] = pending.front();
        pending.pop();

        auto& task = tasks_.at(current);
        if (task.status != TaskStatus::Pending) continue;

        task.status = TaskStatus::Failed;
        task.failure_reason = "dependency failed: " + cause;
        task.failed_dependency = cause;
        failed.push_back(current);

        for (const auto& dependent : dependents_.at(current)) {
            pending.emplace(dependent, current);
        }
    }

    std::stable_sort(failed.begin(), failed.end(), [this](const TaskId& a, const TaskId& b) {
        return wave_index_.at(a) < wave_index_.at(b);
    });
    return failed;
}

}  // namespace wave_delegator
