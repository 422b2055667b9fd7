/**
 * @file delegation_enforcer.cpp
 * @brief DelegationEnforcer implementation.
 * @author Dimitris Kafetzis
 */

#include "enforcer/delegation_enforcer.hpp"
#include "telemetry/event_recorder.hpp"

#include <algorithm>

namespace wave_delegator {

namespace {

std::string join_ids(const std::vector<TaskId>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ", ";
        joined += id;
    }
    return joined;
}

bool is_cascade_failure(const Task& task) {
    return task.status == TaskStatus::Failed && task.failed_dependency.has_value();
}

}  // anonymous namespace

DelegationEnforcer::DelegationEnforcer(TaskGraph graph,
                                       EnforcerOptions options,
                                       Logger* logger,
                                       EventRecorder* recorder)
    : graph_(std::move(graph))
    , options_(options)
    , logger_(logger)
    , recorder_(recorder) {}

// ─────────────────────────────────────────────
// Spawn Gating
// ─────────────────────────────────────────────

Result<void> DelegationEnforcer::validate_spawn(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    return validate_locked(task_id);
}

Result<void> DelegationEnforcer::validate_locked(const TaskId& task_id) const {
    if (halt_error_) {
        return Error{ErrorCode::ParallelExecution,
                     "Enforcement halted: " + halt_error_->message};
    }

    auto task = graph_.get_task(task_id);
    if (!task) {
        return Error{ErrorCode::Validation, "Unknown task: " + task_id};
    }

    if (task->status != TaskStatus::Pending) {
        if (is_cascade_failure(*task)) {
            return Error{ErrorCode::DependencyFailed,
                         "Task '" + task_id + "' cannot run: dependency failed: "
                         + *task->failed_dependency};
        }
        return Error{ErrorCode::Validation,
                     "Task '" + task_id + "' is already " + std::string{to_string(task->status)}};
    }

    std::vector<TaskId> unmet;
    std::vector<TaskId> failed;
    for (const auto& dep : task->dependencies) {
        auto dep_status = graph_.get_task(dep)->status;
        if (dep_status == TaskStatus::Failed) {
            failed.push_back(dep);
        } else if (dep_status != TaskStatus::Completed) {
            unmet.push_back(dep);
        }
    }
    if (!failed.empty()) {
        return Error{ErrorCode::DependencyFailed,
                     "Task '" + task_id + "' has failed dependencies: " + join_ids(failed)};
    }
    if (!unmet.empty()) {
        return Error{ErrorCode::Validation,
                     "Task '" + task_id + "' has unmet dependencies: " + join_ids(unmet)};
    }

    auto wave = graph_.wave_of(task_id).value_or(0);
    if (wave != current_wave_) {
        return Error{ErrorCode::Validation,
                     "Task '" + task_id + "' is not in the current wave (task wave "
                     + std::to_string(wave + 1) + ", current wave "
                     + std::to_string(current_wave_ + 1) + ")"};
    }
    return {};
}

Result<void> DelegationEnforcer::record_spawn(const TaskId& task_id,
                                              const AgentTaskId& agent_task_id,
                                              SteadyTime spawned_at) {
    std::lock_guard lock(mutex_);

    if (auto r = graph_.mark_spawned(task_id, spawned_at); !r) {
        return r.error();
    }
    if (auto r = graph_.link_handle(task_id, agent_task_id); !r) {
        return r.error();
    }
    spawn_log_[task_id] = spawned_at;

    log(LogLevel::Debug, "Recorded spawn of task '" + task_id + "' as " + agent_task_id);
    return {};
}

Result<void> DelegationEnforcer::mark_task_running(const TaskId& task_id) {
    std::lock_guard lock(mutex_);
    return graph_.mark_running(task_id);
}

// ─────────────────────────────────────────────
// Compliance
// ─────────────────────────────────────────────

Result<ComplianceReport> DelegationEnforcer::check_parallel_compliance() {
    std::lock_guard lock(mutex_);
    return check_compliance_locked();
}

Result<ComplianceReport> DelegationEnforcer::check_compliance_locked() {
    if (complete_locked()) {
        return Error{ErrorCode::InvalidState, "All waves are complete"};
    }

    const auto& wave = graph_.waves()[current_wave_];

    ComplianceReport report;
    report.wave_index = current_wave_;
    report.window = options_.parallel_window;

    std::optional<SteadyTime> earliest;
    std::optional<SteadyTime> latest;
    for (const auto& id : wave) {
        auto it = spawn_log_.find(id);
        if (it == spawn_log_.end()) continue;
        ++report.spawned_count;
        if (!earliest || it->second < *earliest) earliest = it->second;
        if (!latest || it->second > *latest) latest = it->second;
    }

    // Fewer than two spawns leave no parallelism to violate
    if (wave.size() <= 1 || report.spawned_count <= 1) {
        report.detail = wave.size() <= 1
            ? "Wave " + std::to_string(current_wave_ + 1) + " trivially compliant"
            : "Wave " + std::to_string(current_wave_ + 1) + ": only "
              + std::to_string(report.spawned_count) + " of " + std::to_string(wave.size())
              + " tasks spawned, spread not measured";
        record_compliance_locked(report);
        if (recorder_) {
            recorder_->record_wave_check(current_wave_, report.spread, report.window, true);
        }
        return report;
    }

    auto raw_spread = *latest - *earliest;
    report.spread = std::chrono::duration_cast<Millis>(raw_spread);
    report.compliant = raw_spread <= options_.parallel_window;
    report.detail = "spread " + std::to_string(report.spread.count()) + "ms "
                  + (report.compliant ? "within" : "exceeds")
                  + " parallel window " + std::to_string(report.window.count()) + "ms";

    record_compliance_locked(report);
    if (recorder_) {
        recorder_->record_wave_check(current_wave_, report.spread, report.window, report.compliant);
    }

    if (report.compliant) {
        log(LogLevel::Debug, "Wave " + std::to_string(current_wave_ + 1) + ": " + report.detail);
        return report;
    }

    std::string message = "Wave " + std::to_string(current_wave_ + 1)
                        + " tasks were not spawned in parallel: " + report.detail;
    if (options_.strict) {
        halt_error_ = Error{ErrorCode::ParallelExecution, message};
        log(LogLevel::Error, message);
        return *halt_error_;
    }

    log(LogLevel::Warn, message);
    return report;
}

/// Keeps one entry per wave; a re-check replaces the earlier verdict.
void DelegationEnforcer::record_compliance_locked(const ComplianceReport& report) {
    auto it = std::find_if(compliance_history_.begin(), compliance_history_.end(),
                           [&](const ComplianceReport& r) {
                               return r.wave_index == report.wave_index;
                           });
    if (it != compliance_history_.end()) {
        *it = report;
    } else {
        compliance_history_.push_back(report);
    }
}

// ─────────────────────────────────────────────
// Wave Progression
// ─────────────────────────────────────────────

Result<void> DelegationEnforcer::advance_wave() {
    std::lock_guard lock(mutex_);
    return advance_locked();
}

Result<void> DelegationEnforcer::advance_locked() {
    if (halt_error_) {
        return *halt_error_;
    }
    if (complete_locked()) {
        return Error{ErrorCode::InvalidState, "All waves are already complete"};
    }

    if (!graph_.is_wave_terminal(current_wave_)) {
        std::vector<TaskId> outstanding;
        for (const auto& id : graph_.waves()[current_wave_]) {
            if (!is_terminal(graph_.get_task(id)->status)) outstanding.push_back(id);
        }
        return Error{ErrorCode::WaveIncomplete,
                     "Wave " + std::to_string(current_wave_ + 1)
                     + " still has unfinished tasks: " + join_ids(outstanding)};
    }

    if (auto check = check_compliance_locked(); !check) {
        return check.error();
    }

    const size_t from = current_wave_;
    ++current_wave_;

    // Waves emptied by cascading failure have nothing left to spawn
    while (!complete_locked() && graph_.is_wave_terminal(current_wave_)) {
        log(LogLevel::Warn, "Skipping wave " + std::to_string(current_wave_ + 1)
                            + ": every task already failed");
        ++current_wave_;
    }

    if (recorder_) {
        recorder_->record_wave_advanced(from, current_wave_);
    }
    if (complete_locked()) {
        log(LogLevel::Info, "All " + std::to_string(graph_.wave_count()) + " waves complete");
    } else {
        log(LogLevel::Info, "Advanced from wave " + std::to_string(from + 1) + " to wave "
                            + std::to_string(current_wave_ + 1) + " ("
                            + join_ids(graph_.waves()[current_wave_]) + ")");
    }
    return {};
}

Result<void> DelegationEnforcer::auto_advance_locked() {
    if (halt_error_ || complete_locked() || !graph_.is_wave_terminal(current_wave_)) {
        return {};
    }
    return advance_locked();
}

Result<void> DelegationEnforcer::mark_task_completed(const TaskId& task_id) {
    std::lock_guard lock(mutex_);

    if (auto r = graph_.mark_completed(task_id); !r) {
        return r.error();
    }
    log(LogLevel::Info, "Task '" + task_id + "' completed");
    return auto_advance_locked();
}

Result<void> DelegationEnforcer::mark_task_failed(const TaskId& task_id,
                                                  std::optional<std::string> reason) {
    std::lock_guard lock(mutex_);

    auto task = graph_.get_task(task_id);
    if (!task) {
        return Error{ErrorCode::NotFound, "Unknown task: " + task_id};
    }
    if (is_terminal(task->status)) {
        return {};
    }

    std::string why = reason.value_or("worker failed");
    if (auto r = graph_.mark_failed(task_id, why); !r) {
        return r.error();
    }
    log(LogLevel::Warn, "Task '" + task_id + "' failed: " + why);

    if (options_.cascade_failures) {
        for (const auto& dependent : graph_.fail_dependents(task_id)) {
            auto failed = graph_.get_task(dependent);
            log(LogLevel::Warn, "Task '" + dependent + "' auto-failed: "
                                + failed->failure_reason.value_or(""));
            if (recorder_) {
                recorder_->record_cascade_failure(dependent, task_id);
            }
        }
    }

    return auto_advance_locked();
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool DelegationEnforcer::complete_locked() const noexcept {
    return current_wave_ >= graph_.wave_count();
}

std::vector<TaskId> DelegationEnforcer::get_current_wave() const {
    std::lock_guard lock(mutex_);
    if (complete_locked()) return {};
    return graph_.waves()[current_wave_];
}

std::vector<TaskId> DelegationEnforcer::get_ready_tasks() const {
    std::lock_guard lock(mutex_);
    std::vector<TaskId> ready;
    if (halt_error_ || complete_locked()) return ready;

    for (const auto& id : graph_.get_ready_tasks(current_wave_)) {
        if (validate_locked(id)) ready.push_back(id);
    }
    return ready;
}

size_t DelegationEnforcer::current_wave_index() const {
    std::lock_guard lock(mutex_);
    return current_wave_;
}

size_t DelegationEnforcer::wave_count() const {
    std::lock_guard lock(mutex_);
    return graph_.wave_count();
}

bool DelegationEnforcer::is_complete() const {
    std::lock_guard lock(mutex_);
    return complete_locked();
}

bool DelegationEnforcer::is_halted() const {
    std::lock_guard lock(mutex_);
    return halt_error_.has_value();
}

std::optional<Task> DelegationEnforcer::get_task(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    return graph_.get_task(task_id);
}

std::vector<TaskId> DelegationEnforcer::task_ids() const {
    std::lock_guard lock(mutex_);
    return graph_.task_ids();
}

std::optional<ComplianceReport> DelegationEnforcer::last_compliance() const {
    std::lock_guard lock(mutex_);
    if (compliance_history_.empty()) return std::nullopt;
    return compliance_history_.back();
}

std::vector<ComplianceReport> DelegationEnforcer::compliance_history() const {
    std::lock_guard lock(mutex_);
    return compliance_history_;
}

EnforcementStatus DelegationEnforcer::status() const {
    std::lock_guard lock(mutex_);

    EnforcementStatus status;
    status.current_wave = current_wave_ + 1;
    status.total_waves = graph_.wave_count();
    status.halted = halt_error_.has_value();
    status.complete = complete_locked();
    if (!status.complete) {
        status.current_wave_tasks = graph_.waves()[current_wave_];
    }
    for (const auto& id : graph_.task_ids()) {
        status.task_statuses[id] = graph_.get_task(id)->status;
    }
    for (const auto& [id, at] : spawn_log_) {
        status.spawn_log[id] = at;
    }
    return status;
}

void DelegationEnforcer::log(LogLevel level, std::string_view message) const {
    if (logger_) logger_->log(level, message);
}

}  // namespace wave_delegator
