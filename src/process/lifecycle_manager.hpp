/**
 * @file lifecycle_manager.hpp
 * @brief Non-blocking spawn, monitoring, retrieval and cancellation of
 *        worker processes.
 * @author Dimitris Kafetzis
 *
 * spawn() returns as soon as the OS process has started. One monitor thread
 * (std::jthread) per handle streams output into the handle and publishes the
 * exit status. The registry lock is held only around map mutations, never
 * across a launch, a read() or a wait.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "process/launcher.hpp"
#include "process/worker_handle.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wave_delegator {

class EventRecorder;

/**
 * @brief Invoked once per handle, on its monitor thread, after the terminal
 *        state has been published.
 */
using ExitCallback = std::function<void(const HandleSnapshot&)>;

struct LifecycleOptions {
    Millis cancel_grace{5000};          ///< SIGTERM → SIGKILL escalation delay
    Millis poll_interval{100};          ///< Monitor wake-up period
    size_t default_tail_lines = 20;
    std::filesystem::path working_dir;
};

struct SpawnOptions {
    std::string description;            ///< Defaults to the payload's first 50 chars
    std::optional<TaskId> task_id;      ///< Graph task this spawn serves, for telemetry
    ExitCallback on_exit;
};

struct OutputResult {
    AgentTaskId agent_task_id;
    ProcessStatus status = ProcessStatus::Running;
    std::string output;
    std::optional<int> exit_code;
};

struct ProgressSnapshot {
    AgentTaskId agent_task_id;
    WorkerType worker_type = WorkerType::General;
    std::string description;
    ProcessStatus status = ProcessStatus::Running;
    pid_t process_id = -1;
    std::string tail;
    size_t output_bytes = 0;
    Millis elapsed{0};
};

class ProcessLifecycleManager {
public:
    ProcessLifecycleManager(IWorkerLauncher& launcher,
                            LifecycleOptions options = {},
                            Logger* logger = nullptr,
                            EventRecorder* recorder = nullptr);

    /// Cancels running workers and joins every monitor.
    ~ProcessLifecycleManager();

    ProcessLifecycleManager(const ProcessLifecycleManager&) = delete;
    ProcessLifecycleManager& operator=(const ProcessLifecycleManager&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<AgentTaskId> spawn(WorkerType type, std::string payload, SpawnOptions options = {});

    /**
     * @brief Current (or, with @p block, final) output and status.
     *
     * Blocking waits on the handle's own completion signal. With a
     * @p timeout the non-terminal state is returned when it elapses.
     */
    Result<OutputResult> get_output(const AgentTaskId& id, bool block,
                                    std::optional<Millis> timeout = std::nullopt) const;

    Result<ProgressSnapshot> get_progress(const AgentTaskId& id,
                                          std::optional<size_t> tail_lines = std::nullopt) const;

    /// Best-effort termination. False if unknown or already terminal.
    bool cancel(const AgentTaskId& id);

    /// Cancel every running worker. Returns how many were cancelled.
    size_t stop_all();

    /// Re-spawn a finished handle's worker with its original or a new payload.
    Result<AgentTaskId> retry(const AgentTaskId& id,
                              std::optional<std::string> new_payload = std::nullopt);

    /// Drop a terminal handle from the registry.
    Result<void> discard(const AgentTaskId& id);

    // ── Registry Queries ─────────────────────
    [[nodiscard]] std::vector<HandleSnapshot> list_handles() const;
    [[nodiscard]] std::optional<HandleSnapshot> get_handle(const AgentTaskId& id) const;
    [[nodiscard]] size_t running_count() const;

    /// Join finished monitor threads, then return how many are still alive.
    size_t monitor_count();

    [[nodiscard]] const LifecycleOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::shared_ptr<WorkerHandle> find(const AgentTaskId& id) const;
    AgentTaskId reserve_id();
    void reap_finished_monitors();
    void monitor_loop(std::stop_token stop,
                      std::shared_ptr<WorkerHandle> handle,
                      int output_fd,
                      ExitCallback on_exit);
    void log(LogLevel level, std::string_view message) const;

    IWorkerLauncher& launcher_;
    LifecycleOptions options_;
    Logger* logger_;
    EventRecorder* recorder_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<AgentTaskId, std::shared_ptr<WorkerHandle>> handles_;
    std::vector<AgentTaskId> spawn_order_;
    std::unordered_set<AgentTaskId> reserved_ids_;
    std::mt19937_64 id_rng_;

    /// One per spawned worker; `done` is set as the thread's last action.
    struct Monitor {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::mutex monitors_mutex_;
    std::unordered_map<AgentTaskId, Monitor> monitors_;
};

}  // namespace wave_delegator
