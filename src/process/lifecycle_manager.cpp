/**
 * @file lifecycle_manager.cpp
 * @brief ProcessLifecycleManager implementation.
 * @author Dimitris Kafetzis
 *
 * Each monitor multiplexes three things with poll(): output on the worker's
 * pipe, process exit (waitpid WNOHANG), and SIGKILL escalation once a
 * cancelled worker outlives the grace period.
 */

#include "process/lifecycle_manager.hpp"
#include "telemetry/event_recorder.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <limits>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace wave_delegator {

namespace {

constexpr size_t kReadChunk = 4096;
constexpr size_t kDefaultDescriptionLength = 50;
constexpr Millis kPostEofPoll{10};

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

ProcessLifecycleManager::ProcessLifecycleManager(IWorkerLauncher& launcher,
                                                 LifecycleOptions options,
                                                 Logger* logger,
                                                 EventRecorder* recorder)
    : launcher_(launcher)
    , options_(std::move(options))
    , logger_(logger)
    , recorder_(recorder)
    , id_rng_(std::random_device{}()) {}

ProcessLifecycleManager::~ProcessLifecycleManager() {
    stop_all();

    std::unordered_map<AgentTaskId, Monitor> monitors;
    {
        std::lock_guard lock(monitors_mutex_);
        monitors = std::move(monitors_);
    }
    for (auto& [id, monitor] : monitors) {
        monitor.thread.request_stop();
    }
    // jthreads join on destruction
}

void ProcessLifecycleManager::reap_finished_monitors() {
    std::vector<std::jthread> finished;
    {
        std::lock_guard lock(monitors_mutex_);
        for (auto it = monitors_.begin(); it != monitors_.end();) {
            if (it->second.done->load(std::memory_order_acquire)) {
                finished.push_back(std::move(it->second.thread));
                it = monitors_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Joined outside the lock; each has already returned from monitor_loop
}

size_t ProcessLifecycleManager::monitor_count() {
    reap_finished_monitors();
    std::lock_guard lock(monitors_mutex_);
    return monitors_.size();
}

// ─────────────────────────────────────────────
// Spawn
// ─────────────────────────────────────────────

AgentTaskId ProcessLifecycleManager::reserve_id() {
    std::lock_guard lock(registry_mutex_);
    for (;;) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%08x",
                      static_cast<unsigned>(id_rng_() & 0xFFFFFFFFu));
        AgentTaskId id = std::string{"agent_"} + buf;
        if (!handles_.contains(id) && !reserved_ids_.contains(id)) {
            reserved_ids_.insert(id);
            return id;
        }
    }
}

Result<AgentTaskId> ProcessLifecycleManager::spawn(WorkerType type,
                                                   std::string payload,
                                                   SpawnOptions options) {
    reap_finished_monitors();
    auto id = reserve_id();

    LaunchOptions launch_options{
        .agent_task_id = id,
        .working_dir = options_.working_dir
    };

    // Launch happens outside every lock so independent spawns never serialize.
    auto launched = launcher_.launch(type, payload, launch_options);
    if (!launched) {
        {
            std::lock_guard lock(registry_mutex_);
            reserved_ids_.erase(id);
        }
        log(LogLevel::Error, "Spawn failed for " + std::string{to_string(type)}
                             + " worker: " + launched.error().message);
        return launched.error();
    }

    auto description = options.description.empty()
        ? payload.substr(0, kDefaultDescriptionLength)
        : options.description;

    auto handle = std::make_shared<WorkerHandle>(
        id, type, std::move(description), std::move(payload), launched->pid);

    {
        std::lock_guard lock(registry_mutex_);
        reserved_ids_.erase(id);
        handles_.emplace(id, handle);
        spawn_order_.push_back(id);
    }

    {
        std::lock_guard lock(monitors_mutex_);
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::jthread thread(
            [this, handle, done, fd = launched->output_fd, cb = std::move(options.on_exit)]
            (std::stop_token stop) mutable {
                monitor_loop(stop, std::move(handle), fd, std::move(cb));
                done->store(true, std::memory_order_release);
            });
        monitors_.emplace(id, Monitor{std::move(thread), std::move(done)});
    }

    log(LogLevel::Info, "Spawned " + std::string{to_string(type)} + " worker " + id
                        + " (pid " + std::to_string(launched->pid) + ")");
    if (recorder_) {
        recorder_->record_spawn(id, type, options.task_id);
    }
    return id;
}

// ─────────────────────────────────────────────
// Monitor
// ─────────────────────────────────────────────

void ProcessLifecycleManager::monitor_loop(std::stop_token stop,
                                           std::shared_ptr<WorkerHandle> handle,
                                           int output_fd,
                                           ExitCallback on_exit) {
    const pid_t pid = handle->process_id();
    const int poll_ms = static_cast<int>(std::clamp<Millis::rep>(
        options_.poll_interval.count(), 1, std::numeric_limits<int>::max()));
    std::array<char, kReadChunk> buffer{};

    bool eof = false;
    bool reaped = false;
    bool killed = false;
    bool exit_known = false;
    int wait_status = 0;

    // Returns false once the pipe reports EOF or an unrecoverable error.
    auto read_once = [&](int timeout_ms) -> bool {
        pollfd pfd{};
        pfd.fd = output_fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) return true;
            log(LogLevel::Warn, "poll failed for " + handle->agent_task_id() + ": "
                                + std::string(::strerror(errno)));
            return false;
        }
        if (ready == 0) return true;

        ssize_t n = ::read(output_fd, buffer.data(), buffer.size());
        if (n > 0) {
            handle->append_output(std::string_view(buffer.data(), static_cast<size_t>(n)));
            return true;
        }
        if (n == 0) return false;
        return errno == EINTR || errno == EAGAIN;
    };

    while (!reaped) {
        if (!eof) {
            eof = !read_once(poll_ms);
        } else {
            std::this_thread::sleep_for(std::min(options_.poll_interval, kPostEofPoll));
        }

        pid_t r = ::waitpid(pid, &wait_status, WNOHANG);
        if (r == pid) {
            reaped = true;
            exit_known = true;
        } else if (r < 0 && errno != EINTR) {
            log(LogLevel::Warn, "waitpid failed for " + handle->agent_task_id() + ": "
                                + std::string(::strerror(errno)));
            reaped = true;
        }

        if (!reaped && !killed) {
            auto requested = handle->cancel_requested_at();
            bool overdue = requested
                && std::chrono::steady_clock::now() - *requested >= options_.cancel_grace;
            if (overdue || stop.stop_requested()) {
                ::kill(-pid, SIGKILL);
                killed = true;
                log(LogLevel::Warn, "Escalated to SIGKILL for " + handle->agent_task_id());
            }
        }
    }

    // Drain whatever the worker wrote before exiting.
    if (!eof) {
        pollfd pfd{};
        pfd.fd = output_fd;
        pfd.events = POLLIN;
        while (::poll(&pfd, 1, 0) > 0) {
            ssize_t n = ::read(output_fd, buffer.data(), buffer.size());
            if (n <= 0) break;
            handle->append_output(std::string_view(buffer.data(), static_cast<size_t>(n)));
        }
    }
    ::close(output_fd);

    ProcessStatus status = ProcessStatus::Failed;
    std::optional<int> exit_code;
    if (exit_known) {
        if (WIFEXITED(wait_status)) {
            exit_code = WEXITSTATUS(wait_status);
            status = (*exit_code == 0) ? ProcessStatus::Completed : ProcessStatus::Failed;
        } else if (WIFSIGNALED(wait_status)) {
            exit_code = 128 + WTERMSIG(wait_status);
        }
    }

    auto snap = handle->finish(status, exit_code);

    auto level = snap.status == ProcessStatus::Completed ? LogLevel::Info : LogLevel::Warn;
    log(level, "Worker " + snap.agent_task_id + " " + std::string{to_string(snap.status)}
               + " (exit " + (snap.exit_code ? std::to_string(*snap.exit_code) : "unknown")
               + ", " + std::to_string(snap.elapsed.count()) + "ms)");
    if (recorder_) {
        recorder_->record_process_exit(snap);
    }

    if (on_exit) {
        try {
            on_exit(snap);
        } catch (const std::exception& e) {
            log(LogLevel::Error, "Exit callback for " + snap.agent_task_id + " threw: " + e.what());
        }
    }
}

// ─────────────────────────────────────────────
// Retrieval
// ─────────────────────────────────────────────

std::shared_ptr<WorkerHandle> ProcessLifecycleManager::find(const AgentTaskId& id) const {
    std::lock_guard lock(registry_mutex_);
    auto it = handles_.find(id);
    return it == handles_.end() ? nullptr : it->second;
}

Result<OutputResult> ProcessLifecycleManager::get_output(const AgentTaskId& id, bool block,
                                                         std::optional<Millis> timeout) const {
    auto handle = find(id);
    if (!handle) {
        return Error{ErrorCode::NotFound, "Unknown agent task: " + id};
    }

    if (block) {
        handle->wait(timeout);
    }

    auto snap = handle->snapshot();
    return OutputResult{
        .agent_task_id = snap.agent_task_id,
        .status = snap.status,
        .output = std::move(snap.output),
        .exit_code = snap.exit_code
    };
}

Result<ProgressSnapshot> ProcessLifecycleManager::get_progress(
    const AgentTaskId& id, std::optional<size_t> tail_lines_count) const {
    auto handle = find(id);
    if (!handle) {
        return Error{ErrorCode::NotFound, "Unknown agent task: " + id};
    }

    auto snap = handle->snapshot();
    return ProgressSnapshot{
        .agent_task_id = snap.agent_task_id,
        .worker_type = snap.worker_type,
        .description = snap.description,
        .status = snap.status,
        .process_id = snap.process_id,
        .tail = tail_lines(snap.output, tail_lines_count.value_or(options_.default_tail_lines)),
        .output_bytes = snap.output.size(),
        .elapsed = snap.elapsed
    };
}

// ─────────────────────────────────────────────
// Cancellation
// ─────────────────────────────────────────────

bool ProcessLifecycleManager::cancel(const AgentTaskId& id) {
    auto handle = find(id);
    if (!handle) return false;
    if (!handle->request_cancel()) return false;

    if (::kill(-handle->process_id(), SIGTERM) != 0 && errno != ESRCH) {
        log(LogLevel::Warn, "SIGTERM failed for " + id + ": " + std::string(::strerror(errno)));
    }
    log(LogLevel::Info, "Cancelled worker " + id);
    return true;
}

size_t ProcessLifecycleManager::stop_all() {
    std::vector<AgentTaskId> ids;
    {
        std::lock_guard lock(registry_mutex_);
        ids = spawn_order_;
    }

    size_t stopped = 0;
    for (const auto& id : ids) {
        if (cancel(id)) ++stopped;
    }
    return stopped;
}

Result<AgentTaskId> ProcessLifecycleManager::retry(const AgentTaskId& id,
                                                   std::optional<std::string> new_payload) {
    auto handle = find(id);
    if (!handle) {
        return Error{ErrorCode::NotFound, "Unknown agent task: " + id};
    }
    if (handle->status() == ProcessStatus::Running) {
        return Error{ErrorCode::InvalidState,
                     "Agent task " + id + " is still running; cancel it before retrying"};
    }

    SpawnOptions options;
    options.description = "Retry of " + id + ": " + handle->description();
    return spawn(handle->worker_type(), new_payload.value_or(handle->payload()), std::move(options));
}

Result<void> ProcessLifecycleManager::discard(const AgentTaskId& id) {
    {
        std::lock_guard lock(registry_mutex_);
        auto it = handles_.find(id);
        if (it == handles_.end()) {
            return Error{ErrorCode::NotFound, "Unknown agent task: " + id};
        }
        if (it->second->status() == ProcessStatus::Running) {
            return Error{ErrorCode::InvalidState, "Agent task " + id + " is still running"};
        }
        handles_.erase(it);
        spawn_order_.erase(std::remove(spawn_order_.begin(), spawn_order_.end(), id),
                           spawn_order_.end());
    }
    // A monitor still running its exit callback is picked up by a later sweep
    reap_finished_monitors();
    return {};
}

// ─────────────────────────────────────────────
// Registry Queries
// ─────────────────────────────────────────────

std::vector<HandleSnapshot> ProcessLifecycleManager::list_handles() const {
    std::vector<std::shared_ptr<WorkerHandle>> handles;
    {
        std::lock_guard lock(registry_mutex_);
        handles.reserve(spawn_order_.size());
        for (const auto& id : spawn_order_) {
            handles.push_back(handles_.at(id));
        }
    }

    std::vector<HandleSnapshot> snapshots;
    snapshots.reserve(handles.size());
    for (const auto& handle : handles) {
        snapshots.push_back(handle->snapshot());
    }
    return snapshots;
}

std::optional<HandleSnapshot> ProcessLifecycleManager::get_handle(const AgentTaskId& id) const {
    auto handle = find(id);
    if (!handle) return std::nullopt;
    return handle->snapshot();
}

size_t ProcessLifecycleManager::running_count() const {
    std::vector<std::shared_ptr<WorkerHandle>> handles;
    {
        std::lock_guard lock(registry_mutex_);
        for (const auto& [id, handle] : handles_) handles.push_back(handle);
    }
    return static_cast<size_t>(std::count_if(handles.begin(), handles.end(), [](const auto& h) {
        return h->status() == ProcessStatus::Running;
    }));
}

void ProcessLifecycleManager::log(LogLevel level, std::string_view message) const {
    if (logger_) logger_->log(level, message);
}

}  // namespace wave_delegator
