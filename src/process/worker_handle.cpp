/**
 * @file worker_handle.cpp
 * @brief WorkerHandle implementation.
 * @author Dimitris Kafetzis
 */

#include "process/worker_handle.hpp"

namespace wave_delegator {

std::string tail_lines(std::string_view text, size_t lines) {
    if (lines == 0 || text.empty()) return {};

    size_t end = text.size();
    if (text.back() == '\n') --end;

    size_t pos = end;
    size_t found = 0;
    while (pos > 0) {
        if (text[pos - 1] == '\n') {
            if (++found == lines) break;
        }
        --pos;
    }
    return std::string{text.substr(pos, end - pos)};
}

WorkerHandle::WorkerHandle(AgentTaskId agent_task_id,
                           WorkerType worker_type,
                           std::string description,
                           std::string payload,
                           pid_t process_id)
    : agent_task_id_(std::move(agent_task_id))
    , worker_type_(worker_type)
    , description_(std::move(description))
    , payload_(std::move(payload))
    , process_id_(process_id)
    , start_time_(std::chrono::system_clock::now())
    , start_steady_(std::chrono::steady_clock::now()) {}

void WorkerHandle::append_output(std::string_view chunk) {
    std::lock_guard lock(mutex_);
    output_.append(chunk);
}

HandleSnapshot WorkerHandle::finish(ProcessStatus status, std::optional<int> exit_code) {
    HandleSnapshot snap;
    {
        std::lock_guard lock(mutex_);
        exit_code_ = exit_code;
        if (status_ == ProcessStatus::Running) {
            status_ = status;
            end_time_ = std::chrono::system_clock::now();
            end_steady_ = std::chrono::steady_clock::now();
        }
        snap = snapshot_locked();
    }
    terminal_cv_.notify_all();
    return snap;
}

bool WorkerHandle::request_cancel() {
    {
        std::lock_guard lock(mutex_);
        if (status_ != ProcessStatus::Running) return false;
        status_ = ProcessStatus::Cancelled;
        end_time_ = std::chrono::system_clock::now();
        end_steady_ = std::chrono::steady_clock::now();
        cancel_requested_at_ = *end_steady_;
    }
    terminal_cv_.notify_all();
    return true;
}

std::optional<SteadyTime> WorkerHandle::cancel_requested_at() const {
    std::lock_guard lock(mutex_);
    return cancel_requested_at_;
}

bool WorkerHandle::wait(std::optional<Millis> timeout) const {
    std::unique_lock lock(mutex_);
    auto done = [this] { return is_terminal(status_); };
    if (!timeout) {
        terminal_cv_.wait(lock, done);
        return true;
    }
    return terminal_cv_.wait_for(lock, *timeout, done);
}

HandleSnapshot WorkerHandle::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_locked();
}

HandleSnapshot WorkerHandle::snapshot_locked() const {
    auto until = end_steady_.value_or(std::chrono::steady_clock::now());
    return HandleSnapshot{
        .agent_task_id = agent_task_id_,
        .worker_type = worker_type_,
        .description = description_,
        .process_id = process_id_,
        .status = status_,
        .output = output_,
        .start_time = start_time_,
        .end_time = end_time_,
        .exit_code = exit_code_,
        .elapsed = std::chrono::duration_cast<Millis>(until - start_steady_)
    };
}

std::string WorkerHandle::tail(size_t lines) const {
    std::lock_guard lock(mutex_);
    return tail_lines(output_, lines);
}

ProcessStatus WorkerHandle::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

}  // namespace wave_delegator
