/**
 * @file types.hpp
 * @brief Fundamental types used throughout WaveDelegator.
 * @author Dimitris Kafetzis
 *
 * Defines TaskId, AgentTaskId, WorkerType, the task and process status
 * enums, and the clock aliases shared by every module.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wave_delegator {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;          ///< Key of a task inside a TaskGraph
using AgentTaskId = std::string;     ///< Key of a spawned worker process
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Worker Type
// ─────────────────────────────────────────────

/**
 * @brief Closed set of worker kinds a task may be delegated to.
 *
 * The scheduler never interprets the tag; the launcher's routing table maps
 * each value to a concrete command line.
 */
enum class WorkerType : uint8_t {
    Explore,
    Dewey,
    DocumentWriter,
    Multimodal,
    Frontend,
    Delphi,
    ResearchLead,
    ImplementationLead,
    Planner,
    CodeReviewer,
    General
};

inline constexpr std::array<WorkerType, 11> kAllWorkerTypes = {
    WorkerType::Explore,      WorkerType::Dewey,        WorkerType::DocumentWriter,
    WorkerType::Multimodal,   WorkerType::Frontend,     WorkerType::Delphi,
    WorkerType::ResearchLead, WorkerType::ImplementationLead,
    WorkerType::Planner,      WorkerType::CodeReviewer, WorkerType::General
};

[[nodiscard]] constexpr std::string_view to_string(WorkerType type) noexcept {
    switch (type) {
        case WorkerType::Explore:            return "explore";
        case WorkerType::Dewey:              return "dewey";
        case WorkerType::DocumentWriter:     return "document_writer";
        case WorkerType::Multimodal:         return "multimodal";
        case WorkerType::Frontend:           return "frontend";
        case WorkerType::Delphi:             return "delphi";
        case WorkerType::ResearchLead:       return "research_lead";
        case WorkerType::ImplementationLead: return "implementation_lead";
        case WorkerType::Planner:            return "planner";
        case WorkerType::CodeReviewer:       return "code_reviewer";
        case WorkerType::General:            return "general";
    }
    return "unknown";
}

/**
 * @brief Parse a worker type name. '-' and '_' are interchangeable.
 */
[[nodiscard]] std::optional<WorkerType> parse_worker_type(std::string_view name);

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,       ///< Declared, not yet launched
    Spawned,       ///< Launch succeeded, spawn time recorded
    Running,       ///< Worker process observed running
    Completed,     ///< Worker exited successfully
    Failed         ///< Worker failed, was cancelled, or a dependency failed
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Spawned:   return "spawned";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed:    return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Failed;
}

// ─────────────────────────────────────────────
// Process Status
// ─────────────────────────────────────────────

enum class ProcessStatus : uint8_t {
    Running,
    Completed,
    Failed,
    Cancelled
};

[[nodiscard]] constexpr std::string_view to_string(ProcessStatus status) noexcept {
    switch (status) {
        case ProcessStatus::Running:   return "running";
        case ProcessStatus::Completed: return "completed";
        case ProcessStatus::Failed:    return "failed";
        case ProcessStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(ProcessStatus status) noexcept {
    return status != ProcessStatus::Running;
}

}  // namespace wave_delegator
