/**
 * @file launcher.hpp
 * @brief Worker launch collaborator: worker type + payload → OS process.
 * @author Dimitris Kafetzis
 *
 * IWorkerLauncher is the boundary between the lifecycle manager and
 * whatever actually runs a worker. It uses virtual dispatch because it is
 * configured once at startup and launches are dominated by process
 * creation cost. CommandLauncher is the stock realization: a routing table
 * from WorkerType to an argv template, launched with posix_spawnp.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <sys/types.h>

namespace wave_delegator {

inline constexpr std::string_view kPayloadPlaceholder = "{payload}";
inline constexpr const char* kAgentIdEnvVar = "WAVE_DELEGATOR_AGENT_ID";

struct LaunchOptions {
    AgentTaskId agent_task_id;
    std::filesystem::path working_dir;    ///< Empty = inherit
};

/**
 * @brief A started process: its pid and the read end of its merged
 *        stdout/stderr pipe. The receiver owns the descriptor.
 */
struct LaunchedProcess {
    pid_t pid = -1;
    int output_fd = -1;
};

class IWorkerLauncher {
public:
    virtual ~IWorkerLauncher() = default;

    /**
     * @brief Start a worker process. Must not wait for any output.
     * @return ErrorCode::Spawn if the process could not be started.
     */
    virtual Result<LaunchedProcess> launch(WorkerType type,
                                           const std::string& payload,
                                           const LaunchOptions& options) = 0;
};

/**
 * @brief Launches routed command lines via posix_spawnp.
 *
 * The child gets stdin from /dev/null, stdout and stderr on one pipe, its
 * own process group (so cancel can signal the whole tree) and
 * WAVE_DELEGATOR_AGENT_ID in its environment.
 */
class CommandLauncher : public IWorkerLauncher {
public:
    explicit CommandLauncher(std::map<WorkerType, WorkerRouteConfig> routes);

    Result<LaunchedProcess> launch(WorkerType type,
                                   const std::string& payload,
                                   const LaunchOptions& options) override;

    /**
     * @brief Expand the route for @p type. Unrouted types use the general
     *        route when one exists.
     */
    [[nodiscard]] Result<std::vector<std::string>> resolve_argv(WorkerType type,
                                                                const std::string& payload) const;

private:
    std::map<WorkerType, WorkerRouteConfig> routes_;
};

}  // namespace wave_delegator
