/**
 * @file launcher.cpp
 * @brief CommandLauncher implementation: argv routing and posix_spawnp.
 * @author Dimitris Kafetzis
 */

#include "process/launcher.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace wave_delegator {

namespace {

/**
 * @brief Owns posix_spawn attribute and file-action objects.
 */
struct SpawnSetup {
    posix_spawn_file_actions_t actions{};
    posix_spawnattr_t attr{};
    bool actions_ready = false;
    bool attr_ready = false;

    SpawnSetup() = default;
    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;

    ~SpawnSetup() {
        if (actions_ready) ::posix_spawn_file_actions_destroy(&actions);
        if (attr_ready) ::posix_spawnattr_destroy(&attr);
    }
};

Error spawn_error(const std::string& what, int err) {
    return Error{ErrorCode::Spawn, what + ": " + std::string(::strerror(err))};
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
}

}  // anonymous namespace

CommandLauncher::CommandLauncher(std::map<WorkerType, WorkerRouteConfig> routes)
    : routes_(std::move(routes)) {}

Result<std::vector<std::string>> CommandLauncher::resolve_argv(WorkerType type,
                                                               const std::string& payload) const {
    auto it = routes_.find(type);
    if (it == routes_.end()) {
        it = routes_.find(WorkerType::General);
    }
    if (it == routes_.end() || it->second.command.empty()) {
        return Error{ErrorCode::Spawn,
                     "No launch route for worker type '" + std::string{to_string(type)} + "'"};
    }

    std::vector<std::string> argv;
    argv.reserve(it->second.command.size() + 1);
    bool substituted = false;

    for (const auto& arg : it->second.command) {
        std::string expanded = arg;
        for (size_t pos = expanded.find(kPayloadPlaceholder); pos != std::string::npos;
             pos = expanded.find(kPayloadPlaceholder, pos + payload.size())) {
            expanded.replace(pos, kPayloadPlaceholder.size(), payload);
            substituted = true;
        }
        argv.push_back(std::move(expanded));
    }

    if (!substituted) {
        argv.push_back(payload);
    }
    return argv;
}

Result<LaunchedProcess> CommandLauncher::launch(WorkerType type,
                                                const std::string& payload,
                                                const LaunchOptions& options) {
    auto argv_result = resolve_argv(type, payload);
    if (!argv_result) return argv_result.error();
    auto& args = *argv_result;

    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return spawn_error("pipe2 failed", errno);
    }

    SpawnSetup setup;
    int rc = ::posix_spawn_file_actions_init(&setup.actions);
    if (rc != 0) {
        close_pipe(fds);
        return spawn_error("posix_spawn_file_actions_init failed", rc);
    }
    setup.actions_ready = true;

    rc = ::posix_spawnattr_init(&setup.attr);
    if (rc != 0) {
        close_pipe(fds);
        return spawn_error("posix_spawnattr_init failed", rc);
    }
    setup.attr_ready = true;

    // stdin ← /dev/null, stdout/stderr → pipe. dup2 clears O_CLOEXEC on the copies.
    rc = ::posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (rc == 0) rc = ::posix_spawn_file_actions_adddup2(&setup.actions, fds[1], STDOUT_FILENO);
    if (rc == 0) rc = ::posix_spawn_file_actions_adddup2(&setup.actions, fds[1], STDERR_FILENO);
    if (rc == 0 && !options.working_dir.empty()) {
        rc = ::posix_spawn_file_actions_addchdir_np(&setup.actions, options.working_dir.c_str());
    }
    if (rc != 0) {
        close_pipe(fds);
        return spawn_error("posix_spawn file actions failed", rc);
    }

    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigset_t empty_mask;
    sigemptyset(&empty_mask);

    rc = ::posix_spawnattr_setflags(&setup.attr,
        POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
    if (rc == 0) rc = ::posix_spawnattr_setpgroup(&setup.attr, 0);
    if (rc == 0) rc = ::posix_spawnattr_setsigdefault(&setup.attr, &default_signals);
    if (rc == 0) rc = ::posix_spawnattr_setsigmask(&setup.attr, &empty_mask);
    if (rc != 0) {
        close_pipe(fds);
        return spawn_error("posix_spawn attributes failed", rc);
    }

    std::vector<char*> c_argv;
    c_argv.reserve(args.size() + 1);
    for (auto& arg : args) c_argv.push_back(arg.data());
    c_argv.push_back(nullptr);

    std::string agent_env = std::string{kAgentIdEnvVar} + "=" + options.agent_task_id;
    std::string prefix = std::string{kAgentIdEnvVar} + "=";
    std::vector<char*> c_env;
    for (char** env = environ; env && *env; ++env) {
        if (std::strncmp(*env, prefix.c_str(), prefix.size()) != 0) {
            c_env.push_back(*env);
        }
    }
    c_env.push_back(agent_env.data());
    c_env.push_back(nullptr);

    pid_t pid = -1;
    rc = ::posix_spawnp(&pid, c_argv[0], &setup.actions, &setup.attr,
                        c_argv.data(), c_env.data());
    ::close(fds[1]);

    if (rc != 0) {
        ::close(fds[0]);
        return spawn_error("Failed to launch '" + args.front() + "'", rc);
    }

    return LaunchedProcess{.pid = pid, .output_fd = fds[0]};
}

}  // namespace wave_delegator
