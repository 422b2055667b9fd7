/**
 * @file config.hpp
 * @brief Runtime configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace wave_delegator {

struct EnforcerConfig {
    uint32_t parallel_window_ms = 500;
    bool strict = true;
    bool cascade_failures = true;       ///< Dependents of a failed task auto-fail
};

struct LifecycleConfig {
    uint32_t cancel_grace_ms = 5000;    ///< SIGTERM → SIGKILL escalation delay
    uint32_t monitor_poll_ms = 100;
    uint32_t default_tail_lines = 20;
    std::filesystem::path working_dir;  ///< Empty = inherit
};

/**
 * @brief argv template for one worker type. "{payload}" is substituted.
 */
struct WorkerRouteConfig {
    std::vector<std::string> command;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::string sink = "file";          ///< "file", "stdout", "null"
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    EnforcerConfig enforcer;
    LifecycleConfig lifecycle;
    std::map<WorkerType, WorkerRouteConfig> workers;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 *
 * Routes the general worker to `/bin/sh -c {payload}`; every other worker
 * type falls back to it.
 */
Config default_config();

}  // namespace wave_delegator
