/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include <toml++/toml.hpp>

namespace wave_delegator {

namespace {

using Section = toml::node_view<const toml::node>;

/// Read an optional integer key into @p out, rejecting values below @p min or
/// above INT_MAX. A missing key keeps the current value.
Result<void> read_bounded(Section section, std::string_view section_name,
                          std::string_view key, int64_t min, uint32_t& out) {
    auto value = section[key].value<int64_t>();
    if (!value) return {};

    constexpr int64_t kMax = std::numeric_limits<int>::max();
    if (*value < min || *value > kMax) {
        return Error{ErrorCode::Config,
                     std::string{section_name} + "." + std::string{key} + " must be in ["
                     + std::to_string(min) + ", " + std::to_string(kMax) + "], got "
                     + std::to_string(*value)};
    }
    out = static_cast<uint32_t>(*value);
    return {};
}

Result<Config> config_from_table(const toml::table& tbl) {
    Config config = default_config();

    // [enforcer]
    if (auto enforcer = tbl["enforcer"]; enforcer.is_table()) {
        if (auto r = read_bounded(enforcer, "enforcer", "parallel_window_ms", 0,
                                  config.enforcer.parallel_window_ms); !r) {
            return r.error();
        }
        config.enforcer.strict = enforcer["strict"].value_or(true);
        config.enforcer.cascade_failures = enforcer["cascade_failures"].value_or(true);
    }

    // [lifecycle]
    if (auto lifecycle = tbl["lifecycle"]; lifecycle.is_table()) {
        if (auto r = read_bounded(lifecycle, "lifecycle", "cancel_grace_ms", 0,
                                  config.lifecycle.cancel_grace_ms); !r) {
            return r.error();
        }
        if (auto r = read_bounded(lifecycle, "lifecycle", "monitor_poll_ms", 1,
                                  config.lifecycle.monitor_poll_ms); !r) {
            return r.error();
        }
        if (auto r = read_bounded(lifecycle, "lifecycle", "default_tail_lines", 0,
                                  config.lifecycle.default_tail_lines); !r) {
            return r.error();
        }
        config.lifecycle.working_dir = lifecycle["working_dir"].value_or(std::string{});
    }

    // [workers.<type>]
    if (const auto* workers = tbl["workers"].as_table()) {
        for (const auto& [key, node] : *workers) {
            auto type = parse_worker_type(key.str());
            if (!type) {
                return Error{ErrorCode::Config,
                             "Unknown worker type in [workers]: " + std::string{key.str()}};
            }

            const auto* route = node.as_table();
            const auto* command = route ? route->get_as<toml::array>("command") : nullptr;
            if (!command || command->empty()) {
                return Error{ErrorCode::Config,
                             "workers." + std::string{key.str()} + ".command must be a non-empty array"};
            }

            WorkerRouteConfig parsed;
            for (const auto& arg : *command) {
                auto value = arg.value<std::string>();
                if (!value) {
                    return Error{ErrorCode::Config,
                                 "workers." + std::string{key.str()} + ".command must contain strings"};
                }
                parsed.command.push_back(std::move(*value));
            }
            config.workers[*type] = std::move(parsed);
        }
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
        if (auto r = read_bounded(telemetry, "telemetry", "max_file_size_mb", 1,
                                  config.telemetry.max_file_size_mb); !r) {
            return r.error();
        }
        if (auto r = read_bounded(telemetry, "telemetry", "rotate_count", 0,
                                  config.telemetry.rotate_count); !r) {
            return r.error();
        }
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        config.telemetry.sink = telemetry["sink"].value_or(std::string{"file"});
    }

    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::Config, "Invalid telemetry.log_level: " + config.telemetry.log_level};
    }
    const auto& sink = config.telemetry.sink;
    if (sink != "file" && sink != "stdout" && sink != "null") {
        return Error{ErrorCode::Config, "Invalid telemetry.sink: " + sink};
    }

    return config;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string()};
    }

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::Config, "Cannot open configuration file: " + path.string()};
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return parse_config(contents.str());
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return config_from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    Config config;
    config.workers[WorkerType::General] = WorkerRouteConfig{
        .command = {"/bin/sh", "-c", "{payload}"}
    };
    return config;
}

}  // namespace wave_delegator
