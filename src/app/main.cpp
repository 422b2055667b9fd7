/**
 * @file main.cpp
 * @brief WaveDelegator command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Runs one orchestration session end to end:
 *   Config → Logger → Task specs → TaskGraph → Session → Report
 *
 * Each task's description is handed to its worker as the payload.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/session.hpp"
#include "process/launcher.hpp"
#include "process/lifecycle_manager.hpp"
#include "telemetry/event_recorder.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/spec_loader.hpp"
#include "workload/task_graph.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace wave_delegator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║           WaveDelegator v1.0.0            ║
  ║   Wave-Parallel Task Delegation to        ║
  ║   External Worker Processes               ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path tasks_path;
    std::optional<uint32_t> window_ms;
    std::string log_dir;
    bool lenient = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--tasks" && i + 1 < argc) {
            args.tasks_path = argv[++i];
        } else if (arg == "--window-ms" && i + 1 < argc) {
            args.window_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--lenient") {
            args.lenient = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: wave_delegator --tasks <path> [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --tasks <path>     Task specification (TOML)\n"
                      << "  --window-ms <n>    Parallel window override in milliseconds\n"
                      << "  --lenient          Log parallelism violations instead of halting\n"
                      << "  --log-dir <path>   Log output directory\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_sink(const TelemetryConfig& telemetry, const std::string& prefix) {
    if (telemetry.sink == "stdout") return std::make_unique<StdoutSink>();
    if (telemetry.sink == "null") return std::make_unique<NullSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, prefix,
                                          telemetry.max_file_size_mb,
                                          telemetry.rotate_count);
}

void print_report(const SessionReport& report, size_t tail_lines_count) {
    std::cout << "\n── Session Report ──────────────────────────\n";
    for (const auto& outcome : report.outcomes) {
        std::cout << "  " << outcome.task_id << ": " << to_string(outcome.status);
        if (outcome.agent_task_id) std::cout << " [" << *outcome.agent_task_id << "]";
        if (outcome.exit_code) std::cout << " exit=" << *outcome.exit_code;
        if (outcome.failure_reason) std::cout << " (" << *outcome.failure_reason << ")";
        std::cout << "\n";

        auto tail = tail_lines(outcome.output, tail_lines_count);
        if (!tail.empty()) {
            std::cout << "    | ";
            for (char c : tail) {
                std::cout << c;
                if (c == '\n') std::cout << "    | ";
            }
            std::cout << "\n";
        }
    }

    for (const auto& check : report.compliance) {
        std::cout << "  wave " << (check.wave_index + 1) << ": "
                  << (check.compliant ? "parallel" : "NOT parallel")
                  << " (" << check.detail << ")\n";
    }

    std::cout << "  elapsed: " << report.elapsed.count() << "ms\n";
    if (report.error) {
        std::cout << "  error: " << report.error->message << "\n";
    }
    std::cout << "  result: " << (report.success ? "SUCCESS" : "FAILURE") << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);
    if (args.tasks_path.empty()) {
        std::cerr << "Missing --tasks <path>. See --help." << std::endl;
        return 2;
    }

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.window_ms) config.enforcer.parallel_window_ms = *args.window_ms;
    if (args.lenient) config.enforcer.strict = false;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    Logger logger(make_sink(config.telemetry, "wave_delegator"),
                  parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    EventRecorder recorder(make_sink(config.telemetry, "wave_delegator_events"));

    logger.info("WaveDelegator starting...");
    logger.info("Parallel window: " + std::to_string(config.enforcer.parallel_window_ms)
                + "ms, strict: " + (config.enforcer.strict ? "yes" : "no"));

    // ── Load Task Graph ──────────────────────
    auto specs = load_task_specs(args.tasks_path);
    if (!specs) {
        std::cerr << "Failed to load tasks: " << specs.error().message << std::endl;
        logger.error(specs.error().message);
        return 1;
    }

    auto graph = TaskGraph::build(std::move(*specs));
    if (!graph) {
        std::cerr << "Invalid task graph: " << graph.error().message << std::endl;
        logger.error(graph.error().message);
        return 1;
    }
    logger.info("Task graph: " + std::to_string(graph->task_count()) + " tasks in "
                + std::to_string(graph->wave_count()) + " waves");

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Process Lifecycle ────────────────────
    CommandLauncher launcher(config.workers);
    ProcessLifecycleManager manager(launcher, LifecycleOptions{
        .cancel_grace = Millis{config.lifecycle.cancel_grace_ms},
        .poll_interval = Millis{config.lifecycle.monitor_poll_ms},
        .default_tail_lines = config.lifecycle.default_tail_lines,
        .working_dir = config.lifecycle.working_dir
    }, &logger, &recorder);

    // ── Run Session ──────────────────────────
    OrchestrationSession session(manager, std::move(*graph), EnforcerOptions{
        .parallel_window = Millis{config.enforcer.parallel_window_ms},
        .strict = config.enforcer.strict,
        .cascade_failures = config.enforcer.cascade_failures
    }, &logger, &recorder);

    std::jthread shutdown_watcher([&](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_shutdown_requested) {
                logger.warn("Shutdown requested. Stopping session...");
                session.request_stop();
                manager.stop_all();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto report = session.run_to_completion([](const Task& task) { return task.description; });

    shutdown_watcher.request_stop();
    recorder.flush();
    logger.flush();

    if (!report) {
        std::cerr << "Session failed: " << report.error().message << std::endl;
        return 1;
    }

    print_report(*report, config.lifecycle.default_tail_lines);
    logger.info("WaveDelegator stopped.");
    return report->success ? 0 : 1;
}
