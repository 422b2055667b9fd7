/**
 * @file test_session.cpp
 * @brief Unit tests for spawn_task() and OrchestrationSession.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/session.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <thread>

using namespace wave_delegator;

class SessionTest : public ::testing::Test {
protected:
    CommandLauncher launcher_{default_config().workers};
    ProcessLifecycleManager manager_{launcher_, LifecycleOptions{
        .cancel_grace = Millis{300},
        .poll_interval = Millis{10}
    }};

    /// Payload is the task description, run by /bin/sh.
    static std::string shell_payload(const Task& task) { return task.description; }

    static TaskGraph make_graph(std::vector<TaskSpec> specs) {
        auto graph = TaskGraph::build(std::move(specs));
        EXPECT_TRUE(graph.has_value()) << graph.error().message;
        return std::move(*graph);
    }

    static const TaskOutcome& outcome(const SessionReport& report, const TaskId& id) {
        auto it = std::find_if(report.outcomes.begin(), report.outcomes.end(),
                               [&](const TaskOutcome& o) { return o.task_id == id; });
        EXPECT_NE(it, report.outcomes.end()) << id;
        return *it;
    }

    /// Poll until the enforcer is complete or the deadline passes.
    static bool wait_complete(const DelegationEnforcer& enforcer, Millis limit = Millis{5000}) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (!enforcer.is_complete() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(Millis{10});
        }
        return enforcer.is_complete();
    }
};

// ─── Free Entry Point ────────────────────────

TEST_F(SessionTest, UnconstrainedSpawnWithoutEnforcer) {
    auto agent = spawn_task(manager_, "adhoc", WorkerType::General, "echo free");
    ASSERT_TRUE(agent.has_value()) << agent.error().message;
    auto result = manager_.get_output(*agent, true);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->output, "free\n");
}

TEST_F(SessionTest, ValidationFailureDoesNotSpawn) {
    DelegationEnforcer enforcer(make_graph({
        {.id = "a", .description = "true"},
        {.id = "b", .description = "true", .dependencies = {"a"}},
    }));

    auto agent = spawn_task(manager_, "b", WorkerType::General, "true", &enforcer);
    ASSERT_FALSE(agent.has_value());
    EXPECT_EQ(agent.error().code, ErrorCode::Validation);
    EXPECT_TRUE(manager_.list_handles().empty());
    EXPECT_EQ(enforcer.get_task("b")->status, TaskStatus::Pending);
}

TEST_F(SessionTest, SuccessfulSpawnIsRecorded) {
    DelegationEnforcer enforcer(make_graph({{.id = "a", .description = "true"}}));

    auto agent = spawn_task(manager_, "a", WorkerType::General, "true", &enforcer);
    ASSERT_TRUE(agent.has_value());

    auto task = enforcer.get_task("a");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status, TaskStatus::Spawned);
    EXPECT_EQ(task->handle_ref, *agent);
    EXPECT_TRUE(task->spawn_time.has_value());
}

TEST_F(SessionTest, LaunchFailureLeavesTaskPending) {
    CommandLauncher broken({
        {WorkerType::General, WorkerRouteConfig{.command = {"/nonexistent/wave-worker"}}},
    });
    ProcessLifecycleManager manager(broken);
    DelegationEnforcer enforcer(make_graph({{.id = "a", .description = "true"}}));

    auto agent = spawn_task(manager, "a", WorkerType::General, "true", &enforcer);
    ASSERT_FALSE(agent.has_value());
    EXPECT_EQ(agent.error().code, ErrorCode::Spawn);

    auto task = enforcer.get_task("a");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status, TaskStatus::Pending);
    EXPECT_FALSE(task->handle_ref.has_value());
    EXPECT_FALSE(task->spawn_time.has_value());
    EXPECT_FALSE(enforcer.status().spawn_log.contains("a"));
    EXPECT_TRUE(manager.list_handles().empty());

    // Still spawnable once the launcher is fixed
    EXPECT_TRUE(enforcer.validate_spawn("a"));
}

TEST_F(SessionTest, SessionSurfacesLaunchFailure) {
    CommandLauncher broken({
        {WorkerType::General, WorkerRouteConfig{.command = {"/nonexistent/wave-worker"}}},
    });
    ProcessLifecycleManager manager(broken);
    OrchestrationSession session(manager, make_graph({{.id = "a", .description = "true"}}),
                                 EnforcerOptions{});

    auto agent = session.spawn_task("a", WorkerType::General, "true");
    ASSERT_FALSE(agent.has_value());
    EXPECT_EQ(agent.error().code, ErrorCode::Spawn);
    EXPECT_TRUE(session.spawned_agents().empty());
    EXPECT_EQ(session.enforcer()->get_task("a")->status, TaskStatus::Pending);

    auto report = session.run_to_completion(shell_payload, Millis{5000});
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->success);
    ASSERT_TRUE(report->error.has_value());
    EXPECT_EQ(report->error->code, ErrorCode::Spawn);
}

// ─── Session Spawning ────────────────────────

TEST_F(SessionTest, ExitsAdvanceWaves) {
    OrchestrationSession session(manager_, make_graph({
        {.id = "research", .description = "echo research"},
        {.id = "implement", .description = "echo implement", .dependencies = {"research"}},
    }), EnforcerOptions{});

    auto first = session.spawn_task("research", WorkerType::Explore, "echo research");
    ASSERT_TRUE(first.has_value()) << first.error().message;
    ASSERT_TRUE(manager_.get_output(*first, true));

    // The exit callback may still be in flight after get_output returns
    for (int i = 0; i < 500 && session.enforcer()->current_wave_index() == 0; ++i) {
        std::this_thread::sleep_for(Millis{10});
    }
    EXPECT_EQ(session.enforcer()->current_wave_index(), 1u);

    auto second = session.spawn_task("implement", WorkerType::General, "echo implement");
    ASSERT_TRUE(second.has_value()) << second.error().message;
    EXPECT_TRUE(wait_complete(*session.enforcer()));
    EXPECT_EQ(session.spawned_agents(), (std::vector<AgentTaskId>{*first, *second}));
}

TEST_F(SessionTest, SpawnOutOfWaveRejected) {
    OrchestrationSession session(manager_, make_graph({
        {.id = "a", .description = "sleep 1"},
        {.id = "b", .description = "true", .dependencies = {"a"}},
    }), EnforcerOptions{});

    auto rejected = session.spawn_task("b", WorkerType::General, "true");
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::Validation);
    EXPECT_TRUE(session.spawned_agents().empty());
}

TEST_F(SessionTest, InstantExitIsNotLost) {
    OrchestrationSession session(manager_, make_graph({{.id = "a", .description = "true"}}),
                                 EnforcerOptions{});
    ASSERT_TRUE(session.spawn_task("a", WorkerType::General, "true"));
    EXPECT_TRUE(wait_complete(*session.enforcer()));
    EXPECT_EQ(session.enforcer()->get_task("a")->status, TaskStatus::Completed);
    EXPECT_FALSE(session.last_error().has_value());
}

TEST_F(SessionTest, SpawnReadyWaveLaunchesWholeWave) {
    OrchestrationSession session(manager_, make_graph({
        {.id = "a", .description = "sleep 0.2"},
        {.id = "b", .description = "sleep 0.2"},
        {.id = "c", .description = "true", .dependencies = {"a", "b"}},
    }), EnforcerOptions{});

    auto agents = session.spawn_ready_wave(shell_payload);
    ASSERT_TRUE(agents.has_value()) << agents.error().message;
    EXPECT_EQ(agents->size(), 2u);

    // Nothing else is ready until the wave finishes
    auto again = session.spawn_ready_wave(shell_payload);
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(again->empty());
}

TEST_F(SessionTest, AdHocSessionHasNoGraphOperations) {
    OrchestrationSession session(manager_);
    EXPECT_FALSE(session.has_enforcer());

    auto agent = session.spawn_task("anything", WorkerType::General, "echo hi");
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(manager_.get_handle(*agent)->description, "anything");

    EXPECT_EQ(session.spawn_ready_wave(shell_payload).error().code, ErrorCode::InvalidState);
    EXPECT_EQ(session.run_to_completion(shell_payload).error().code, ErrorCode::InvalidState);
}

// ─── run_to_completion ───────────────────────

TEST_F(SessionTest, RunsGraphToCompletion) {
    OrchestrationSession session(manager_, make_graph({
        {.id = "research", .description = "echo research"},
        {.id = "docs", .description = "echo docs"},
        {.id = "implement", .description = "echo implement", .dependencies = {"research", "docs"}},
    }), EnforcerOptions{.parallel_window = Millis{500}});

    auto report = session.run_to_completion(shell_payload, Millis{10000});
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_TRUE(report->success);
    EXPECT_FALSE(report->error.has_value());
    ASSERT_EQ(report->outcomes.size(), 3u);
    EXPECT_EQ(outcome(*report, "implement").output, "implement\n");
    EXPECT_EQ(outcome(*report, "docs").exit_code, 0);

    ASSERT_EQ(report->compliance.size(), 2u);
    EXPECT_TRUE(report->compliance[0].compliant);
    EXPECT_EQ(report->compliance[0].spawned_count, 2u);
}

TEST_F(SessionTest, FailingWorkerCascades) {
    OrchestrationSession session(manager_, make_graph({
        {.id = "a", .description = "exit 4"},
        {.id = "b", .description = "echo never", .dependencies = {"a"}},
    }), EnforcerOptions{});

    auto report = session.run_to_completion(shell_payload, Millis{10000});
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->success);

    const auto& a = outcome(*report, "a");
    EXPECT_EQ(a.status, TaskStatus::Failed);
    EXPECT_EQ(a.exit_code, 4);
    EXPECT_EQ(a.failure_reason, "worker exited with code 4");

    const auto& b = outcome(*report, "b");
    EXPECT_EQ(b.status, TaskStatus::Failed);
    EXPECT_EQ(b.failure_reason, "dependency failed: a");
    EXPECT_FALSE(b.agent_task_id.has_value());
}

TEST_F(SessionTest, StallsWithoutCascade) {
    OrchestrationSession session(manager_, make_graph({
        {.id = "a", .description = "exit 1"},
        {.id = "b", .description = "true", .dependencies = {"a"}},
    }), EnforcerOptions{.cascade_failures = false});

    auto report = session.run_to_completion(shell_payload, Millis{10000});
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->success);
    ASSERT_TRUE(report->error.has_value());
    EXPECT_EQ(report->error->code, ErrorCode::DependencyFailed);
    EXPECT_EQ(outcome(*report, "b").status, TaskStatus::Pending);
}

TEST_F(SessionTest, TimeoutCancelsWorkers) {
    OrchestrationSession session(manager_, make_graph({{.id = "slow", .description = "sleep 10"}}),
                                 EnforcerOptions{});

    auto start = std::chrono::steady_clock::now();
    auto report = session.run_to_completion(shell_payload, Millis{200});
    EXPECT_LT(std::chrono::steady_clock::now() - start, Millis{3000});

    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->success);
    ASSERT_TRUE(report->error.has_value());
    EXPECT_EQ(report->error->code, ErrorCode::Generic);
    EXPECT_NE(report->error->message.find("timed out"), std::string::npos);

    auto agent = outcome(*report, "slow").agent_task_id;
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(manager_.get_handle(*agent)->status, ProcessStatus::Cancelled);
}

TEST_F(SessionTest, CancelledWorkerFailsTask) {
    OrchestrationSession session(manager_, make_graph({{.id = "a", .description = "sleep 10"}}),
                                 EnforcerOptions{});
    auto agent = session.spawn_task("a", WorkerType::General, "sleep 10");
    ASSERT_TRUE(agent.has_value());
    ASSERT_TRUE(manager_.cancel(*agent));

    EXPECT_TRUE(wait_complete(*session.enforcer()));
    auto task = session.enforcer()->get_task("a");
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(task->failure_reason, "worker cancelled");
}

// ─── Stopping ────────────────────────────────

TEST_F(SessionTest, StopHaltsLaterWaves) {
    OrchestrationSession session(manager_, make_graph({
        {.id = "a", .description = "sleep 0.2"},
        {.id = "b", .description = "sleep 30"},
        {.id = "c", .description = "echo spawned-after-stop", .dependencies = {"a"}},
    }), EnforcerOptions{});

    std::thread stopper([&] {
        std::this_thread::sleep_for(Millis{800});
        session.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    auto report = session.run_to_completion(shell_payload, Millis{20000});
    stopper.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, Millis{5000});

    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->success);
    ASSERT_TRUE(report->error.has_value());
    EXPECT_NE(report->error->message.find("stopped"), std::string::npos);

    const auto& c = outcome(*report, "c");
    EXPECT_EQ(c.status, TaskStatus::Pending);
    EXPECT_FALSE(c.agent_task_id.has_value());
    EXPECT_EQ(session.spawned_agents().size(), 2u);

    auto b_agent = outcome(*report, "b").agent_task_id;
    ASSERT_TRUE(b_agent.has_value());
    EXPECT_EQ(manager_.get_handle(*b_agent)->status, ProcessStatus::Cancelled);
}

TEST_F(SessionTest, SpawnAfterStopRejected) {
    OrchestrationSession session(manager_, make_graph({{.id = "a", .description = "true"}}),
                                 EnforcerOptions{});
    session.request_stop();
    EXPECT_TRUE(session.stop_requested());

    auto agent = session.spawn_task("a", WorkerType::General, "true");
    ASSERT_FALSE(agent.has_value());
    EXPECT_EQ(agent.error().code, ErrorCode::InvalidState);
    EXPECT_TRUE(manager_.list_handles().empty());

    OrchestrationSession adhoc(manager_);
    adhoc.request_stop();
    EXPECT_FALSE(adhoc.spawn_task("x", WorkerType::General, "true").has_value());
    EXPECT_TRUE(manager_.list_handles().empty());
}
