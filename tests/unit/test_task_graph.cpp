/**
 * @file test_task_graph.cpp
 * @brief Unit tests for TaskGraph construction, wave partition and
 *        status transitions.
 * @author Dimitris Kafetzis
 */

#include "workload/task_graph.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <unordered_set>

using namespace wave_delegator;

// ─── Helper ──────────────────────────────────

static TaskSpec make_spec(const std::string& id, std::vector<TaskId> deps = {},
                          WorkerType type = WorkerType::General) {
    return TaskSpec{
        .id = id,
        .worker_type = type,
        .description = "Task " + id,
        .dependencies = std::move(deps)
    };
}

static TaskGraph build_ok(std::vector<TaskSpec> specs) {
    auto graph = TaskGraph::build(std::move(specs));
    EXPECT_TRUE(graph.has_value()) << graph.error().message;
    return std::move(graph).value();
}

static bool wave_contains(const std::vector<TaskId>& wave, const TaskId& id) {
    return std::find(wave.begin(), wave.end(), id) != wave.end();
}

// ─── Construction ────────────────────────────

TEST(TaskGraphTest, EmptyGraph) {
    auto graph = build_ok({});
    EXPECT_EQ(graph.task_count(), 0u);
    EXPECT_EQ(graph.wave_count(), 0u);
    EXPECT_TRUE(graph.all_terminal());
}

TEST(TaskGraphTest, GetTaskCarriesDeclaration) {
    auto graph = build_ok({make_spec("research", {}, WorkerType::Explore)});
    auto task = graph.get_task("research");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->description, "Task research");
    EXPECT_EQ(task->worker_type, WorkerType::Explore);
    EXPECT_EQ(task->status, TaskStatus::Pending);
    EXPECT_FALSE(task->handle_ref.has_value());
    EXPECT_FALSE(task->spawn_time.has_value());
    EXPECT_FALSE(graph.get_task("missing").has_value());
}

TEST(TaskGraphTest, UnknownDependencyRejected) {
    auto graph = TaskGraph::build({make_spec("a", {"ghost"})});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::UnknownDependency);
    EXPECT_NE(graph.error().message.find("ghost"), std::string::npos);
}

TEST(TaskGraphTest, DuplicateIdRejected) {
    auto graph = TaskGraph::build({make_spec("a"), make_spec("a")});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::DuplicateTask);
}

TEST(TaskGraphTest, TwoNodeCycleRejected) {
    auto graph = TaskGraph::build({make_spec("a", {"b"}), make_spec("b", {"a"})});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::Cycle);
}

TEST(TaskGraphTest, SelfLoopRejected) {
    auto graph = TaskGraph::build({make_spec("a", {"a"})});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::Cycle);
}

TEST(TaskGraphTest, LongCycleBehindValidPrefixRejected) {
    auto graph = TaskGraph::build({
        make_spec("root"),
        make_spec("a", {"root", "c"}),
        make_spec("b", {"a"}),
        make_spec("c", {"b"}),
    });
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, ErrorCode::Cycle);
}

TEST(TaskGraphTest, RepeatedDependencyCollapses) {
    auto graph = build_ok({make_spec("a"), make_spec("b", {"a", "a"})});
    EXPECT_EQ(graph.get_task("b")->dependencies.size(), 1u);
    EXPECT_EQ(graph.wave_count(), 2u);
}

// ─── Wave Partition ──────────────────────────

TEST(TaskGraphTest, IndependentTasksShareFirstWave) {
    auto graph = build_ok({make_spec("a"), make_spec("b"), make_spec("c")});
    ASSERT_EQ(graph.wave_count(), 1u);
    EXPECT_EQ(graph.waves()[0], (std::vector<TaskId>{"a", "b", "c"}));
}

TEST(TaskGraphTest, DiamondWaves) {
    auto graph = build_ok({
        make_spec("research"),
        make_spec("docs"),
        make_spec("implement", {"research", "docs"}),
    });
    ASSERT_EQ(graph.wave_count(), 2u);
    EXPECT_EQ(graph.waves()[0], (std::vector<TaskId>{"research", "docs"}));
    EXPECT_EQ(graph.waves()[1], (std::vector<TaskId>{"implement"}));
    EXPECT_EQ(graph.wave_of("implement"), 1u);
    EXPECT_FALSE(graph.wave_of("ghost").has_value());
}

TEST(TaskGraphTest, EarliestLayerNotArbitraryTopologicalOrder) {
    // c only needs a, so it belongs next to b in wave 1 even though d needs b
    auto graph = build_ok({
        make_spec("a"),
        make_spec("b", {"a"}),
        make_spec("c", {"a"}),
        make_spec("d", {"b"}),
        make_spec("e"),
    });
    ASSERT_EQ(graph.wave_count(), 3u);
    EXPECT_EQ(graph.waves()[0], (std::vector<TaskId>{"a", "e"}));
    EXPECT_EQ(graph.waves()[1], (std::vector<TaskId>{"b", "c"}));
    EXPECT_EQ(graph.waves()[2], (std::vector<TaskId>{"d"}));
}

TEST(TaskGraphTest, DeclarationOrderDoesNotAffectLayering) {
    auto graph = build_ok({
        make_spec("late", {"mid"}),
        make_spec("mid", {"early"}),
        make_spec("early"),
    });
    ASSERT_EQ(graph.wave_count(), 3u);
    EXPECT_EQ(graph.wave_of("early"), 0u);
    EXPECT_EQ(graph.wave_of("mid"), 1u);
    EXPECT_EQ(graph.wave_of("late"), 2u);
}

TEST(TaskGraphTest, RandomDagsSatisfyWaveInvariants) {
    std::mt19937 rng(1234);

    for (int round = 0; round < 25; ++round) {
        const int n = 40;
        std::vector<TaskSpec> specs;
        for (int i = 0; i < n; ++i) {
            std::vector<TaskId> deps;
            for (int j = 0; j < i; ++j) {
                if (rng() % 8 == 0) deps.push_back("t" + std::to_string(j));
            }
            specs.push_back(make_spec("t" + std::to_string(i), std::move(deps)));
        }

        auto graph = build_ok(specs);

        // Every task in exactly one wave
        std::unordered_set<TaskId> seen;
        for (const auto& wave : graph.waves()) {
            EXPECT_FALSE(wave.empty());
            for (const auto& id : wave) {
                EXPECT_TRUE(seen.insert(id).second) << id << " placed twice";
            }
        }
        EXPECT_EQ(seen.size(), static_cast<size_t>(n));

        for (const auto& spec : specs) {
            auto wave = *graph.wave_of(spec.id);
            // Dependencies strictly earlier
            size_t latest_dep = 0;
            for (const auto& dep : spec.dependencies) {
                EXPECT_LT(*graph.wave_of(dep), wave);
                latest_dep = std::max(latest_dep, *graph.wave_of(dep) + 1);
            }
            // Earliest possible wave
            EXPECT_EQ(wave, latest_dep);
            // Wave 0 is exactly the dependency-free tasks
            EXPECT_EQ(wave == 0, spec.dependencies.empty());
        }
    }
}

// ─── Readiness ───────────────────────────────

TEST(TaskGraphTest, ReadyTasksFollowCompletion) {
    auto graph = build_ok({make_spec("a"), make_spec("b", {"a"})});
    EXPECT_EQ(graph.ready_tasks(), (std::vector<TaskId>{"a"}));
    EXPECT_EQ(graph.get_ready_tasks(1), (std::vector<TaskId>{"b"}));

    ASSERT_TRUE(graph.mark_spawned("a", std::chrono::steady_clock::now()));
    EXPECT_TRUE(graph.ready_tasks().empty());
    EXPECT_TRUE(graph.get_ready_tasks(0).empty());

    ASSERT_TRUE(graph.mark_completed("a"));
    EXPECT_EQ(graph.ready_tasks(), (std::vector<TaskId>{"b"}));
    EXPECT_TRUE(graph.get_ready_tasks(7).empty());
}

TEST(TaskGraphTest, WaveTerminality) {
    auto graph = build_ok({make_spec("a"), make_spec("b")});
    EXPECT_FALSE(graph.is_wave_terminal(0));
    ASSERT_TRUE(graph.mark_completed("a"));
    EXPECT_FALSE(graph.is_wave_terminal(0));
    ASSERT_TRUE(graph.mark_failed("b", "crashed"));
    EXPECT_TRUE(graph.is_wave_terminal(0));
    EXPECT_TRUE(graph.is_wave_terminal(5));
    EXPECT_TRUE(graph.all_terminal());
}

// ─── Transitions ─────────────────────────────

TEST(TaskGraphTest, SpawnRecordsTimeOnce) {
    auto graph = build_ok({make_spec("a")});
    auto t0 = std::chrono::steady_clock::now();
    ASSERT_TRUE(graph.mark_spawned("a", t0));
    ASSERT_TRUE(graph.link_handle("a", "agent_deadbeef"));

    auto again = graph.mark_spawned("a", t0 + Millis{10});
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);

    auto task = graph.get_task("a");
    EXPECT_EQ(task->spawn_time, t0);
    EXPECT_EQ(task->handle_ref, "agent_deadbeef");
    EXPECT_EQ(task->status, TaskStatus::Spawned);
}

TEST(TaskGraphTest, RunningRequiresSpawn) {
    auto graph = build_ok({make_spec("a")});
    auto early = graph.mark_running("a");
    ASSERT_FALSE(early);
    EXPECT_EQ(early.error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(graph.mark_spawned("a", std::chrono::steady_clock::now()));
    ASSERT_TRUE(graph.mark_running("a"));
    EXPECT_TRUE(graph.mark_running("a"));
    EXPECT_EQ(graph.get_task("a")->status, TaskStatus::Running);
}

TEST(TaskGraphTest, TerminalTransitionsAreIdempotent) {
    auto graph = build_ok({make_spec("a")});
    ASSERT_TRUE(graph.mark_completed("a"));
    EXPECT_TRUE(graph.mark_completed("a"));
    EXPECT_TRUE(graph.mark_failed("a", "late failure"));
    EXPECT_EQ(graph.get_task("a")->status, TaskStatus::Completed);
    EXPECT_FALSE(graph.get_task("a")->failure_reason.has_value());
}

TEST(TaskGraphTest, UnknownTaskTransitionsFail) {
    auto graph = build_ok({make_spec("a")});
    EXPECT_EQ(graph.mark_completed("ghost").error().code, ErrorCode::NotFound);
    EXPECT_EQ(graph.mark_failed("ghost").error().code, ErrorCode::NotFound);
    EXPECT_EQ(graph.mark_spawned("ghost", {}).error().code, ErrorCode::NotFound);
}

TEST(TaskGraphTest, FailDependentsCascadesTransitively) {
    auto graph = build_ok({
        make_spec("a"),
        make_spec("side"),
        make_spec("b", {"a"}),
        make_spec("c", {"b", "side"}),
        make_spec("d", {"side"}),
    });

    ASSERT_TRUE(graph.mark_failed("a", "exit 1"));
    auto failed = graph.fail_dependents("a");

    EXPECT_EQ(failed, (std::vector<TaskId>{"b", "c"}));
    EXPECT_EQ(graph.get_task("b")->failure_reason, "dependency failed: a");
    EXPECT_EQ(graph.get_task("c")->failure_reason, "dependency failed: b");
    EXPECT_EQ(graph.get_task("d")->status, TaskStatus::Pending);
    EXPECT_EQ(graph.get_task("side")->status, TaskStatus::Pending);

    EXPECT_FALSE(graph.get_task("a")->failed_dependency.has_value());
    EXPECT_EQ(graph.get_task("b")->failed_dependency, "a");
    EXPECT_EQ(graph.get_task("c")->failed_dependency, "b");
}

TEST(TaskGraphTest, ExplicitFailureRecordsNoFailedDependency) {
    auto graph = build_ok({make_spec("a")});
    ASSERT_TRUE(graph.mark_failed("a", "dependency failed: b"));
    EXPECT_EQ(graph.get_task("a")->failure_reason, "dependency failed: b");
    EXPECT_FALSE(graph.get_task("a")->failed_dependency.has_value());
}

TEST(TaskGraphTest, DependentsQuery) {
    auto graph = build_ok({make_spec("a"), make_spec("b", {"a"}), make_spec("c", {"a"})});
    EXPECT_EQ(graph.dependents("a"), (std::vector<TaskId>{"b", "c"}));
    EXPECT_TRUE(graph.dependents("b").empty());
    EXPECT_TRUE(graph.dependents("ghost").empty());
}
