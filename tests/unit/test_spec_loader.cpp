/**
 * @file test_spec_loader.cpp
 * @brief Unit tests for TOML task specification loading.
 * @author Dimitris Kafetzis
 */

#include "workload/spec_loader.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace wave_delegator;

static const TaskSpec* find_spec(const std::vector<TaskSpec>& specs, const TaskId& id) {
    auto it = std::find_if(specs.begin(), specs.end(),
                           [&](const TaskSpec& s) { return s.id == id; });
    return it == specs.end() ? nullptr : &*it;
}

TEST(SpecLoaderTest, ParsesTasks) {
    auto specs = parse_task_specs(R"(
        [tasks.research]
        description = "Research codebase"
        worker_type = "explore"
        depends_on = []

        [tasks.docs]
        description = "Read the docs"
        worker_type = "dewey"

        [tasks.implement]
        description = "Implement feature"
        worker_type = "frontend"
        depends_on = ["research", "docs"]
    )");
    ASSERT_TRUE(specs.has_value()) << specs.error().message;
    ASSERT_EQ(specs->size(), 3u);

    const auto* implement = find_spec(*specs, "implement");
    ASSERT_NE(implement, nullptr);
    EXPECT_EQ(implement->worker_type, WorkerType::Frontend);
    EXPECT_EQ(implement->description, "Implement feature");
    EXPECT_EQ(implement->dependencies, (std::vector<TaskId>{"research", "docs"}));

    const auto* docs = find_spec(*specs, "docs");
    ASSERT_NE(docs, nullptr);
    EXPECT_TRUE(docs->dependencies.empty());
}

TEST(SpecLoaderTest, WorkerTypeDefaultsToGeneral) {
    auto specs = parse_task_specs(R"(
        [tasks.lint]
        description = "Run linter"
    )");
    ASSERT_TRUE(specs.has_value());
    EXPECT_EQ((*specs)[0].worker_type, WorkerType::General);
}

TEST(SpecLoaderTest, DashedWorkerTypeAccepted) {
    auto specs = parse_task_specs(R"(
        [tasks.review]
        worker_type = "code-reviewer"
    )");
    ASSERT_TRUE(specs.has_value());
    EXPECT_EQ((*specs)[0].worker_type, WorkerType::CodeReviewer);
}

TEST(SpecLoaderTest, UnknownWorkerTypeRejected) {
    auto specs = parse_task_specs(R"(
        [tasks.x]
        worker_type = "wizard"
    )");
    ASSERT_FALSE(specs.has_value());
    EXPECT_EQ(specs.error().code, ErrorCode::Config);
    EXPECT_NE(specs.error().message.find("wizard"), std::string::npos);
}

TEST(SpecLoaderTest, MissingTasksTableRejected) {
    auto specs = parse_task_specs(R"(
        [jobs.x]
        description = "wrong table"
    )");
    ASSERT_FALSE(specs.has_value());
    EXPECT_EQ(specs.error().code, ErrorCode::Config);
}

TEST(SpecLoaderTest, NonArrayDependsOnRejected) {
    auto specs = parse_task_specs(R"(
        [tasks.x]
        depends_on = "y"
    )");
    EXPECT_FALSE(specs.has_value());
}

TEST(SpecLoaderTest, NonStringDependencyRejected) {
    auto specs = parse_task_specs(R"(
        [tasks.x]
        depends_on = [1, 2]
    )");
    EXPECT_FALSE(specs.has_value());
}

TEST(SpecLoaderTest, MissingFile) {
    auto specs = load_task_specs("/nonexistent/tasks.toml");
    ASSERT_FALSE(specs.has_value());
    EXPECT_EQ(specs.error().code, ErrorCode::Config);
}

TEST(SpecLoaderTest, ParsedSpecsBuildGraph) {
    auto specs = parse_task_specs(R"(
        [tasks.a]
        [tasks.b]
        depends_on = ["a"]
        [tasks.c]
        depends_on = ["b", "a"]
    )");
    ASSERT_TRUE(specs.has_value());

    auto graph = TaskGraph::build(std::move(*specs));
    ASSERT_TRUE(graph.has_value()) << graph.error().message;
    EXPECT_EQ(graph->wave_count(), 3u);
}
