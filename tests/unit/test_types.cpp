/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace wave_delegator;

TEST(WorkerTypeTest, ToString) {
    EXPECT_EQ(to_string(WorkerType::Explore), "explore");
    EXPECT_EQ(to_string(WorkerType::ResearchLead), "research_lead");
    EXPECT_EQ(to_string(WorkerType::General), "general");
}

TEST(WorkerTypeTest, ParseRoundTripsEveryType) {
    for (auto type : kAllWorkerTypes) {
        auto parsed = parse_worker_type(to_string(type));
        ASSERT_TRUE(parsed.has_value()) << to_string(type);
        EXPECT_EQ(*parsed, type);
    }
}

TEST(WorkerTypeTest, ParseAcceptsDashesAndCase) {
    EXPECT_EQ(parse_worker_type("code-reviewer"), WorkerType::CodeReviewer);
    EXPECT_EQ(parse_worker_type("Document-Writer"), WorkerType::DocumentWriter);
    EXPECT_EQ(parse_worker_type("DELPHI"), WorkerType::Delphi);
}

TEST(WorkerTypeTest, ParseRejectsUnknown) {
    EXPECT_FALSE(parse_worker_type("oracle").has_value());
    EXPECT_FALSE(parse_worker_type("").has_value());
}

TEST(TaskStatusTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(TaskStatus::Pending));
    EXPECT_FALSE(is_terminal(TaskStatus::Spawned));
    EXPECT_FALSE(is_terminal(TaskStatus::Running));
    EXPECT_TRUE(is_terminal(TaskStatus::Completed));
    EXPECT_TRUE(is_terminal(TaskStatus::Failed));
    EXPECT_EQ(to_string(TaskStatus::Spawned), "spawned");
}

TEST(ProcessStatusTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(ProcessStatus::Running));
    EXPECT_TRUE(is_terminal(ProcessStatus::Cancelled));
    EXPECT_EQ(to_string(ProcessStatus::Cancelled), "cancelled");
}
