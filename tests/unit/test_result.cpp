/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and Error codes.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace wave_delegator;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorDefaultsToGenericCode) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_TRUE(r.error().is(ErrorCode::Generic));
}

TEST(ResultTest, ErrorCarriesCode) {
    Result<int> r = Error{ErrorCode::Cycle, "Task dependencies contain a cycle"};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Cycle);
    EXPECT_FALSE(r.error().is(ErrorCode::Validation));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapPropagatesError) {
    Result<int> r = Error{ErrorCode::Spawn, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::Spawn);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 20;
    auto chained = r.and_then([](int v) -> Result<std::string> {
        if (v > 10) return std::to_string(v);
        return Error{ErrorCode::Validation, "too small"};
    });
    ASSERT_TRUE(chained);
    EXPECT_EQ(*chained, "20");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorCode::WaveIncomplete, "not yet"};
    EXPECT_TRUE(ok);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::WaveIncomplete);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorCode::NotFound, "missing");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().what(), "missing");
}

TEST(ErrorCodeTest, ToString) {
    EXPECT_EQ(to_string(ErrorCode::ParallelExecution), "parallel_execution");
    EXPECT_EQ(to_string(ErrorCode::DependencyFailed), "dependency_failed");
    EXPECT_EQ(to_string(ErrorCode::UnknownDependency), "unknown_dependency");
}
