/*
 * test_analysis.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "reporting/analysis.hpp"

using namespace codepage::reporting;
using codepage::sandbox::ApiCallRecord;
using codepage::sandbox::ExecutionStatus;
using namespace std::chrono_literals;

namespace {

const TimePoint kBase = codepage::utils::fromEpochMillis(1714564800000);  // 12:00Z

ExecutionResult makeResult(const std::string& id, ExecutionStatus status,
                           int64_t timeMs, size_t memory = 1024,
                           TimePoint createdAt = kBase) {
    ExecutionResult result;
    result.id = id;
    result.projectId = "p1";
    result.versionId = "v1";
    result.status = status;
    result.executionTimeMs = timeMs;
    result.peakMemoryBytes = memory;
    result.createdAt = createdAt;
    result.completedAt = createdAt + std::chrono::milliseconds(timeMs);
    return result;
}

ExecutionError makeError(const std::string& kind, const std::string& message) {
    ExecutionError error;
    error.kind = kind;
    error.message = message;
    return error;
}

}  // namespace

TEST(PercentileTest, NearestRank) {
    std::vector<double> sorted{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    EXPECT_DOUBLE_EQ(percentile(sorted, 95), 10);
    EXPECT_DOUBLE_EQ(percentile(sorted, 50), 5);
    EXPECT_DOUBLE_EQ(percentile(sorted, 10), 1);
    EXPECT_DOUBLE_EQ(percentile(sorted, 0), 1);
    EXPECT_DOUBLE_EQ(percentile({}, 95), 0);
}

TEST(PercentileTest, SingleValueIsEveryPercentile) {
    std::vector<double> sorted{42};
    EXPECT_DOUBLE_EQ(percentile(sorted, 1), 42);
    EXPECT_DOUBLE_EQ(percentile(sorted, 95), 42);
    EXPECT_DOUBLE_EQ(percentile(sorted, 100), 42);
}

TEST(PercentileTest, MedianOfEvenCountAveragesMiddle) {
    std::vector<double> even{1, 2, 3, 4};
    std::vector<double> odd{1, 5, 9};
    EXPECT_DOUBLE_EQ(median(even), 2.5);
    EXPECT_DOUBLE_EQ(median(odd), 5);
    EXPECT_DOUBLE_EQ(median({}), 0);
}

TEST(DistributionTest, SortsUnorderedInput) {
    auto d = distribution({300, 100, 200, 400});
    EXPECT_DOUBLE_EQ(d.min, 100);
    EXPECT_DOUBLE_EQ(d.max, 400);
    EXPECT_DOUBLE_EQ(d.average, 250);
    EXPECT_DOUBLE_EQ(d.median, 250);
    EXPECT_DOUBLE_EQ(d.p95, 400);
}

TEST(DistributionTest, EmptyIsZero) {
    auto d = distribution({});
    EXPECT_DOUBLE_EQ(d.min, 0);
    EXPECT_DOUBLE_EQ(d.max, 0);
    EXPECT_DOUBLE_EQ(d.p95, 0);
}

TEST(SummarizeTest, CountsAndAverages) {
    std::vector<ExecutionResult> results{
        makeResult("t1", ExecutionStatus::Passed, 100, 1000),
        makeResult("t2", ExecutionStatus::Passed, 200, 2000),
        makeResult("t3", ExecutionStatus::Failed, 300, 3000),
        makeResult("t4", ExecutionStatus::Error, 401, 4000)};
    results[0].apiCallCount = 3;
    results[2].apiCallCount = 2;

    auto summary = summarize(results);
    EXPECT_EQ(summary.totalTests, 4u);
    EXPECT_EQ(summary.passedTests, 2u);
    EXPECT_EQ(summary.failedTests, 1u);
    EXPECT_EQ(summary.errorTests, 1u);
    EXPECT_DOUBLE_EQ(summary.successRate, 50.0);
    EXPECT_EQ(summary.totalExecutionTimeMs, 1001);
    EXPECT_EQ(summary.averageExecutionTimeMs, 250);
    EXPECT_EQ(summary.averageMemoryUsage, 2500);
    EXPECT_EQ(summary.totalApiCalls, 5u);
}

TEST(SummarizeTest, EmptyHasZeroSuccessRate) {
    auto summary = summarize({});
    EXPECT_EQ(summary.totalTests, 0u);
    EXPECT_DOUBLE_EQ(summary.successRate, 0);
    EXPECT_EQ(summary.averageExecutionTimeMs, 0);
}

TEST(AnalyzePerformanceTest, SlowestCallsAndIssues) {
    std::vector<ExecutionResult> results;
    for (int i = 0; i < 3; ++i) {
        auto result = makeResult("t" + std::to_string(i),
                                 ExecutionStatus::Passed, 12000,
                                 200u * 1024 * 1024);
        for (int j = 0; j < 3; ++j) {
            ApiCallRecord call;
            call.method = "query";
            call.duration = std::chrono::milliseconds(1000 + i * 100 + j);
            call.timestamp = kBase;
            result.apiCalls.push_back(call);
        }
        result.apiCallCount = result.apiCalls.size();
        result.performanceMetrics.avgApiResponseTimeMs = 1500;
        results.push_back(result);
    }

    auto analysis = analyzePerformance(results);
    EXPECT_EQ(analysis.apiPerformance.totalCalls, 9u);
    EXPECT_EQ(analysis.apiPerformance.averageResponseTimeMs, 1500);
    ASSERT_EQ(analysis.apiPerformance.slowestCalls.size(), kTopSlowCalls);
    EXPECT_EQ(analysis.apiPerformance.slowestCalls.front().testId, "t2");
    EXPECT_EQ(analysis.apiPerformance.slowestCalls.front().responseTimeMs, 1202);
    EXPECT_EQ(analysis.apiPerformance.slowestCalls.back().responseTimeMs, 1101);

    ASSERT_EQ(analysis.performanceIssues.size(), 3u);
    EXPECT_EQ(analysis.performanceIssues[0],
              "95th percentile execution time exceeds 10 seconds");
    EXPECT_EQ(analysis.performanceIssues[1],
              "95th percentile memory usage exceeds 100MB");
    EXPECT_EQ(analysis.performanceIssues[2],
              "Average API response time exceeds 1 second");
}

TEST(AnalyzePerformanceTest, FastRunsHaveNoIssues) {
    std::vector<ExecutionResult> results{
        makeResult("t1", ExecutionStatus::Passed, 50),
        makeResult("t2", ExecutionStatus::Passed, 70)};

    auto analysis = analyzePerformance(results);
    EXPECT_TRUE(analysis.performanceIssues.empty());
    EXPECT_EQ(analysis.apiPerformance.averageResponseTimeMs, 0);
    EXPECT_DOUBLE_EQ(analysis.executionTime.average, 60);
}

TEST(IsCriticalErrorTest, KindsAndMessages) {
    EXPECT_TRUE(isCriticalError(makeError("NameError", "x is not defined")));
    EXPECT_TRUE(isCriticalError(makeError("TypeError", "bad operand")));
    EXPECT_TRUE(isCriticalError(
        makeError("TimeoutExceeded", "Execution timed out after 200ms")));
    EXPECT_TRUE(isCriticalError(makeError("Error", "Connection TIMEOUT")));
    EXPECT_TRUE(isCriticalError(makeError("MemoryExceeded", "Out of memory")));
    EXPECT_FALSE(isCriticalError(makeError("AssertionError", "expected 3")));
    EXPECT_FALSE(isCriticalError(makeError("ValueError", "bad value")));
}

TEST(AnalyzeErrorsTest, GroupsByMessageAndKind) {
    auto r1 = makeResult("t1", ExecutionStatus::Failed, 10);
    r1.errors = {makeError("AssertionError", "stock mismatch")};
    auto r2 = makeResult("t2", ExecutionStatus::Failed, 10);
    r2.errors = {makeError("AssertionError", "stock mismatch")};
    auto r3 = makeResult("t3", ExecutionStatus::Error, 10);
    r3.errors = {makeError("NameError", "name 'x' is not defined")};
    auto r4 = makeResult("t4", ExecutionStatus::Passed, 10);
    std::vector<ExecutionResult> results{r1, r2, r3, r4};

    auto analysis = analyzeErrors(results);
    EXPECT_EQ(analysis.errorsByKind["AssertionError"], 2u);
    EXPECT_EQ(analysis.errorsByKind["NameError"], 1u);

    ASSERT_EQ(analysis.commonErrors.size(), 2u);
    EXPECT_EQ(analysis.commonErrors[0].message, "stock mismatch");
    EXPECT_EQ(analysis.commonErrors[0].count, 2u);
    EXPECT_EQ(analysis.commonErrors[0].affectedTests,
              (std::vector<std::string>{"t1", "t2"}));

    ASSERT_EQ(analysis.criticalErrors.size(), 1u);
    EXPECT_EQ(analysis.criticalErrors[0].kind, "NameError");
}

TEST(AnalyzeErrorsTest, LongMessagesShareGroupByPrefix) {
    std::string prefix(kMessageGroupLength, 'a');
    auto r1 = makeResult("t1", ExecutionStatus::Error, 10);
    r1.errors = {makeError("ValueError", prefix + " first tail")};
    auto r2 = makeResult("t2", ExecutionStatus::Error, 10);
    r2.errors = {makeError("ValueError", prefix + " second tail")};
    std::vector<ExecutionResult> results{r1, r2};

    auto analysis = analyzeErrors(results);
    ASSERT_EQ(analysis.commonErrors.size(), 1u);
    EXPECT_EQ(analysis.commonErrors[0].message, prefix);
    EXPECT_EQ(analysis.commonErrors[0].count, 2u);
}

TEST(AnalyzeErrorsTest, CriticalErrorsAreCapped) {
    std::vector<ExecutionResult> results;
    for (int i = 0; i < 8; ++i) {
        auto result = makeResult("t" + std::to_string(i),
                                 ExecutionStatus::Error, 10);
        result.errors = {makeError("TypeError", "bad " + std::to_string(i))};
        results.push_back(result);
    }
    auto analysis = analyzeErrors(results);
    EXPECT_EQ(analysis.criticalErrors.size(), kTopCriticalErrors);
    EXPECT_EQ(analysis.commonErrors.size(), 8u);
}

TEST(AnalyzeErrorsTest, HourlyTrends) {
    auto r1 = makeResult("t1", ExecutionStatus::Error, 10, 0, kBase + 5min);
    r1.errors = {makeError("ValueError", "bad")};
    auto r2 = makeResult("t2", ExecutionStatus::Passed, 10, 0, kBase + 10min);
    auto r3 = makeResult("t3", ExecutionStatus::Passed, 10, 0, kBase + 70min);
    std::vector<ExecutionResult> results{r3, r1, r2};

    auto analysis = analyzeErrors(results);
    ASSERT_EQ(analysis.errorTrends.size(), 2u);
    EXPECT_EQ(analysis.errorTrends[0].hour, kBase);
    EXPECT_EQ(analysis.errorTrends[0].errorCount, 1u);
    EXPECT_DOUBLE_EQ(analysis.errorTrends[0].errorRate, 50.0);
    EXPECT_EQ(analysis.errorTrends[1].hour, kBase + 1h);
    EXPECT_EQ(analysis.errorTrends[1].errorCount, 0u);
    EXPECT_DOUBLE_EQ(analysis.errorTrends[1].errorRate, 0.0);
}

TEST(RecommendTest, HealthyLargeSuiteHasNone) {
    TestSummary summary;
    summary.totalTests = 50;
    summary.passedTests = 50;
    summary.successRate = 100;
    summary.totalApiCalls = 100;

    EXPECT_TRUE(recommend(summary, {}, {}).empty());
}

TEST(RecommendTest, OrderFollowsCategories) {
    TestSummary summary;
    summary.totalTests = 5;
    summary.successRate = 40;
    summary.totalApiCalls = 500;

    PerformanceAnalysis performance;
    performance.executionTime.average = 6000;
    performance.memoryUsage.average = 60.0 * 1024 * 1024;
    performance.apiPerformance.averageResponseTimeMs = 800;

    ErrorAnalysis errors;
    errors.criticalErrors = {makeError("NameError", "x")};
    errors.commonErrors = {{"x", 3, {"t1", "t2", "t3"}}};

    auto out = recommend(summary, performance, errors);
    ASSERT_EQ(out.size(), 8u);
    EXPECT_EQ(out[0].rfind("Test success rate is below 80%", 0), 0u);
    EXPECT_EQ(out[1].rfind("Average execution time exceeds 5 seconds", 0), 0u);
    EXPECT_EQ(out[2].rfind("Average memory usage exceeds 50MB", 0), 0u);
    EXPECT_EQ(out[3].rfind("API response times are high", 0), 0u);
    EXPECT_EQ(out[4].rfind("Critical errors detected", 0), 0u);
    EXPECT_EQ(out[5],
              "Most common error affects 3 tests. Focus on resolving: \"x\"");
    EXPECT_EQ(out[6].rfind("High API call volume detected", 0), 0u);
    EXPECT_EQ(out[7].rfind("Consider adding more comprehensive test cases", 0),
              0u);
}

TEST(RecommendTest, ModerateSuccessRate) {
    TestSummary summary;
    summary.totalTests = 20;
    summary.passedTests = 18;
    summary.successRate = 90;

    auto out = recommend(summary, {}, {});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].rfind("Test success rate could be improved", 0), 0u);
}
