/*
 * analysis.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "analysis.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <numeric>

#include <spdlog/fmt/fmt.h>

namespace codepage::reporting {

namespace {

auto containsIgnoreCase(std::string_view haystack, std::string_view needle)
    -> bool {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                          needle.end(), [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

auto hasErrors(const ExecutionResult& result) -> bool {
    return result.status == sandbox::ExecutionStatus::Error ||
           !result.errors.empty();
}

auto truncateUtf8(const std::string& text, size_t limit) -> std::string {
    if (text.size() <= limit) {
        return text;
    }
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

}  // namespace

auto percentile(std::span<const double> sorted, double p) -> double {
    if (sorted.empty()) {
        return 0;
    }
    auto n = static_cast<double>(sorted.size());
    auto index = static_cast<int64_t>(std::ceil(p / 100.0 * n)) - 1;
    index = std::clamp<int64_t>(index, 0,
                                static_cast<int64_t>(sorted.size()) - 1);
    return sorted[static_cast<size_t>(index)];
}

auto median(std::span<const double> sorted) -> double {
    if (sorted.empty()) {
        return 0;
    }
    size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 0) {
        return (sorted[mid - 1] + sorted[mid]) / 2.0;
    }
    return sorted[mid];
}

auto distribution(std::vector<double> values) -> Distribution {
    Distribution d;
    if (values.empty()) {
        return d;
    }
    std::sort(values.begin(), values.end());
    d.min = values.front();
    d.max = values.back();
    d.average = std::round(std::accumulate(values.begin(), values.end(), 0.0) /
                           static_cast<double>(values.size()));
    d.median = std::round(median(values));
    d.p95 = percentile(values, 95);
    return d;
}

auto summarize(std::span<const ExecutionResult> results) -> TestSummary {
    TestSummary summary;
    summary.totalTests = results.size();
    int64_t totalMemory = 0;
    for (const auto& result : results) {
        switch (result.status) {
            case sandbox::ExecutionStatus::Passed: summary.passedTests++; break;
            case sandbox::ExecutionStatus::Failed: summary.failedTests++; break;
            case sandbox::ExecutionStatus::Error: summary.errorTests++; break;
        }
        summary.totalExecutionTimeMs += result.executionTimeMs;
        totalMemory += static_cast<int64_t>(result.peakMemoryBytes);
        summary.totalApiCalls += result.apiCallCount;
    }
    if (summary.totalTests > 0) {
        auto n = static_cast<double>(summary.totalTests);
        summary.successRate = static_cast<double>(summary.passedTests) / n * 100.0;
        summary.averageExecutionTimeMs = static_cast<int64_t>(
            std::llround(static_cast<double>(summary.totalExecutionTimeMs) / n));
        summary.averageMemoryUsage = static_cast<int64_t>(
            std::llround(static_cast<double>(totalMemory) / n));
    }
    return summary;
}

auto analyzePerformance(std::span<const ExecutionResult> results)
    -> PerformanceAnalysis {
    PerformanceAnalysis analysis;

    std::vector<double> times;
    std::vector<double> memory;
    std::vector<SlowApiCall> calls;
    double totalResponseTime = 0;
    for (const auto& result : results) {
        times.push_back(static_cast<double>(result.executionTimeMs));
        memory.push_back(static_cast<double>(result.peakMemoryBytes));
        analysis.apiPerformance.totalCalls += result.apiCallCount;
        totalResponseTime += result.performanceMetrics.avgApiResponseTimeMs *
                             static_cast<double>(result.apiCallCount);
        for (const auto& call : result.apiCalls) {
            calls.push_back(
                {result.id, call.method, call.duration.count(), call.timestamp});
        }
    }
    analysis.executionTime = distribution(std::move(times));
    analysis.memoryUsage = distribution(std::move(memory));

    double averageResponse =
        analysis.apiPerformance.totalCalls > 0
            ? totalResponseTime /
                  static_cast<double>(analysis.apiPerformance.totalCalls)
            : 0.0;
    analysis.apiPerformance.averageResponseTimeMs =
        static_cast<int64_t>(std::llround(averageResponse));

    std::stable_sort(calls.begin(), calls.end(),
                     [](const SlowApiCall& a, const SlowApiCall& b) {
                         return a.responseTimeMs > b.responseTimeMs;
                     });
    if (calls.size() > kTopSlowCalls) {
        calls.resize(kTopSlowCalls);
    }
    analysis.apiPerformance.slowestCalls = std::move(calls);

    if (analysis.executionTime.p95 > kSlowP95ExecutionMs) {
        analysis.performanceIssues.emplace_back(
            "95th percentile execution time exceeds 10 seconds");
    }
    if (analysis.memoryUsage.p95 > kHighP95MemoryBytes) {
        analysis.performanceIssues.emplace_back(
            "95th percentile memory usage exceeds 100MB");
    }
    if (averageResponse > kSlowAverageApiMs) {
        analysis.performanceIssues.emplace_back(
            "Average API response time exceeds 1 second");
    }
    return analysis;
}

auto isCriticalError(const ExecutionError& error) -> bool {
    if (error.kind == "NameError" || error.kind == "ReferenceError" ||
        error.kind == "TypeError") {
        return true;
    }
    return containsIgnoreCase(error.message, "timeout") ||
           containsIgnoreCase(error.message, "timed out") ||
           containsIgnoreCase(error.message, "memory");
}

auto analyzeErrors(std::span<const ExecutionResult> results) -> ErrorAnalysis {
    ErrorAnalysis analysis;

    // Insertion order breaks ties between equally common messages
    std::vector<CommonError> groups;
    std::map<std::string, size_t> groupIndex;
    std::map<int64_t, std::pair<size_t, size_t>> hours;  // total, errors

    for (const auto& result : results) {
        for (const auto& error : result.errors) {
            analysis.errorsByKind[error.kind]++;

            auto key = truncateUtf8(error.message, kMessageGroupLength);
            auto [it, inserted] = groupIndex.try_emplace(key, groups.size());
            if (inserted) {
                groups.push_back({key, 0, {}});
            }
            auto& group = groups[it->second];
            group.count++;
            group.affectedTests.push_back(result.id);

            if (isCriticalError(error) &&
                analysis.criticalErrors.size() < kTopCriticalErrors) {
                analysis.criticalErrors.push_back(error);
            }
        }

        auto hour = std::chrono::floor<std::chrono::hours>(result.createdAt);
        auto& bucket = hours[utils::toEpochMillis(hour)];
        bucket.first++;
        if (hasErrors(result)) {
            bucket.second++;
        }
    }

    std::stable_sort(groups.begin(), groups.end(),
                     [](const CommonError& a, const CommonError& b) {
                         return a.count > b.count;
                     });
    if (groups.size() > kTopCommonErrors) {
        groups.resize(kTopCommonErrors);
    }
    analysis.commonErrors = std::move(groups);

    for (const auto& [hourMs, counts] : hours) {
        ErrorTrendPoint point;
        point.hour = utils::fromEpochMillis(hourMs);
        point.errorCount = counts.second;
        point.errorRate = counts.first > 0
                              ? static_cast<double>(counts.second) /
                                    static_cast<double>(counts.first) * 100.0
                              : 0.0;
        analysis.errorTrends.push_back(point);
    }
    return analysis;
}

auto recommend(const TestSummary& summary,
               const PerformanceAnalysis& performance,
               const ErrorAnalysis& errors) -> std::vector<std::string> {
    std::vector<std::string> out;

    if (summary.successRate < 80) {
        out.emplace_back(
            "Test success rate is below 80%. Review and fix failing tests to "
            "improve reliability.");
    } else if (summary.successRate < 95) {
        out.emplace_back(
            "Test success rate could be improved. Consider investigating "
            "intermittent failures.");
    }

    if (performance.executionTime.average > 5000) {
        out.emplace_back(
            "Average execution time exceeds 5 seconds. Consider optimizing "
            "codepage logic or reducing API calls.");
    }
    if (performance.memoryUsage.average > 50.0 * 1024 * 1024) {
        out.emplace_back(
            "Average memory usage exceeds 50MB. Review memory-intensive "
            "operations and consider optimization.");
    }
    if (performance.apiPerformance.averageResponseTimeMs > 500) {
        out.emplace_back(
            "API response times are high. Consider caching frequently "
            "accessed data or optimizing queries.");
    }

    if (!errors.criticalErrors.empty()) {
        out.emplace_back(
            "Critical errors detected. Prioritize fixing NameError, TypeError "
            "and timeout issues.");
    }
    if (!errors.commonErrors.empty() &&
        static_cast<double>(errors.commonErrors.front().count) >
            static_cast<double>(summary.totalTests) * 0.1) {
        out.push_back(fmt::format(
            "Most common error affects {} tests. Focus on resolving: \"{}\"",
            errors.commonErrors.front().count,
            errors.commonErrors.front().message));
    }

    if (summary.totalApiCalls > summary.totalTests * 20) {
        out.emplace_back(
            "High API call volume detected. Consider batching operations or "
            "implementing caching.");
    }
    if (summary.totalTests < 10) {
        out.emplace_back(
            "Consider adding more comprehensive test cases to improve "
            "coverage and reliability.");
    }
    return out;
}

}  // namespace codepage::reporting
