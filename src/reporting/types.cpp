/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

namespace codepage::reporting {

namespace {

auto isoOrNull(const std::optional<TimePoint>& tp) -> json {
    return tp ? json(utils::toIsoString(*tp)) : json(nullptr);
}

}  // namespace

auto detailLevelFromString(std::string_view value)
    -> std::optional<DetailLevel> {
    if (value == "basic") {
        return DetailLevel::Basic;
    }
    if (value == "detailed") {
        return DetailLevel::Detailed;
    }
    if (value == "comprehensive") {
        return DetailLevel::Comprehensive;
    }
    return std::nullopt;
}

auto ReportOptions::fromJson(const json& j) -> ReportOptions {
    ReportOptions options;
    options.includePerformanceAnalysis =
        j.value("includePerformanceAnalysis", options.includePerformanceAnalysis);
    options.includeErrorAnalysis =
        j.value("includeErrorAnalysis", options.includeErrorAnalysis);
    options.includeRecommendations =
        j.value("includeRecommendations", options.includeRecommendations);
    if (auto it = j.find("detailLevel"); it != j.end() && it->is_string()) {
        options.detailLevel = detailLevelFromString(it->get<std::string>())
                                  .value_or(options.detailLevel);
    }
    return options;
}

auto TestSummary::toJson() const -> json {
    return {{"totalTests", totalTests},
            {"passedTests", passedTests},
            {"failedTests", failedTests},
            {"errorTests", errorTests},
            {"successRate", successRate},
            {"averageExecutionTime", averageExecutionTimeMs},
            {"totalExecutionTime", totalExecutionTimeMs},
            {"averageMemoryUsage", averageMemoryUsage},
            {"totalApiCalls", totalApiCalls}};
}

auto Distribution::toJson() const -> json {
    return {{"min", min},
            {"max", max},
            {"average", average},
            {"median", median},
            {"p95", p95}};
}

auto SlowApiCall::toJson() const -> json {
    return {{"testId", testId},
            {"method", method},
            {"responseTime", responseTimeMs},
            {"timestamp", utils::toIsoString(timestamp)}};
}

auto ApiPerformance::toJson() const -> json {
    json calls = json::array();
    for (const auto& call : slowestCalls) {
        calls.push_back(call.toJson());
    }
    return {{"totalCalls", totalCalls},
            {"averageResponseTime", averageResponseTimeMs},
            {"slowestCalls", std::move(calls)}};
}

auto PerformanceAnalysis::toJson() const -> json {
    return {{"executionTimeDistribution", executionTime.toJson()},
            {"memoryUsageDistribution", memoryUsage.toJson()},
            {"apiPerformance", apiPerformance.toJson()},
            {"performanceIssues", performanceIssues}};
}

auto CommonError::toJson() const -> json {
    return {{"message", message},
            {"count", count},
            {"affectedTests", affectedTests}};
}

auto ErrorTrendPoint::toJson() const -> json {
    return {{"timestamp", utils::toIsoString(hour)},
            {"errorCount", errorCount},
            {"errorRate", errorRate}};
}

auto ErrorAnalysis::toJson() const -> json {
    json common = json::array();
    for (const auto& error : commonErrors) {
        common.push_back(error.toJson());
    }
    json trends = json::array();
    for (const auto& point : errorTrends) {
        trends.push_back(point.toJson());
    }
    json critical = json::array();
    for (const auto& error : criticalErrors) {
        critical.push_back(error.toJson());
    }
    return {{"errorsByType", errorsByKind},
            {"commonErrors", std::move(common)},
            {"errorTrends", std::move(trends)},
            {"criticalErrors", std::move(critical)}};
}

auto TestReport::toJson() const -> json {
    json results = json::array();
    for (const auto& result : testResults) {
        results.push_back(result.toJson());
    }
    return {{"id", id},
            {"projectId", projectId},
            {"versionId", versionId},
            {"detailLevel", detailLevelToString(detailLevel)},
            {"testResults", std::move(results)},
            {"summary", summary.toJson()},
            {"performanceAnalysis", performanceAnalysis.toJson()},
            {"errorAnalysis", errorAnalysis.toJson()},
            {"recommendations", recommendations},
            {"generatedAt", utils::toIsoString(generatedAt)}};
}

auto ReportingStats::toJson() const -> json {
    return {{"totalResults", totalResults},
            {"totalReports", totalReports},
            {"oldestResult", isoOrNull(oldestResult)},
            {"newestResult", isoOrNull(newestResult)},
            {"averageResultsPerProject", averageResultsPerProject}};
}

}  // namespace codepage::reporting
