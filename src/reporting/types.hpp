/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Test report data model

**************************************************/

#ifndef CODEPAGE_REPORTING_TYPES_HPP
#define CODEPAGE_REPORTING_TYPES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "script/sandbox/types.hpp"
#include "utils/time_utils.hpp"

namespace codepage::reporting {

using json = nlohmann::json;
using sandbox::ExecutionError;
using sandbox::ExecutionResult;
using utils::TimePoint;

enum class ReportError : uint8_t {
    NoResults,  ///< Nothing recorded for the project/version
    NotFound    ///< Unknown report id
};

[[nodiscard]] constexpr auto reportErrorToString(ReportError error) noexcept
    -> std::string_view {
    switch (error) {
        case ReportError::NoResults:
            return "No test results found for the specified project and version";
        case ReportError::NotFound: return "Report not found";
    }
    return "Unknown";
}

enum class DetailLevel : uint8_t { Basic, Detailed, Comprehensive };

[[nodiscard]] constexpr auto detailLevelToString(DetailLevel level) noexcept
    -> std::string_view {
    switch (level) {
        case DetailLevel::Basic: return "basic";
        case DetailLevel::Detailed: return "detailed";
        case DetailLevel::Comprehensive: return "comprehensive";
    }
    return "detailed";
}

[[nodiscard]] auto detailLevelFromString(std::string_view value)
    -> std::optional<DetailLevel>;

struct ReportOptions {
    bool includePerformanceAnalysis{true};
    bool includeErrorAnalysis{true};
    bool includeRecommendations{true};
    DetailLevel detailLevel{DetailLevel::Detailed};

    [[nodiscard]] static auto fromJson(const json& j) -> ReportOptions;
};

struct TestSummary {
    size_t totalTests{0};
    size_t passedTests{0};
    size_t failedTests{0};
    size_t errorTests{0};
    double successRate{0};  ///< Percent, 0 when there are no tests
    int64_t averageExecutionTimeMs{0};
    int64_t totalExecutionTimeMs{0};
    int64_t averageMemoryUsage{0};
    size_t totalApiCalls{0};

    [[nodiscard]] auto toJson() const -> json;
};

struct Distribution {
    double min{0};
    double max{0};
    double average{0};
    double median{0};
    double p95{0};

    [[nodiscard]] auto toJson() const -> json;
};

struct SlowApiCall {
    std::string testId;
    std::string method;
    int64_t responseTimeMs{0};
    TimePoint timestamp;

    [[nodiscard]] auto toJson() const -> json;
};

struct ApiPerformance {
    size_t totalCalls{0};
    int64_t averageResponseTimeMs{0};
    std::vector<SlowApiCall> slowestCalls;

    [[nodiscard]] auto toJson() const -> json;
};

struct PerformanceAnalysis {
    Distribution executionTime;
    Distribution memoryUsage;
    ApiPerformance apiPerformance;
    std::vector<std::string> performanceIssues;

    [[nodiscard]] auto toJson() const -> json;
};

struct CommonError {
    std::string message;
    size_t count{0};
    std::vector<std::string> affectedTests;

    [[nodiscard]] auto toJson() const -> json;
};

struct ErrorTrendPoint {
    TimePoint hour;  ///< Start of the hour bucket
    size_t errorCount{0};
    double errorRate{0};  ///< Percent of the bucket's results

    [[nodiscard]] auto toJson() const -> json;
};

struct ErrorAnalysis {
    std::map<std::string, size_t> errorsByKind;
    std::vector<CommonError> commonErrors;
    std::vector<ErrorTrendPoint> errorTrends;
    std::vector<ExecutionError> criticalErrors;

    [[nodiscard]] auto toJson() const -> json;
};

struct TestReport {
    std::string id;
    std::string projectId;
    std::string versionId;
    DetailLevel detailLevel{DetailLevel::Detailed};
    std::vector<ExecutionResult> testResults;
    TestSummary summary;
    PerformanceAnalysis performanceAnalysis;
    ErrorAnalysis errorAnalysis;
    std::vector<std::string> recommendations;
    TimePoint generatedAt;

    [[nodiscard]] auto toJson() const -> json;
};

struct ReportingStats {
    size_t totalResults{0};
    size_t totalReports{0};
    std::optional<TimePoint> oldestResult;
    std::optional<TimePoint> newestResult;
    size_t averageResultsPerProject{0};

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace codepage::reporting

#endif  // CODEPAGE_REPORTING_TYPES_HPP
