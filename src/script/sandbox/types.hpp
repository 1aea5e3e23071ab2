/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Sandboxed script execution type definitions
 */

#ifndef CODEPAGE_SCRIPT_SANDBOX_TYPES_HPP
#define CODEPAGE_SCRIPT_SANDBOX_TYPES_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "utils/time_utils.hpp"

namespace codepage::sandbox {

using json = nlohmann::json;
using utils::TimePoint;

/**
 * @brief Deployment environment a script is tested for
 */
enum class Environment { Development, Staging, Production };

[[nodiscard]] constexpr std::string_view environmentToString(
    Environment env) noexcept {
    switch (env) {
        case Environment::Development: return "development";
        case Environment::Staging: return "staging";
        case Environment::Production: return "production";
    }
    return "development";
}

[[nodiscard]] std::optional<Environment> environmentFromString(
    std::string_view value);

enum class ExecutionStatus { Passed, Failed, Error };

[[nodiscard]] constexpr std::string_view executionStatusToString(
    ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Passed: return "passed";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Error: return "error";
    }
    return "error";
}

/**
 * @brief Terminal limit violations, first one wins
 */
enum class LimitViolation {
    TimeoutExceeded,
    MemoryExceeded,
    ApiCallLimitExceeded,
    Cancelled
};

[[nodiscard]] constexpr std::string_view limitViolationToString(
    LimitViolation violation) noexcept {
    switch (violation) {
        case LimitViolation::TimeoutExceeded: return "TimeoutExceeded";
        case LimitViolation::MemoryExceeded: return "MemoryExceeded";
        case LimitViolation::ApiCallLimitExceeded: return "ApiCallLimitExceeded";
        case LimitViolation::Cancelled: return "Cancelled";
    }
    return "Cancelled";
}

/**
 * @brief Error kinds produced by the sandbox itself rather than by a script
 */
namespace error_kind {
inline constexpr std::string_view kSecurityViolation = "SecurityViolation";
inline constexpr std::string_view kSyntaxError = "SyntaxError";
inline constexpr std::string_view kInfrastructureError = "InfrastructureError";
inline constexpr std::string_view kAssertionError = "AssertionError";
}  // namespace error_kind

/**
 * @brief Resource ceilings of one run
 */
struct ExecutionConfig {
    std::chrono::milliseconds timeout{30000};      ///< Wall-clock limit
    size_t memoryLimitBytes{128 * 1024 * 1024};    ///< Resident memory limit
    size_t apiCallLimit{100};                      ///< Mock API calls allowed
    Environment environment{Environment::Development};

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Caller-supplied partial config, merged onto the platform defaults
 */
struct ExecutionOverrides {
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<size_t> memoryLimitBytes;
    std::optional<size_t> apiCallLimit;
    std::optional<Environment> environment;

    [[nodiscard]] ExecutionConfig applyTo(ExecutionConfig defaults) const;

    /**
     * @brief Read {timeout, memoryLimit, apiCallLimit, environment}; unknown
     * keys are ignored
     */
    [[nodiscard]] static ExecutionOverrides fromJson(const json& j);
};

struct ApiCallRecord {
    std::string method;
    json params;
    json response;
    TimePoint timestamp;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] json toJson() const;
};

struct ExecutionError {
    std::string message;
    std::optional<std::string> stack;
    std::string kind;
    std::optional<int> lineNumber;
    std::optional<int> columnNumber;

    [[nodiscard]] json toJson() const;
};

struct PerformanceMetrics {
    int64_t executionTimeMs{0};
    size_t memoryUsage{0};           ///< max(memorySamples)
    size_t apiCallCount{0};
    double avgApiResponseTimeMs{0};  ///< 0 when no call was made

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Immutable outcome of one run
 */
struct ExecutionResult {
    std::string id;
    std::string projectId;
    std::string versionId;
    ExecutionStatus status{ExecutionStatus::Passed};
    int64_t executionTimeMs{0};
    size_t peakMemoryBytes{0};
    size_t apiCallCount{0};
    std::vector<ExecutionError> errors;
    PerformanceMetrics performanceMetrics;
    std::vector<std::string> logs;
    std::vector<ApiCallRecord> apiCalls;
    TimePoint createdAt;
    TimePoint completedAt;

    [[nodiscard]] bool passed() const {
        return status == ExecutionStatus::Passed;
    }

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Input of one run
 */
struct ExecutionRequest {
    std::string projectId;
    std::string versionId{"current"};
    std::string scriptSource;
    json testData = json::object();
    ExecutionOverrides overrides;
    std::optional<std::string> testId;  ///< Pre-assigned id, for cancel()
};

/**
 * @brief Snapshot returned by getResourceUsage() inside a script
 */
struct ResourceUsage {
    size_t memoryUsage{0};
    size_t apiCallCount{0};
    int64_t executionTimeMs{0};
};

/**
 * @brief Console line as captured into ExecutionContext::logs, e.g.
 * "[2024-05-01T12:00:00.000Z] WARN: low stock"; an empty level gives a plain
 * line
 */
[[nodiscard]] std::string formatLogLine(TimePoint at, std::string_view level,
                                        std::string_view message);

/**
 * @brief Mutable per-run state, shared between the script bindings and the
 * supervising thread
 */
class ExecutionContext {
public:
    ExecutionContext(std::string testId, std::string projectId,
                     std::string versionId, ExecutionConfig config,
                     TimePoint startTime);

    [[nodiscard]] const std::string& testId() const { return testId_; }
    [[nodiscard]] const std::string& projectId() const { return projectId_; }
    [[nodiscard]] const std::string& versionId() const { return versionId_; }
    [[nodiscard]] const ExecutionConfig& config() const { return config_; }
    [[nodiscard]] TimePoint startTime() const { return startTime_; }

    void addLog(std::string line);
    void addApiCall(ApiCallRecord record);
    void addMemorySample(size_t bytes);

    [[nodiscard]] std::vector<std::string> logs() const;
    [[nodiscard]] std::vector<ApiCallRecord> apiCalls() const;
    [[nodiscard]] std::vector<size_t> memorySamples() const;
    [[nodiscard]] size_t apiCallCount() const;

private:
    std::string testId_;
    std::string projectId_;
    std::string versionId_;
    ExecutionConfig config_;
    TimePoint startTime_;

    mutable std::mutex mutex_;
    std::vector<ApiCallRecord> apiCalls_;
    std::vector<std::string> logs_;
    std::vector<size_t> memorySamples_;
};

/**
 * @brief Receives every result the engine produces
 */
class ExecutionObserver {
public:
    virtual ~ExecutionObserver() = default;
    virtual void onExecutionResult(const ExecutionResult& result) = 0;
};

/**
 * @brief Counters kept by the engine since construction
 */
struct EngineStats {
    size_t totalExecutions{0};
    size_t passed{0};
    size_t failed{0};
    size_t errored{0};
    size_t timeouts{0};
    size_t memoryViolations{0};
    size_t apiLimitViolations{0};
    size_t cancelled{0};
    size_t securityViolations{0};
    size_t activeExecutions{0};
    double averageExecutionTimeMs{0};

    [[nodiscard]] json toJson() const;
};

}  // namespace codepage::sandbox

#endif  // CODEPAGE_SCRIPT_SANDBOX_TYPES_HPP
