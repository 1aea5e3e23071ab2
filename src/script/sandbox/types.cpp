/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

namespace codepage::sandbox {

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace

std::optional<Environment> environmentFromString(std::string_view value) {
    if (value == "development") return Environment::Development;
    if (value == "staging") return Environment::Staging;
    if (value == "production") return Environment::Production;
    return std::nullopt;
}

// ============================================================================
// Config
// ============================================================================

json ExecutionConfig::toJson() const {
    return {{"timeout", timeout.count()},
            {"memoryLimit", memoryLimitBytes},
            {"apiCallLimit", apiCallLimit},
            {"environment", environmentToString(environment)}};
}

ExecutionConfig ExecutionOverrides::applyTo(ExecutionConfig defaults) const {
    if (timeout) {
        defaults.timeout = *timeout;
    }
    if (memoryLimitBytes) {
        defaults.memoryLimitBytes = *memoryLimitBytes;
    }
    if (apiCallLimit) {
        defaults.apiCallLimit = *apiCallLimit;
    }
    if (environment) {
        defaults.environment = *environment;
    }
    return defaults;
}

ExecutionOverrides ExecutionOverrides::fromJson(const json& j) {
    ExecutionOverrides overrides;
    if (!j.is_object()) {
        return overrides;
    }
    if (auto it = j.find("timeout"); it != j.end() && it->is_number()) {
        overrides.timeout = std::chrono::milliseconds(it->get<int64_t>());
    }
    if (auto it = j.find("memoryLimit");
        it != j.end() && it->is_number_unsigned()) {
        overrides.memoryLimitBytes = it->get<size_t>();
    }
    if (auto it = j.find("apiCallLimit");
        it != j.end() && it->is_number_unsigned()) {
        overrides.apiCallLimit = it->get<size_t>();
    }
    if (auto it = j.find("environment"); it != j.end() && it->is_string()) {
        overrides.environment =
            environmentFromString(it->get<std::string>());
    }
    return overrides;
}

// ============================================================================
// Result records
// ============================================================================

json ApiCallRecord::toJson() const {
    return {{"method", method},
            {"params", params},
            {"response", response},
            {"timestamp", utils::toIsoString(timestamp)},
            {"duration", duration.count()}};
}

json ExecutionError::toJson() const {
    return {{"message", message},
            {"stack", optionalToJson(stack)},
            {"kind", kind},
            {"lineNumber", optionalToJson(lineNumber)},
            {"columnNumber", optionalToJson(columnNumber)}};
}

json PerformanceMetrics::toJson() const {
    return {{"executionTime", executionTimeMs},
            {"memoryUsage", memoryUsage},
            {"apiCallCount", apiCallCount},
            {"apiResponseTime", avgApiResponseTimeMs}};
}

json ExecutionResult::toJson() const {
    json errorList = json::array();
    for (const auto& error : errors) {
        errorList.push_back(error.toJson());
    }
    json callList = json::array();
    for (const auto& call : apiCalls) {
        callList.push_back(call.toJson());
    }
    return {{"id", id},
            {"projectId", projectId},
            {"versionId", versionId},
            {"status", executionStatusToString(status)},
            {"executionTime", executionTimeMs},
            {"memoryUsage", peakMemoryBytes},
            {"apiCallCount", apiCallCount},
            {"errors", errorList},
            {"performanceMetrics", performanceMetrics.toJson()},
            {"logs", logs},
            {"apiCalls", callList},
            {"createdAt", utils::toIsoString(createdAt)},
            {"completedAt", utils::toIsoString(completedAt)}};
}

json EngineStats::toJson() const {
    return {{"totalExecutions", totalExecutions},
            {"passed", passed},
            {"failed", failed},
            {"errored", errored},
            {"timeouts", timeouts},
            {"memoryViolations", memoryViolations},
            {"apiLimitViolations", apiLimitViolations},
            {"cancelled", cancelled},
            {"securityViolations", securityViolations},
            {"activeExecutions", activeExecutions},
            {"averageExecutionTime", averageExecutionTimeMs}};
}

std::string formatLogLine(TimePoint at, std::string_view level,
                          std::string_view message) {
    std::string line = "[" + utils::toIsoString(at) + "] ";
    if (!level.empty()) {
        line.append(level).append(": ");
    }
    line.append(message);
    return line;
}

// ============================================================================
// ExecutionContext
// ============================================================================

ExecutionContext::ExecutionContext(std::string testId, std::string projectId,
                                   std::string versionId,
                                   ExecutionConfig config, TimePoint startTime)
    : testId_(std::move(testId)),
      projectId_(std::move(projectId)),
      versionId_(std::move(versionId)),
      config_(config),
      startTime_(startTime) {}

void ExecutionContext::addLog(std::string line) {
    std::lock_guard lock(mutex_);
    logs_.push_back(std::move(line));
}

void ExecutionContext::addApiCall(ApiCallRecord record) {
    std::lock_guard lock(mutex_);
    apiCalls_.push_back(std::move(record));
}

void ExecutionContext::addMemorySample(size_t bytes) {
    std::lock_guard lock(mutex_);
    memorySamples_.push_back(bytes);
}

std::vector<std::string> ExecutionContext::logs() const {
    std::lock_guard lock(mutex_);
    return logs_;
}

std::vector<ApiCallRecord> ExecutionContext::apiCalls() const {
    std::lock_guard lock(mutex_);
    return apiCalls_;
}

std::vector<size_t> ExecutionContext::memorySamples() const {
    std::lock_guard lock(mutex_);
    return memorySamples_;
}

size_t ExecutionContext::apiCallCount() const {
    std::lock_guard lock(mutex_);
    return apiCalls_.size();
}

}  // namespace codepage::sandbox
