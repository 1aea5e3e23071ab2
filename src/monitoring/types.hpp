/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Metric, alert rule and alert data model

**************************************************/

#ifndef CODEPAGE_MONITORING_TYPES_HPP
#define CODEPAGE_MONITORING_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/time_utils.hpp"

namespace codepage::monitoring {

using json = nlohmann::json;
using utils::TimePoint;

// ============================================================================
// Metrics
// ============================================================================

enum class MetricKind : uint8_t { Execution, ApiResponse, SystemResource };

[[nodiscard]] constexpr auto metricKindToString(MetricKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case MetricKind::Execution: return "execution";
        case MetricKind::ApiResponse: return "api_response";
        case MetricKind::SystemResource: return "system_resource";
    }
    return "execution";
}

[[nodiscard]] auto metricKindFromString(std::string_view value)
    -> std::optional<MetricKind>;

/**
 * @brief One immutable telemetry sample
 */
struct Metric {
    std::string id;
    MetricKind kind{MetricKind::Execution};
    std::string name;
    double value{0};
    std::string unit;
    TimePoint timestamp;
    json metadata = json::object();

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> Metric;
};

/**
 * @brief A metric before the store assigns its id and timestamp
 */
struct MetricInput {
    MetricKind kind{MetricKind::Execution};
    std::string name;
    double value{0};
    std::string unit;
    json metadata = json::object();
};

struct MetricFilter {
    std::optional<MetricKind> kind;
    std::optional<std::string> name;
    std::optional<TimePoint> since;  ///< Inclusive
    std::optional<TimePoint> until;  ///< Inclusive
    size_t limit{1000};

    [[nodiscard]] auto matches(const Metric& metric) const -> bool;
};

struct MetricSummary {
    size_t totalMetrics{0};
    double averageValue{0};
    double minValue{0};
    double maxValue{0};
    TimePoint windowStart;
    TimePoint windowEnd;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Receives every metric right after it is stored
 */
class MetricObserver {
public:
    virtual ~MetricObserver() = default;
    virtual void onMetric(const Metric& metric) = 0;
};

/**
 * @brief Read access to recent metrics of one name
 */
class MetricWindow {
public:
    virtual ~MetricWindow() = default;

    /**
     * @return Metrics named name with timestamp >= since, newest first
     */
    [[nodiscard]] virtual auto window(const std::string& name,
                                      TimePoint since) const
        -> std::vector<Metric> = 0;
};

enum class StorageError : uint8_t { Unavailable, WriteFailed };

[[nodiscard]] constexpr auto storageErrorToString(StorageError error) noexcept
    -> std::string_view {
    switch (error) {
        case StorageError::Unavailable: return "Metric repository unavailable";
        case StorageError::WriteFailed: return "Metric repository write failed";
    }
    return "Unknown";
}

// ============================================================================
// Alerts
// ============================================================================

enum class RuleKind : uint8_t { Threshold, Anomaly, ErrorRate };

[[nodiscard]] constexpr auto ruleKindToString(RuleKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case RuleKind::Threshold: return "threshold";
        case RuleKind::Anomaly: return "anomaly";
        case RuleKind::ErrorRate: return "error_rate";
    }
    return "threshold";
}

[[nodiscard]] auto ruleKindFromString(std::string_view value)
    -> std::optional<RuleKind>;

enum class Condition : uint8_t { GreaterThan, LessThan, Equals, NotEquals };

[[nodiscard]] constexpr auto conditionToString(Condition condition) noexcept
    -> std::string_view {
    switch (condition) {
        case Condition::GreaterThan: return "gt";
        case Condition::LessThan: return "lt";
        case Condition::Equals: return "eq";
        case Condition::NotEquals: return "neq";
    }
    return "gt";
}

/**
 * @brief Accepts gt/lt/eq/neq and greater_than/less_than/equals/not_equals
 */
[[nodiscard]] auto conditionFromString(std::string_view value)
    -> std::optional<Condition>;

enum class Severity : uint8_t { Low, Medium, High, Critical };

[[nodiscard]] constexpr auto severityToString(Severity severity) noexcept
    -> std::string_view {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "low";
}

struct AlertRule {
    std::string id;
    std::string name;
    RuleKind kind{RuleKind::Threshold};
    std::string metricName;
    Condition condition{Condition::GreaterThan};
    double threshold{0};
    int windowMinutes{5};
    bool active{true};
    std::vector<std::string> channels;
    TimePoint createdAt;
    TimePoint updatedAt;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Operator input for a new rule
 */
struct RuleInput {
    std::string name;
    RuleKind kind{RuleKind::Threshold};
    std::string metricName;
    Condition condition{Condition::GreaterThan};
    double threshold{0};
    int windowMinutes{5};
    bool active{true};
    std::vector<std::string> channels;

    /**
     * @throws std::invalid_argument on unknown kind or condition strings
     */
    [[nodiscard]] static auto fromJson(const json& j) -> RuleInput;
};

/**
 * @brief Partial rule update, unset fields are kept
 */
struct RuleUpdate {
    std::optional<std::string> name;
    std::optional<RuleKind> kind;
    std::optional<std::string> metricName;
    std::optional<Condition> condition;
    std::optional<double> threshold;
    std::optional<int> windowMinutes;
    std::optional<bool> active;
    std::optional<std::vector<std::string>> channels;

    [[nodiscard]] static auto fromJson(const json& j) -> RuleUpdate;
};

struct Alert {
    std::string id;
    std::string ruleId;
    std::string ruleName;
    Severity severity{Severity::Low};
    std::string message;
    double triggerValue{0};
    double threshold{0};
    json metadata = json::object();
    bool resolved{false};
    TimePoint createdAt;
    TimePoint updatedAt;
    std::optional<TimePoint> resolvedAt;
    size_t occurrences{1};  ///< Evaluations that fired while open

    [[nodiscard]] auto toJson() const -> json;
};

enum class AlertError : uint8_t { RuleNotFound, AlertNotFound, InvalidRule };

[[nodiscard]] constexpr auto alertErrorToString(AlertError error) noexcept
    -> std::string_view {
    switch (error) {
        case AlertError::RuleNotFound: return "Alert rule not found";
        case AlertError::AlertNotFound: return "Alert not found";
        case AlertError::InvalidRule: return "Invalid alert rule";
    }
    return "Unknown";
}

// ============================================================================
// Health
// ============================================================================

enum class HealthStatus : uint8_t { Healthy, Warning, Critical };

[[nodiscard]] constexpr auto healthStatusToString(HealthStatus status) noexcept
    -> std::string_view {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Warning: return "warning";
        case HealthStatus::Critical: return "critical";
    }
    return "healthy";
}

struct SystemHealth {
    HealthStatus status{HealthStatus::Healthy};
    size_t activeAlerts{0};
    size_t criticalAlerts{0};
    double cpuUsage{0};         ///< Percent, last 5 minutes
    double memoryUsageMb{0};    ///< Last 5 minutes
    double responseTimeMs{0};   ///< api_response_time, last 5 minutes
    double uptimeSeconds{0};

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace codepage::monitoring

#endif  // CODEPAGE_MONITORING_TYPES_HPP
