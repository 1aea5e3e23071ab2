/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace codepage::monitoring {

auto metricKindFromString(std::string_view value) -> std::optional<MetricKind> {
    if (value == "execution" || value == "codepage_execution") {
        return MetricKind::Execution;
    }
    if (value == "api_response") {
        return MetricKind::ApiResponse;
    }
    if (value == "system_resource") {
        return MetricKind::SystemResource;
    }
    return std::nullopt;
}

auto ruleKindFromString(std::string_view value) -> std::optional<RuleKind> {
    if (value == "threshold") {
        return RuleKind::Threshold;
    }
    if (value == "anomaly") {
        return RuleKind::Anomaly;
    }
    if (value == "error_rate") {
        return RuleKind::ErrorRate;
    }
    return std::nullopt;
}

auto conditionFromString(std::string_view value) -> std::optional<Condition> {
    if (value == "gt" || value == "greater_than") {
        return Condition::GreaterThan;
    }
    if (value == "lt" || value == "less_than") {
        return Condition::LessThan;
    }
    if (value == "eq" || value == "equals") {
        return Condition::Equals;
    }
    if (value == "neq" || value == "not_equals") {
        return Condition::NotEquals;
    }
    return std::nullopt;
}

auto Metric::toJson() const -> json {
    return {{"id", id},
            {"type", metricKindToString(kind)},
            {"name", name},
            {"value", value},
            {"unit", unit},
            {"timestamp", utils::toIsoString(timestamp)},
            {"metadata", metadata}};
}

auto Metric::fromJson(const json& j) -> Metric {
    Metric metric;
    metric.id = j.value("id", "");
    auto kind = metricKindFromString(j.value("type", ""));
    if (!kind) {
        throw std::invalid_argument(
            fmt::format("unknown metric type '{}'", j.value("type", "")));
    }
    metric.kind = *kind;
    metric.name = j.at("name").get<std::string>();
    metric.value = j.at("value").get<double>();
    metric.unit = j.value("unit", "");
    metric.metadata = j.value("metadata", json::object());
    if (auto it = j.find("timestamp"); it != j.end() && it->is_number_integer()) {
        metric.timestamp = utils::fromEpochMillis(it->get<int64_t>());
    }
    return metric;
}

auto MetricFilter::matches(const Metric& metric) const -> bool {
    if (kind && metric.kind != *kind) {
        return false;
    }
    if (name && metric.name != *name) {
        return false;
    }
    if (since && metric.timestamp < *since) {
        return false;
    }
    if (until && metric.timestamp > *until) {
        return false;
    }
    return true;
}

auto MetricSummary::toJson() const -> json {
    return {{"totalMetrics", totalMetrics},
            {"averageValue", averageValue},
            {"minValue", minValue},
            {"maxValue", maxValue},
            {"timeRange",
             {{"start", utils::toIsoString(windowStart)},
              {"end", utils::toIsoString(windowEnd)}}}};
}

auto AlertRule::toJson() const -> json {
    return {{"id", id},
            {"name", name},
            {"type", ruleKindToString(kind)},
            {"metric", metricName},
            {"condition", conditionToString(condition)},
            {"threshold", threshold},
            {"timeWindow", windowMinutes},
            {"isActive", active},
            {"notificationChannels", channels},
            {"createdAt", utils::toIsoString(createdAt)},
            {"updatedAt", utils::toIsoString(updatedAt)}};
}

auto RuleInput::fromJson(const json& j) -> RuleInput {
    RuleInput input;
    input.name = j.value("name", "");
    input.metricName = j.value("metric", "");

    auto kindText = j.value("type", std::string(ruleKindToString(input.kind)));
    auto kind = ruleKindFromString(kindText);
    if (!kind) {
        throw std::invalid_argument(
            fmt::format("unknown rule type '{}'", kindText));
    }
    input.kind = *kind;

    auto conditionText =
        j.value("condition", std::string(conditionToString(input.condition)));
    auto condition = conditionFromString(conditionText);
    if (!condition) {
        throw std::invalid_argument(
            fmt::format("unknown condition '{}'", conditionText));
    }
    input.condition = *condition;

    input.threshold = j.value("threshold", input.threshold);
    input.windowMinutes = j.value("timeWindow", input.windowMinutes);
    input.active = j.value("isActive", input.active);
    input.channels = j.value("notificationChannels", input.channels);
    return input;
}

auto RuleUpdate::fromJson(const json& j) -> RuleUpdate {
    RuleUpdate update;
    if (j.contains("name")) {
        update.name = j["name"].get<std::string>();
    }
    if (j.contains("type")) {
        update.kind = ruleKindFromString(j["type"].get<std::string>());
        if (!update.kind) {
            throw std::invalid_argument("unknown rule type");
        }
    }
    if (j.contains("metric")) {
        update.metricName = j["metric"].get<std::string>();
    }
    if (j.contains("condition")) {
        update.condition = conditionFromString(j["condition"].get<std::string>());
        if (!update.condition) {
            throw std::invalid_argument("unknown condition");
        }
    }
    if (j.contains("threshold")) {
        update.threshold = j["threshold"].get<double>();
    }
    if (j.contains("timeWindow")) {
        update.windowMinutes = j["timeWindow"].get<int>();
    }
    if (j.contains("isActive")) {
        update.active = j["isActive"].get<bool>();
    }
    if (j.contains("notificationChannels")) {
        update.channels =
            j["notificationChannels"].get<std::vector<std::string>>();
    }
    return update;
}

auto Alert::toJson() const -> json {
    return {{"id", id},
            {"ruleId", ruleId},
            {"ruleName", ruleName},
            {"severity", severityToString(severity)},
            {"message", message},
            {"triggerValue", triggerValue},
            {"threshold", threshold},
            {"metadata", metadata},
            {"isResolved", resolved},
            {"occurrences", occurrences},
            {"createdAt", utils::toIsoString(createdAt)},
            {"updatedAt", utils::toIsoString(updatedAt)},
            {"resolvedAt",
             resolvedAt ? json(utils::toIsoString(*resolvedAt)) : json(nullptr)}};
}

auto SystemHealth::toJson() const -> json {
    return {{"status", healthStatusToString(status)},
            {"activeAlerts", activeAlerts},
            {"criticalAlerts", criticalAlerts},
            {"systemMetrics",
             {{"cpuUsage", cpuUsage},
              {"memoryUsage", memoryUsageMb},
              {"responseTime", responseTimeMs}}},
            {"uptime", uptimeSeconds}};
}

}  // namespace codepage::monitoring
