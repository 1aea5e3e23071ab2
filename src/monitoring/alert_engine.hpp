/*
 * alert_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Rule evaluation over sliding metric windows

**************************************************/

#ifndef CODEPAGE_MONITORING_ALERT_ENGINE_HPP
#define CODEPAGE_MONITORING_ALERT_ENGINE_HPP

#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "notification.hpp"
#include "types.hpp"

namespace codepage::monitoring {

inline constexpr double kEqualityTolerance = 0.001;
inline constexpr size_t kMinAnomalySamples = 5;
inline constexpr size_t kMaxResolvedAlerts = 1000;

/**
 * @brief Evaluates active rules against every new metric
 *
 * A rule whose evaluation holds opens an alert, or updates the rule's open
 * alert in place; at most one unresolved alert exists per rule. Alerts
 * leave the open state only through resolveAlert() or deletion of their
 * rule. Notifications for new alerts are sent after the engine lock is
 * released. Only the newest resolvedCap resolved alerts are kept; older
 * resolved alerts are dropped when another alert resolves.
 */
class AlertEngine : public MetricObserver {
public:
    AlertEngine(std::shared_ptr<const MetricWindow> metrics,
                std::shared_ptr<NotificationDispatcher> dispatcher = nullptr,
                utils::Clock clock = utils::systemClock(),
                size_t resolvedCap = kMaxResolvedAlerts);

    // ========================================================================
    // Rules
    // ========================================================================

    auto createRule(const RuleInput& input)
        -> std::expected<AlertRule, AlertError>;
    auto updateRule(const std::string& ruleId, const RuleUpdate& update)
        -> std::expected<AlertRule, AlertError>;

    /**
     * @brief Remove a rule and resolve its open alert
     */
    auto deleteRule(const std::string& ruleId) -> std::expected<void, AlertError>;

    [[nodiscard]] auto rule(const std::string& ruleId) const
        -> std::expected<AlertRule, AlertError>;
    [[nodiscard]] auto rules() const -> std::vector<AlertRule>;

    /**
     * @brief High execution time, high memory, high API response time, API
     * error rate and system CPU
     */
    auto installDefaultRules() -> std::vector<AlertRule>;

    // ========================================================================
    // Evaluation
    // ========================================================================

    void onMetric(const Metric& metric) override;

    /**
     * @brief Trigger value of a rule for a metric and its window
     * @return nullopt when the rule cannot be evaluated (empty window, too
     * few anomaly samples)
     */
    [[nodiscard]] static auto evaluate(const AlertRule& rule,
                                       const Metric& metric,
                                       const std::vector<Metric>& window)
        -> std::optional<double>;

    [[nodiscard]] static auto holds(Condition condition, double value,
                                    double threshold) -> bool;

    /**
     * @brief Severity from |value - threshold| / threshold; any deviation
     * from a zero threshold is critical
     */
    [[nodiscard]] static auto severityFor(double value, double threshold)
        -> Severity;

    /**
     * @brief statusCode >= 400, error/status metadata, or an error name
     */
    [[nodiscard]] static auto isErrorLike(const Metric& metric) -> bool;

    /**
     * @return Reason the input is invalid, nullopt when valid
     */
    [[nodiscard]] static auto validate(const RuleInput& input)
        -> std::optional<std::string>;

    // ========================================================================
    // Alerts
    // ========================================================================

    [[nodiscard]] auto activeAlerts() const -> std::vector<Alert>;

    /**
     * @brief All alerts, newest first
     */
    [[nodiscard]] auto alerts(size_t limit = 100) const -> std::vector<Alert>;

    [[nodiscard]] auto alert(const std::string& alertId) const
        -> std::expected<Alert, AlertError>;

    /**
     * @brief Resolve an alert; resolving a resolved alert changes nothing
     */
    auto resolveAlert(const std::string& alertId)
        -> std::expected<Alert, AlertError>;

private:
    auto findAlert(const std::string& alertId) -> Alert*;
    void pruneResolvedLocked();
    auto fire(const AlertRule& rule, const Metric& metric, double trigger,
              TimePoint now) -> std::optional<Alert>;
    static auto describe(const AlertRule& rule, const Metric& metric,
                         double trigger) -> std::string;

    std::shared_ptr<const MetricWindow> metrics_;
    std::shared_ptr<NotificationDispatcher> dispatcher_;
    utils::Clock clock_;
    size_t resolvedCap_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex mutex_;
    std::map<std::string, AlertRule> rules_;
    std::vector<Alert> alerts_;                     // Creation order
    std::map<std::string, std::string> openByRule_;  // ruleId -> alertId
};

}  // namespace codepage::monitoring

#endif  // CODEPAGE_MONITORING_ALERT_ENGINE_HPP
