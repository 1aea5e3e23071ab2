/*
 * alert_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "alert_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

#include "logging/logging_manager.hpp"
#include "utils/id_generator.hpp"

namespace codepage::monitoring {

namespace {

constexpr size_t kMaxRuleNameLength = 100;
constexpr int kMaxWindowMinutes = 1440;

auto defaultRuleInputs() -> std::vector<RuleInput> {
    const std::vector<std::string> channels = {"console", "log"};
    return {
        {"High Codepage Execution Time", RuleKind::Threshold,
         "codepage_execution_time", Condition::GreaterThan, 10000, 5, true,
         channels},
        {"High Memory Usage", RuleKind::Threshold, "codepage_memory_usage",
         Condition::GreaterThan, 134217728, 5, true, channels},
        {"High API Response Time", RuleKind::Threshold, "api_response_time",
         Condition::GreaterThan, 5000, 10, true, channels},
        {"High Error Rate", RuleKind::ErrorRate, "api_response_time",
         Condition::GreaterThan, 0.1, 15, true, channels},
        {"System CPU Usage", RuleKind::Threshold, "system_cpu_usage",
         Condition::GreaterThan, 80, 5, true, channels},
    };
}

auto metadataInt(const json& metadata, const char* key) -> std::optional<int64_t> {
    auto it = metadata.find(key);
    if (it == metadata.end()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return it->get<int64_t>();
    }
    return std::nullopt;
}

}  // namespace

AlertEngine::AlertEngine(std::shared_ptr<const MetricWindow> metrics,
                         std::shared_ptr<NotificationDispatcher> dispatcher,
                         utils::Clock clock, size_t resolvedCap)
    : metrics_(std::move(metrics)),
      dispatcher_(dispatcher ? std::move(dispatcher)
                             : NotificationDispatcher::withDefaultChannels()),
      clock_(clock ? std::move(clock) : utils::systemClock()),
      resolvedCap_(resolvedCap),
      log_(logging::logger("alerts")) {}

// ============================================================================
// Rules
// ============================================================================

auto AlertEngine::validate(const RuleInput& input) -> std::optional<std::string> {
    if (input.name.empty() || input.name.size() > kMaxRuleNameLength) {
        return "name must be 1 to 100 characters";
    }
    if (input.metricName.empty()) {
        return "metric must not be empty";
    }
    if (input.windowMinutes < 1 || input.windowMinutes > kMaxWindowMinutes) {
        return "time window must be between 1 and 1440 minutes";
    }
    if (!std::isfinite(input.threshold)) {
        return "threshold must be finite";
    }
    return std::nullopt;
}

auto AlertEngine::createRule(const RuleInput& input)
    -> std::expected<AlertRule, AlertError> {
    if (auto reason = validate(input)) {
        log_->warn("{} '{}': {}", alertErrorToString(AlertError::InvalidRule),
                   input.name, *reason);
        return std::unexpected(AlertError::InvalidRule);
    }

    auto now = clock_();
    AlertRule rule;
    rule.id = utils::generateId("rule", now);
    rule.name = input.name;
    rule.kind = input.kind;
    rule.metricName = input.metricName;
    rule.condition = input.condition;
    rule.threshold = input.threshold;
    rule.windowMinutes = input.windowMinutes;
    rule.active = input.active;
    rule.channels = input.channels;
    rule.createdAt = now;
    rule.updatedAt = now;

    {
        std::lock_guard lock(mutex_);
        rules_.emplace(rule.id, rule);
    }
    log_->info("Created alert rule: {} ({} {} {} on {})", rule.name,
               ruleKindToString(rule.kind), conditionToString(rule.condition),
               rule.threshold, rule.metricName);
    return rule;
}

auto AlertEngine::updateRule(const std::string& ruleId, const RuleUpdate& update)
    -> std::expected<AlertRule, AlertError> {
    std::lock_guard lock(mutex_);
    auto it = rules_.find(ruleId);
    if (it == rules_.end()) {
        return std::unexpected(AlertError::RuleNotFound);
    }

    AlertRule updated = it->second;
    if (update.name) {
        updated.name = *update.name;
    }
    if (update.kind) {
        updated.kind = *update.kind;
    }
    if (update.metricName) {
        updated.metricName = *update.metricName;
    }
    if (update.condition) {
        updated.condition = *update.condition;
    }
    if (update.threshold) {
        updated.threshold = *update.threshold;
    }
    if (update.windowMinutes) {
        updated.windowMinutes = *update.windowMinutes;
    }
    if (update.active) {
        updated.active = *update.active;
    }
    if (update.channels) {
        updated.channels = *update.channels;
    }

    RuleInput check{updated.name,      updated.kind,      updated.metricName,
                    updated.condition, updated.threshold, updated.windowMinutes,
                    updated.active,    updated.channels};
    if (auto reason = validate(check)) {
        log_->warn("{} update for {}: {}",
                   alertErrorToString(AlertError::InvalidRule), ruleId,
                   *reason);
        return std::unexpected(AlertError::InvalidRule);
    }

    updated.updatedAt = clock_();
    it->second = updated;
    log_->info("Updated alert rule: {}", updated.name);
    return updated;
}

auto AlertEngine::deleteRule(const std::string& ruleId)
    -> std::expected<void, AlertError> {
    std::lock_guard lock(mutex_);
    auto it = rules_.find(ruleId);
    if (it == rules_.end()) {
        return std::unexpected(AlertError::RuleNotFound);
    }
    std::string name = it->second.name;
    rules_.erase(it);

    if (auto open = openByRule_.find(ruleId); open != openByRule_.end()) {
        if (auto* alert = findAlert(open->second)) {
            auto now = clock_();
            alert->resolved = true;
            alert->resolvedAt = now;
            alert->updatedAt = now;
        }
        openByRule_.erase(open);
        pruneResolvedLocked();
    }
    log_->info("Deleted alert rule: {}", name);
    return {};
}

auto AlertEngine::rule(const std::string& ruleId) const
    -> std::expected<AlertRule, AlertError> {
    std::lock_guard lock(mutex_);
    auto it = rules_.find(ruleId);
    if (it == rules_.end()) {
        return std::unexpected(AlertError::RuleNotFound);
    }
    return it->second;
}

auto AlertEngine::rules() const -> std::vector<AlertRule> {
    std::lock_guard lock(mutex_);
    std::vector<AlertRule> out;
    out.reserve(rules_.size());
    for (const auto& [id, rule] : rules_) {
        out.push_back(rule);
    }
    return out;
}

auto AlertEngine::installDefaultRules() -> std::vector<AlertRule> {
    std::vector<AlertRule> installed;
    for (const auto& input : defaultRuleInputs()) {
        if (auto rule = createRule(input)) {
            installed.push_back(std::move(*rule));
        }
    }
    log_->info("Initialized {} default alert rules", installed.size());
    return installed;
}

// ============================================================================
// Evaluation
// ============================================================================

auto AlertEngine::isErrorLike(const Metric& metric) -> bool {
    const auto& meta = metric.metadata;
    if (auto status = metadataInt(meta, "statusCode"); status && *status >= 400) {
        return true;
    }
    if (auto it = meta.find("error"); it != meta.end() && it->is_boolean() &&
                                      it->get<bool>()) {
        return true;
    }
    if (auto it = meta.find("status"); it != meta.end() && it->is_string()) {
        auto status = it->get<std::string>();
        if (status == "error" || status == "failed") {
            return true;
        }
    }
    return metric.name.find("error") != std::string::npos;
}

auto AlertEngine::evaluate(const AlertRule& rule, const Metric& metric,
                           const std::vector<Metric>& window)
    -> std::optional<double> {
    if (window.empty()) {
        return std::nullopt;
    }
    switch (rule.kind) {
        case RuleKind::Threshold:
            return metric.value;

        case RuleKind::ErrorRate: {
            auto errors = std::count_if(window.begin(), window.end(),
                                        &AlertEngine::isErrorLike);
            return static_cast<double>(errors) /
                   static_cast<double>(window.size());
        }

        case RuleKind::Anomaly: {
            std::vector<double> values;
            for (const auto& sample : window) {
                if (sample.id != metric.id) {
                    values.push_back(sample.value);
                }
            }
            if (values.size() < kMinAnomalySamples) {
                return std::nullopt;
            }
            double n = static_cast<double>(values.size());
            double mean = 0;
            for (double v : values) {
                mean += v;
            }
            mean /= n;
            double variance = 0;
            for (double v : values) {
                variance += (v - mean) * (v - mean);
            }
            double stddev = std::sqrt(variance / n);
            return std::abs(metric.value - mean) / std::max(stddev, 1.0);
        }
    }
    return std::nullopt;
}

auto AlertEngine::holds(Condition condition, double value, double threshold)
    -> bool {
    switch (condition) {
        case Condition::GreaterThan: return value > threshold;
        case Condition::LessThan: return value < threshold;
        case Condition::Equals:
            return std::abs(value - threshold) < kEqualityTolerance;
        case Condition::NotEquals:
            return std::abs(value - threshold) >= kEqualityTolerance;
    }
    return false;
}

auto AlertEngine::severityFor(double value, double threshold) -> Severity {
    double deviation = std::abs(value - threshold);
    if (threshold == 0) {
        return deviation > 0 ? Severity::Critical : Severity::Low;
    }
    double ratio = deviation / std::abs(threshold);
    if (ratio >= 2) {
        return Severity::Critical;
    }
    if (ratio >= 1) {
        return Severity::High;
    }
    if (ratio >= 0.5) {
        return Severity::Medium;
    }
    return Severity::Low;
}

auto AlertEngine::describe(const AlertRule& rule, const Metric& metric,
                           double trigger) -> std::string {
    switch (rule.kind) {
        case RuleKind::ErrorRate:
            return fmt::format("{}: {} error rate is {:.3f} (threshold: {})",
                               rule.name, metric.name, trigger, rule.threshold);
        case RuleKind::Anomaly:
            return fmt::format(
                "{}: {} is {}{}, deviation score {:.2f} (threshold: {})",
                rule.name, metric.name, metric.value, metric.unit, trigger,
                rule.threshold);
        case RuleKind::Threshold:
            break;
    }
    return fmt::format("{}: {} is {}{} (threshold: {}{})", rule.name,
                       metric.name, metric.value, metric.unit, rule.threshold,
                       metric.unit);
}

void AlertEngine::onMetric(const Metric& metric) {
    std::vector<std::pair<Alert, std::vector<std::string>>> created;
    {
        std::lock_guard lock(mutex_);
        auto now = clock_();
        for (const auto& [id, rule] : rules_) {
            if (!rule.active || rule.metricName != metric.name) {
                continue;
            }
            auto window = metrics_->window(
                rule.metricName, now - std::chrono::minutes(rule.windowMinutes));
            auto trigger = evaluate(rule, metric, window);
            if (!trigger || !holds(rule.condition, *trigger, rule.threshold)) {
                continue;
            }
            if (auto alert = fire(rule, metric, *trigger, now)) {
                created.emplace_back(std::move(*alert), rule.channels);
            }
        }
    }

    for (const auto& [alert, channels] : created) {
        log_->warn("Alert triggered: {}", alert.message);
        dispatcher_->dispatch(alert, channels);
    }
}

auto AlertEngine::fire(const AlertRule& rule, const Metric& metric,
                       double trigger, TimePoint now) -> std::optional<Alert> {
    if (auto open = openByRule_.find(rule.id); open != openByRule_.end()) {
        if (auto* alert = findAlert(open->second)) {
            alert->triggerValue = trigger;
            alert->metadata.update(metric.metadata);
            alert->updatedAt = now;
            alert->occurrences++;
            log_->debug("Alert {} for rule {} updated ({} occurrences)",
                        alert->id, rule.name, alert->occurrences);
            return std::nullopt;
        }
    }

    Alert alert;
    alert.id = utils::generateId("alert", now);
    alert.ruleId = rule.id;
    alert.ruleName = rule.name;
    alert.severity = severityFor(trigger, rule.threshold);
    alert.message = describe(rule, metric, trigger);
    alert.triggerValue = trigger;
    alert.threshold = rule.threshold;
    alert.metadata = metric.metadata.is_object() ? metric.metadata : json::object();
    alert.createdAt = now;
    alert.updatedAt = now;

    alerts_.push_back(alert);
    openByRule_[rule.id] = alert.id;
    return alert;
}

// ============================================================================
// Alerts
// ============================================================================

auto AlertEngine::findAlert(const std::string& alertId) -> Alert* {
    auto it = std::find_if(alerts_.begin(), alerts_.end(),
                           [&](const Alert& a) { return a.id == alertId; });
    return it == alerts_.end() ? nullptr : &*it;
}

auto AlertEngine::activeAlerts() const -> std::vector<Alert> {
    std::lock_guard lock(mutex_);
    std::vector<Alert> out;
    for (const auto& alert : alerts_) {
        if (!alert.resolved) {
            out.push_back(alert);
        }
    }
    return out;
}

auto AlertEngine::alerts(size_t limit) const -> std::vector<Alert> {
    std::lock_guard lock(mutex_);
    std::vector<Alert> out;
    for (auto it = alerts_.rbegin(); it != alerts_.rend() && out.size() < limit;
         ++it) {
        out.push_back(*it);
    }
    return out;
}

auto AlertEngine::alert(const std::string& alertId) const
    -> std::expected<Alert, AlertError> {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(alerts_.begin(), alerts_.end(),
                           [&](const Alert& a) { return a.id == alertId; });
    if (it == alerts_.end()) {
        return std::unexpected(AlertError::AlertNotFound);
    }
    return *it;
}

auto AlertEngine::resolveAlert(const std::string& alertId)
    -> std::expected<Alert, AlertError> {
    std::lock_guard lock(mutex_);
    auto* alert = findAlert(alertId);
    if (alert == nullptr) {
        return std::unexpected(AlertError::AlertNotFound);
    }
    if (alert->resolved) {
        return *alert;
    }
    auto now = clock_();
    alert->resolved = true;
    alert->resolvedAt = now;
    alert->updatedAt = now;
    if (auto open = openByRule_.find(alert->ruleId);
        open != openByRule_.end() && open->second == alertId) {
        openByRule_.erase(open);
    }
    log_->info("Resolved alert: {}", alert->message);
    Alert result = *alert;
    pruneResolvedLocked();
    return result;
}

void AlertEngine::pruneResolvedLocked() {
    auto resolved = static_cast<size_t>(
        std::count_if(alerts_.begin(), alerts_.end(),
                      [](const Alert& a) { return a.resolved; }));
    if (resolved <= resolvedCap_) {
        return;
    }
    size_t excess = resolved - resolvedCap_;
    // alerts_ is in creation order, so the first resolved entries are oldest
    auto end = std::remove_if(alerts_.begin(), alerts_.end(),
                              [&excess](const Alert& a) {
                                  if (excess == 0 || !a.resolved) {
                                      return false;
                                  }
                                  --excess;
                                  return true;
                              });
    log_->debug("Dropped {} resolved alerts beyond the history cap of {}",
                std::distance(end, alerts_.end()), resolvedCap_);
    alerts_.erase(end, alerts_.end());
}

}  // namespace codepage::monitoring
