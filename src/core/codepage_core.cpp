/*
 * codepage_core.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "codepage_core.hpp"

#include <spdlog/fmt/fmt.h>

#include "exception/exception.hpp"
#include "logging/logging_manager.hpp"
#include "monitoring/sqlite_metric_repository.hpp"

namespace codepage::core {

auto engineOptionsFrom(const config::ExecutionSection& section)
    -> sandbox::EngineOptions {
    sandbox::EngineOptions options;
    options.defaults.timeout = std::chrono::milliseconds(section.timeoutMs);
    options.defaults.memoryLimitBytes = section.memoryLimitBytes;
    options.defaults.apiCallLimit = section.apiCallLimit;
    options.defaults.environment =
        sandbox::environmentFromString(section.environment)
            .value_or(sandbox::Environment::Development);
    options.pollInterval = std::chrono::milliseconds(section.pollIntervalMs);
    options.maxConcurrentExecutions = section.maxConcurrentExecutions;
    return options;
}

namespace {

auto makeRepository(const config::MonitoringSection& section)
    -> std::shared_ptr<monitoring::MetricRepository> {
    if (section.repository == "sqlite") {
        return std::make_shared<monitoring::SqliteMetricRepository>(
            section.databasePath);
    }
    return std::make_shared<monitoring::InMemoryMetricRepository>();
}

}  // namespace

CodepageCore::CodepageCore(config::ServiceConfig config, CoreDependencies deps)
    : config_(std::move(config)), log_(logging::logger("codepage")) {
    if (auto validation = config_.validate(); !validation.ok()) {
        std::string joined;
        for (const auto& error : validation.errors) {
            joined += (joined.empty() ? "" : "; ") + error;
        }
        CODEPAGE_THROW_CONFIGURATION("invalid configuration: {}", joined);
    }

    auto clock = deps.clock.value_or(utils::systemClock());
    const auto& mon = config_.monitoring;

    monitoring::MetricsStoreOptions storeOptions;
    storeOptions.bufferSize = mon.bufferSize;
    storeOptions.retention = std::chrono::hours(mon.retentionHours);
    storeOptions.clock = clock;
    store_ = std::make_shared<monitoring::MetricsStore>(
        storeOptions, deps.metricRepository ? deps.metricRepository
                                            : makeRepository(mon));

    alerts_ = std::make_shared<monitoring::AlertEngine>(
        store_, deps.dispatcher, clock);
    store_->addObserver(alerts_);
    if (mon.defaultRules) {
        alerts_->installDefaultRules();
    }

    monitoring::MonitoringServiceOptions serviceOptions;
    serviceOptions.flushInterval = std::chrono::seconds(mon.flushIntervalSeconds);
    serviceOptions.systemSampleInterval =
        std::chrono::seconds(mon.systemSampleSeconds);
    serviceOptions.systemSampling = mon.systemSampling;
    monitoring_ = std::make_shared<monitoring::MonitoringService>(
        serviceOptions, store_, alerts_, deps.systemProbe);

    reporting::AggregatorOptions aggregatorOptions;
    aggregatorOptions.historyCapacity = config_.reporting.historyCapacity;
    aggregatorOptions.reportResultCount = config_.reporting.reportResultCount;
    aggregatorOptions.autoGenerateOnError =
        config_.reporting.autoGenerateOnError;
    aggregatorOptions.clock = clock;
    aggregator_ = std::make_shared<reporting::ReportAggregator>(
        aggregatorOptions, deps.reportStore);

    auto engineOptions = engineOptionsFrom(config_.execution);
    engineOptions.mockApi = deps.mockApi;
    engineOptions.memoryProbe = deps.memoryProbe;
    engine_ = std::make_unique<sandbox::ExecutionEngine>(engineOptions);
    engine_->mockApi()->setLatencyScale(config_.execution.latencyScale);
    engine_->addObserver(aggregator_);
    engine_->addObserver(monitoring_);

    log_->info("Codepage core ready (environment {}, repository {})",
               config_.execution.environment, mon.repository);
}

CodepageCore::~CodepageCore() { stop(); }

void CodepageCore::start() { monitoring_->start(); }

void CodepageCore::stop() { monitoring_->stop(); }

auto CodepageCore::execute(const sandbox::ExecutionRequest& request)
    -> sandbox::ExecutionResult {
    return engine_->execute(request);
}

auto CodepageCore::executeAsync(sandbox::ExecutionRequest request)
    -> std::future<sandbox::ExecutionResult> {
    return engine_->executeAsync(std::move(request));
}

auto CodepageCore::cancel(const std::string& testId) -> bool {
    return engine_->cancel(testId);
}

auto CodepageCore::generateReport(const std::string& projectId,
                                  const std::string& versionId,
                                  const reporting::ReportOptions& options)
    -> std::expected<reporting::TestReport, reporting::ReportError> {
    return aggregator_->generate(projectId, versionId, options);
}

auto CodepageCore::getReport(const std::string& reportId) const
    -> std::expected<reporting::TestReport, reporting::ReportError> {
    return aggregator_->get(reportId);
}

auto CodepageCore::recordMetric(monitoring::MetricInput input)
    -> monitoring::Metric {
    return store_->record(std::move(input));
}

auto CodepageCore::getMetrics(const monitoring::MetricFilter& filter) const
    -> std::vector<monitoring::Metric> {
    return store_->query(filter);
}

auto CodepageCore::createAlertRule(const monitoring::RuleInput& input)
    -> std::expected<monitoring::AlertRule, monitoring::AlertError> {
    return alerts_->createRule(input);
}

auto CodepageCore::updateAlertRule(const std::string& ruleId,
                                   const monitoring::RuleUpdate& update)
    -> std::expected<monitoring::AlertRule, monitoring::AlertError> {
    return alerts_->updateRule(ruleId, update);
}

auto CodepageCore::deleteAlertRule(const std::string& ruleId)
    -> std::expected<void, monitoring::AlertError> {
    return alerts_->deleteRule(ruleId);
}

auto CodepageCore::getActiveAlerts() const -> std::vector<monitoring::Alert> {
    return alerts_->activeAlerts();
}

auto CodepageCore::resolveAlert(const std::string& alertId)
    -> std::expected<monitoring::Alert, monitoring::AlertError> {
    return alerts_->resolveAlert(alertId);
}

auto CodepageCore::systemHealth() const -> monitoring::SystemHealth {
    return monitoring_->systemHealth();
}

}  // namespace codepage::core
