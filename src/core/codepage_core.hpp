/*
 * codepage_core.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Composition root wiring execution, reporting and monitoring

**************************************************/

#ifndef CODEPAGE_CORE_CODEPAGE_CORE_HPP
#define CODEPAGE_CORE_CODEPAGE_CORE_HPP

#include <expected>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/service_config.hpp"
#include "monitoring/alert_engine.hpp"
#include "monitoring/metric_repository.hpp"
#include "monitoring/metrics_store.hpp"
#include "monitoring/monitoring_service.hpp"
#include "monitoring/notification.hpp"
#include "monitoring/system_probe.hpp"
#include "reporting/report_aggregator.hpp"
#include "script/sandbox/execution_engine.hpp"

namespace codepage::core {

/**
 * @brief Collaborators that replace the configured defaults; null members
 * are built from the ServiceConfig
 */
struct CoreDependencies {
    std::shared_ptr<monitoring::MetricRepository> metricRepository;
    std::shared_ptr<reporting::ReportAggregator::ReportStore> reportStore;
    std::shared_ptr<monitoring::NotificationDispatcher> dispatcher;
    std::shared_ptr<monitoring::SystemProbe> systemProbe;
    std::shared_ptr<sandbox::MemoryProbe> memoryProbe;
    std::shared_ptr<sandbox::MockApi> mockApi;
    std::optional<utils::Clock> clock;
};

/**
 * @brief Public surface of the platform core
 *
 * Every execution result flows to the report aggregator and, as
 * codepage_* metrics, into the metrics store, where the alert engine
 * evaluates it. start() launches the periodic flush and system sampling
 * loop; stop() ends it and flushes the buffer.
 */
class CodepageCore {
public:
    /**
     * @throws exception::ConfigurationException if the config is invalid
     * @throws storage::sqlite::SqliteError if the sqlite repository cannot
     * be opened
     */
    explicit CodepageCore(config::ServiceConfig config,
                          CoreDependencies deps = {});
    ~CodepageCore();

    CodepageCore(const CodepageCore&) = delete;
    CodepageCore& operator=(const CodepageCore&) = delete;

    void start();
    void stop();

    // Execution
    [[nodiscard]] auto execute(const sandbox::ExecutionRequest& request)
        -> sandbox::ExecutionResult;
    [[nodiscard]] auto executeAsync(sandbox::ExecutionRequest request)
        -> std::future<sandbox::ExecutionResult>;
    auto cancel(const std::string& testId) -> bool;

    // Reporting
    [[nodiscard]] auto generateReport(const std::string& projectId,
                                      const std::string& versionId,
                                      const reporting::ReportOptions& options = {})
        -> std::expected<reporting::TestReport, reporting::ReportError>;
    [[nodiscard]] auto getReport(const std::string& reportId) const
        -> std::expected<reporting::TestReport, reporting::ReportError>;

    // Metrics
    auto recordMetric(monitoring::MetricInput input) -> monitoring::Metric;
    [[nodiscard]] auto getMetrics(const monitoring::MetricFilter& filter) const
        -> std::vector<monitoring::Metric>;

    // Alerts
    auto createAlertRule(const monitoring::RuleInput& input)
        -> std::expected<monitoring::AlertRule, monitoring::AlertError>;
    auto updateAlertRule(const std::string& ruleId,
                         const monitoring::RuleUpdate& update)
        -> std::expected<monitoring::AlertRule, monitoring::AlertError>;
    auto deleteAlertRule(const std::string& ruleId)
        -> std::expected<void, monitoring::AlertError>;
    [[nodiscard]] auto getActiveAlerts() const -> std::vector<monitoring::Alert>;
    auto resolveAlert(const std::string& alertId)
        -> std::expected<monitoring::Alert, monitoring::AlertError>;

    [[nodiscard]] auto systemHealth() const -> monitoring::SystemHealth;

    [[nodiscard]] auto config() const -> const config::ServiceConfig& {
        return config_;
    }
    [[nodiscard]] auto engine() -> sandbox::ExecutionEngine& { return *engine_; }
    [[nodiscard]] auto reports() -> reporting::ReportAggregator& {
        return *aggregator_;
    }
    [[nodiscard]] auto metrics() -> monitoring::MetricsStore& { return *store_; }
    [[nodiscard]] auto alerts() -> monitoring::AlertEngine& { return *alerts_; }
    [[nodiscard]] auto monitoring() -> monitoring::MonitoringService& {
        return *monitoring_;
    }

private:
    config::ServiceConfig config_;
    std::shared_ptr<spdlog::logger> log_;

    std::shared_ptr<monitoring::MetricsStore> store_;
    std::shared_ptr<monitoring::AlertEngine> alerts_;
    std::shared_ptr<monitoring::MonitoringService> monitoring_;
    std::shared_ptr<reporting::ReportAggregator> aggregator_;
    std::unique_ptr<sandbox::ExecutionEngine> engine_;
};

/**
 * @brief Map the execution config section onto engine options
 */
[[nodiscard]] auto engineOptionsFrom(const config::ExecutionSection& section)
    -> sandbox::EngineOptions;

}  // namespace codepage::core

#endif  // CODEPAGE_CORE_CODEPAGE_CORE_HPP
