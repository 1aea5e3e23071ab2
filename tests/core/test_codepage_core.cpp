/*
 * test_codepage_core.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_codepage_core.cpp
 * @brief End-to-end tests of execution flowing into reports, metrics and
 * alerts
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "core/codepage_core.hpp"
#include "exception/exception.hpp"

using namespace codepage;
using namespace std::chrono_literals;

namespace {

class FixedMemoryProbe : public sandbox::MemoryProbe {
public:
    std::optional<size_t> sample() override { return 8 * 1024 * 1024; }
};

class QuietSystemProbe : public monitoring::SystemProbe {
public:
    auto sample() -> std::optional<monitoring::SystemSample> override {
        return monitoring::SystemSample{12.5, 256 * 1024 * 1024};
    }
};

}  // namespace

class CodepageCoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        baseConfig.execution.timeoutMs = 5000;
        baseConfig.execution.pollIntervalMs = 20;
        baseConfig.execution.latencyScale = 0.0;
        baseConfig.monitoring.defaultRules = false;
        baseConfig.monitoring.systemSampling = false;
        core = makeCore(baseConfig);
    }

    std::unique_ptr<core::CodepageCore> makeCore(config::ServiceConfig cfg) {
        core::CoreDependencies deps;
        deps.memoryProbe = std::make_shared<FixedMemoryProbe>();
        deps.systemProbe = std::make_shared<QuietSystemProbe>();
        deps.dispatcher = std::make_shared<monitoring::NotificationDispatcher>();
        return std::make_unique<core::CodepageCore>(std::move(cfg), deps);
    }

    sandbox::ExecutionResult run(const std::string& source,
                                 const std::string& version = "v1") {
        sandbox::ExecutionRequest request;
        request.projectId = "dealer-portal";
        request.versionId = version;
        request.scriptSource = source;
        return core->execute(request);
    }

    std::vector<monitoring::Metric> metricsNamed(const std::string& name) {
        monitoring::MetricFilter filter;
        filter.name = name;
        return core->getMetrics(filter);
    }

    config::ServiceConfig baseConfig;
    std::unique_ptr<core::CodepageCore> core;
};

TEST_F(CodepageCoreTest, InvalidConfigurationThrows) {
    auto bad = baseConfig;
    bad.execution.timeoutMs = 0;
    bad.monitoring.repository = "redis";
    EXPECT_THROW(makeCore(bad), exception::ConfigurationException);
}

TEST_F(CodepageCoreTest, EngineOptionsFromSection) {
    config::ExecutionSection section;
    section.timeoutMs = 1500;
    section.memoryLimitBytes = 1024;
    section.apiCallLimit = 7;
    section.environment = "staging";
    section.pollIntervalMs = 10;
    section.maxConcurrentExecutions = 2;

    auto options = core::engineOptionsFrom(section);
    EXPECT_EQ(options.defaults.timeout, 1500ms);
    EXPECT_EQ(options.defaults.memoryLimitBytes, 1024u);
    EXPECT_EQ(options.defaults.apiCallLimit, 7u);
    EXPECT_EQ(options.defaults.environment, sandbox::Environment::Staging);
    EXPECT_EQ(options.pollInterval, 10ms);
    EXPECT_EQ(options.maxConcurrentExecutions, 2u);
}

TEST_F(CodepageCoreTest, MockApiLatencyFollowsConfig) {
    EXPECT_DOUBLE_EQ(core->engine().mockApi()->latencyScale(), 0.0);
}

TEST_F(CodepageCoreTest, ExecutionFeedsReportsAndMetrics) {
    auto result = run(R"(
vehicles = api.query({"tableId": "vehicles"})["data"]
assert len(vehicles) > 0
console.log("found", len(vehicles))
)");
    ASSERT_EQ(result.status, sandbox::ExecutionStatus::Passed)
        << (result.errors.empty() ? "" : result.errors[0].message);

    auto history = core->reports().results("dealer-portal", "v1");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].id, result.id);

    auto times = metricsNamed("codepage_execution_time");
    ASSERT_EQ(times.size(), 1u);
    EXPECT_EQ(times[0].metadata.value("testId", ""), result.id);
    EXPECT_EQ(times[0].metadata.value("projectId", ""), "dealer-portal");
    EXPECT_EQ(times[0].metadata.value("status", ""), "passed");

    auto calls = metricsNamed("codepage_api_calls");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_DOUBLE_EQ(calls[0].value, 1);

    auto memory = metricsNamed("codepage_memory_usage");
    ASSERT_EQ(memory.size(), 1u);
    EXPECT_DOUBLE_EQ(memory[0].value, 8.0 * 1024 * 1024);
}

TEST_F(CodepageCoreTest, GenerateReportAcrossRuns) {
    EXPECT_EQ(core->generateReport("dealer-portal", "v1").error(),
              reporting::ReportError::NoResults);

    run("assert 1 + 1 == 2\n");
    run("assert 2 * 2 == 4\n");
    run("assert 'a' * 3 == 'aaa'\n");

    reporting::ReportOptions options;
    options.detailLevel = reporting::DetailLevel::Comprehensive;
    auto report = core->generateReport("dealer-portal", "v1", options);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->summary.totalTests, 3u);
    EXPECT_DOUBLE_EQ(report->summary.successRate, 100.0);
    EXPECT_EQ(report->testResults.size(), 3u);

    auto fetched = core->getReport(report->id);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->id, report->id);
    EXPECT_EQ(core->getReport("report-unknown").error(),
              reporting::ReportError::NotFound);
}

TEST_F(CodepageCoreTest, FailingRunRaisesAlertAndReport) {
    monitoring::RuleInput input;
    input.name = "Codepage errors";
    input.metricName = "codepage_errors";
    input.condition = monitoring::Condition::GreaterThan;
    input.threshold = 0;
    auto rule = core->createAlertRule(input);
    ASSERT_TRUE(rule.has_value());

    auto result = run("price = missing_price * 2\n", "v2");
    EXPECT_EQ(result.status, sandbox::ExecutionStatus::Error);

    auto active = core->getActiveAlerts();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].ruleId, rule->id);
    EXPECT_EQ(active[0].severity, monitoring::Severity::Critical);
    EXPECT_EQ(active[0].metadata.value("testId", ""), result.id);

    auto reports = core->reports().projectReports("dealer-portal");
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].versionId, "v2");
    EXPECT_EQ(reports[0].errorAnalysis.errorsByKind.at("NameError"), 1u);
    EXPECT_FALSE(reports[0].errorAnalysis.criticalErrors.empty());

    auto health = core->systemHealth();
    EXPECT_EQ(health.criticalAlerts, 1u);
    EXPECT_EQ(health.status, monitoring::HealthStatus::Critical);

    ASSERT_TRUE(core->resolveAlert(active[0].id).has_value());
    EXPECT_TRUE(core->getActiveAlerts().empty());
    EXPECT_EQ(core->systemHealth().status, monitoring::HealthStatus::Healthy);
}

TEST_F(CodepageCoreTest, AlertRuleLifecycle) {
    monitoring::RuleInput input;
    input.name = "Slow runs";
    input.metricName = "codepage_execution_time";
    input.threshold = 60000;
    auto rule = core->createAlertRule(input);
    ASSERT_TRUE(rule.has_value());

    monitoring::RuleUpdate update;
    update.active = false;
    auto updated = core->updateAlertRule(rule->id, update);
    ASSERT_TRUE(updated.has_value());
    EXPECT_FALSE(updated->active);

    ASSERT_TRUE(core->deleteAlertRule(rule->id).has_value());
    EXPECT_EQ(core->deleteAlertRule(rule->id).error(),
              monitoring::AlertError::RuleNotFound);
}

TEST_F(CodepageCoreTest, RecordMetricEvaluatesRules) {
    monitoring::RuleInput input;
    input.name = "Average latency";
    input.metricName = "avg_latency";
    input.threshold = 1000;
    input.windowMinutes = 60;
    ASSERT_TRUE(core->createAlertRule(input).has_value());

    core->recordMetric({monitoring::MetricKind::ApiResponse, "avg_latency", 1250,
                        "ms", monitoring::json::object()});
    core->recordMetric({monitoring::MetricKind::ApiResponse, "avg_latency", 1400,
                        "ms", monitoring::json::object()});

    auto active = core->getActiveAlerts();
    ASSERT_EQ(active.size(), 1u);
    EXPECT_EQ(active[0].occurrences, 2u);
}

TEST_F(CodepageCoreTest, DefaultRulesInstalledFromConfig) {
    auto cfg = baseConfig;
    cfg.monitoring.defaultRules = true;
    auto withDefaults = makeCore(cfg);
    EXPECT_EQ(withDefaults->alerts().rules().size(), 5u);
    EXPECT_TRUE(core->alerts().rules().empty());
}

TEST_F(CodepageCoreTest, SqliteRepositoryFromConfig) {
    auto cfg = baseConfig;
    cfg.monitoring.repository = "sqlite";
    cfg.monitoring.databasePath = ":memory:";
    cfg.monitoring.bufferSize = 1;
    auto sqliteCore = makeCore(cfg);

    sqliteCore->recordMetric({monitoring::MetricKind::SystemResource,
                              "system_cpu_usage", 42, "percent",
                              monitoring::json::object()});
    EXPECT_EQ(sqliteCore->metrics().bufferedCount(), 0u);
    EXPECT_EQ(sqliteCore->metrics().retainedCount(), 1u);
}

TEST_F(CodepageCoreTest, StopFlushesMetrics) {
    core->start();
    EXPECT_TRUE(core->monitoring().isRunning());
    run("assert True\n");
    EXPECT_GT(core->metrics().bufferedCount(), 0u);

    core->stop();
    EXPECT_FALSE(core->monitoring().isRunning());
    EXPECT_EQ(core->metrics().bufferedCount(), 0u);
    EXPECT_EQ(core->metrics().retainedCount(), 4u);
}

TEST_F(CodepageCoreTest, ExecuteAsyncAndCancel) {
    sandbox::ExecutionRequest request;
    request.projectId = "dealer-portal";
    request.testId = "test-cancel-me";
    request.scriptSource = "while True:\n    pass\n";

    auto future = core->executeAsync(request);
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!core->cancel("test-cancel-me") &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }

    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    auto result = future.get();
    EXPECT_EQ(result.id, "test-cancel-me");
    EXPECT_EQ(result.status, sandbox::ExecutionStatus::Error);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, "Cancelled");
}
