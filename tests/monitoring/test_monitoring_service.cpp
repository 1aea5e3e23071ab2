/*
 * test_monitoring_service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include "monitoring/monitoring_service.hpp"

using namespace codepage::monitoring;
using codepage::sandbox::ExecutionResult;
using codepage::sandbox::ExecutionStatus;
using namespace std::chrono_literals;

namespace {

class FakeProbe : public SystemProbe {
public:
    auto sample() -> std::optional<SystemSample> override {
        ++calls;
        if (!available) {
            return std::nullopt;
        }
        return SystemSample{cpu, memory};
    }

    std::atomic<int> calls{0};
    bool available{true};
    double cpu{25};
    size_t memory{64 * 1024 * 1024};
};

}  // namespace

class MonitoringServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = codepage::utils::fromEpochMillis(1714564800000);
        auto clock = [this] { return now; };

        MetricsStoreOptions storeOptions;
        storeOptions.bufferSize = 1000;
        storeOptions.clock = clock;
        store = std::make_shared<MetricsStore>(storeOptions);

        auto dispatcher = std::make_shared<NotificationDispatcher>();
        alerts = std::make_shared<AlertEngine>(store, dispatcher, clock);
        store->addObserver(alerts);

        probe = std::make_shared<FakeProbe>();
        service = makeService({});
    }

    std::unique_ptr<MonitoringService> makeService(
        MonitoringServiceOptions options) {
        return std::make_unique<MonitoringService>(options, store, alerts, probe);
    }

    std::vector<Metric> metricsNamed(const std::string& name) {
        MetricFilter filter;
        filter.name = name;
        return store->query(filter);
    }

    void createRule(const std::string& metric, double threshold) {
        RuleInput input;
        input.name = "rule on " + metric;
        input.metricName = metric;
        input.threshold = threshold;
        ASSERT_TRUE(alerts->createRule(input).has_value());
    }

    TimePoint now;
    std::shared_ptr<MetricsStore> store;
    std::shared_ptr<AlertEngine> alerts;
    std::shared_ptr<FakeProbe> probe;
    std::unique_ptr<MonitoringService> service;
};

TEST_F(MonitoringServiceTest, RecordExecutionEmitsFourMetrics) {
    ExecutionResult result;
    result.id = "test-1";
    result.projectId = "shop";
    result.versionId = "v2";
    result.status = ExecutionStatus::Failed;
    result.executionTimeMs = 340;
    result.peakMemoryBytes = 4096;
    result.apiCallCount = 3;
    result.errors.push_back({"expected 3", std::nullopt, "AssertionError",
                             std::nullopt, std::nullopt});

    service->onExecutionResult(result);

    auto time = metricsNamed("codepage_execution_time");
    ASSERT_EQ(time.size(), 1u);
    EXPECT_DOUBLE_EQ(time[0].value, 340);
    EXPECT_EQ(time[0].unit, "ms");
    EXPECT_EQ(time[0].kind, MetricKind::Execution);
    EXPECT_EQ(time[0].metadata.value("testId", ""), "test-1");
    EXPECT_EQ(time[0].metadata.value("projectId", ""), "shop");
    EXPECT_EQ(time[0].metadata.value("versionId", ""), "v2");
    EXPECT_EQ(time[0].metadata.value("status", ""), "failed");

    auto memory = metricsNamed("codepage_memory_usage");
    ASSERT_EQ(memory.size(), 1u);
    EXPECT_DOUBLE_EQ(memory[0].value, 4096);
    EXPECT_EQ(memory[0].unit, "bytes");

    auto calls = metricsNamed("codepage_api_calls");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_DOUBLE_EQ(calls[0].value, 3);

    auto errors = metricsNamed("codepage_errors");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_DOUBLE_EQ(errors[0].value, 1);
}

TEST_F(MonitoringServiceTest, RecordApiResponse) {
    service->recordApiResponse({"/orders", "GET", 200, 85, 120, 2048});
    EXPECT_EQ(metricsNamed("api_response_time").size(), 1u);
    EXPECT_EQ(metricsNamed("api_request_size").size(), 1u);
    EXPECT_EQ(metricsNamed("api_response_size").size(), 1u);
    EXPECT_TRUE(metricsNamed("api_errors").empty());

    service->recordApiResponse({"/orders", "POST", 503, 900, 300, 10});
    auto errors = metricsNamed("api_errors");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_DOUBLE_EQ(errors[0].value, 1);
    EXPECT_EQ(errors[0].metadata.value("statusCode", 0), 503);

    auto latency = metricsNamed("api_response_time");
    ASSERT_EQ(latency.size(), 2u);
    EXPECT_EQ(latency[0].metadata.value("method", ""), "POST");
}

TEST_F(MonitoringServiceTest, SampleSystemRecordsCpuAndMemory) {
    service->sampleSystem();
    auto cpu = metricsNamed("system_cpu_usage");
    ASSERT_EQ(cpu.size(), 1u);
    EXPECT_DOUBLE_EQ(cpu[0].value, 25);
    EXPECT_EQ(cpu[0].kind, MetricKind::SystemResource);
    EXPECT_EQ(metricsNamed("system_memory_usage").size(), 1u);

    probe->available = false;
    service->sampleSystem();
    EXPECT_EQ(metricsNamed("system_cpu_usage").size(), 1u);
}

TEST_F(MonitoringServiceTest, HealthyWithoutData) {
    auto health = service->systemHealth();
    EXPECT_EQ(health.status, HealthStatus::Healthy);
    EXPECT_EQ(health.activeAlerts, 0u);
    EXPECT_DOUBLE_EQ(health.cpuUsage, 0);
    EXPECT_DOUBLE_EQ(health.responseTimeMs, 0);
    EXPECT_GE(health.uptimeSeconds, 0);
}

TEST_F(MonitoringServiceTest, HealthAveragesLastFiveMinutes) {
    probe->cpu = 95;
    service->sampleSystem();
    now += 10min;

    probe->cpu = 20;
    probe->memory = 100 * 1024 * 1024;
    service->sampleSystem();
    probe->cpu = 30.56;
    probe->memory = 200 * 1024 * 1024;
    service->sampleSystem();

    auto health = service->systemHealth();
    EXPECT_EQ(health.status, HealthStatus::Healthy);
    EXPECT_DOUBLE_EQ(health.cpuUsage, 25.28);
    EXPECT_DOUBLE_EQ(health.memoryUsageMb, 150);
}

TEST_F(MonitoringServiceTest, HighCpuIsWarningThenCritical) {
    probe->cpu = 75;
    service->sampleSystem();
    EXPECT_EQ(service->systemHealth().status, HealthStatus::Warning);

    probe->cpu = 120;
    service->sampleSystem();
    EXPECT_EQ(service->systemHealth().status, HealthStatus::Critical);
}

TEST_F(MonitoringServiceTest, SlowResponsesDegradeHealth) {
    service->recordApiResponse({"/orders", "GET", 200, 6000, 0, 0});
    auto warning = service->systemHealth();
    EXPECT_EQ(warning.status, HealthStatus::Warning);
    EXPECT_DOUBLE_EQ(warning.responseTimeMs, 6000);

    service->recordApiResponse({"/orders", "GET", 200, 20000, 0, 0});
    EXPECT_EQ(service->systemHealth().status, HealthStatus::Critical);
}

TEST_F(MonitoringServiceTest, AlertsDriveHealth) {
    createRule("codepage_errors", 0.5);
    ExecutionResult result;
    result.id = "test-1";
    result.errors.push_back({"boom", std::nullopt, "ValueError", std::nullopt,
                             std::nullopt});
    service->recordExecution(result);

    auto health = service->systemHealth();
    EXPECT_EQ(health.activeAlerts, 1u);
    EXPECT_EQ(health.criticalAlerts, 0u);
    EXPECT_EQ(health.status, HealthStatus::Warning);

    createRule("codepage_api_calls", 1);
    result.apiCallCount = 50;
    service->recordExecution(result);

    health = service->systemHealth();
    EXPECT_EQ(health.activeAlerts, 2u);
    EXPECT_EQ(health.criticalAlerts, 1u);
    EXPECT_EQ(health.status, HealthStatus::Critical);
}

TEST_F(MonitoringServiceTest, StartStopFlushesBuffer) {
    service->start();
    EXPECT_TRUE(service->isRunning());
    service->start();
    EXPECT_TRUE(service->isRunning());

    service->recordApiResponse({"/orders", "GET", 200, 10, 0, 0});
    EXPECT_GT(store->bufferedCount(), 0u);

    service->stop();
    EXPECT_FALSE(service->isRunning());
    EXPECT_EQ(store->bufferedCount(), 0u);
    EXPECT_EQ(store->retainedCount(), 3u);

    EXPECT_NO_THROW(service->stop());
}

TEST_F(MonitoringServiceTest, LoopSamplesAndFlushesPeriodically) {
    MonitoringServiceOptions options;
    options.flushInterval = 1s;
    options.systemSampleInterval = 1s;
    auto looping = makeService(options);

    looping->recordApiResponse({"/orders", "GET", 200, 10, 0, 0});
    looping->start();

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while ((probe->calls.load() == 0 || store->retainedCount() < 3) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(50ms);
    }
    EXPECT_GE(probe->calls.load(), 1);
    EXPECT_GE(store->retainedCount(), 3u);

    looping->stop();
    EXPECT_EQ(store->bufferedCount(), 0u);
    EXPECT_EQ(metricsNamed("system_cpu_usage").size(),
              static_cast<size_t>(probe->calls.load()));
}

TEST_F(MonitoringServiceTest, SamplingCanBeDisabled) {
    MonitoringServiceOptions options;
    options.flushInterval = 1s;
    options.systemSampleInterval = 1s;
    options.systemSampling = false;
    auto quiet = makeService(options);

    quiet->start();
    std::this_thread::sleep_for(1500ms);
    quiet->stop();
    EXPECT_EQ(probe->calls.load(), 0);
}

TEST_F(MonitoringServiceTest, DestructorStopsLoop) {
    {
        MonitoringServiceOptions options;
        options.flushInterval = 1s;
        auto scoped = makeService(options);
        scoped->start();
        scoped->recordApiResponse({"/orders", "GET", 200, 10, 0, 0});
    }
    EXPECT_EQ(store->bufferedCount(), 0u);
}
