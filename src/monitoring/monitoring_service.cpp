/*
 * monitoring_service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "monitoring_service.hpp"

#include <cmath>
#include <limits>

#include "logging/logging_manager.hpp"

namespace codepage::monitoring {

namespace {

constexpr auto kHealthWindow = std::chrono::minutes(5);

auto average(const std::vector<Metric>& metrics) -> double {
    if (metrics.empty()) {
        return 0;
    }
    double total = 0;
    for (const auto& metric : metrics) {
        total += metric.value;
    }
    return total / static_cast<double>(metrics.size());
}

auto round2(double value) -> double { return std::round(value * 100.0) / 100.0; }

}  // namespace

MonitoringService::MonitoringService(MonitoringServiceOptions options,
                                     std::shared_ptr<MetricsStore> store,
                                     std::shared_ptr<AlertEngine> alerts,
                                     std::shared_ptr<SystemProbe> probe)
    : options_(options),
      store_(std::move(store)),
      alerts_(std::move(alerts)),
      probe_(probe ? std::move(probe) : std::make_shared<ProcessSystemProbe>()),
      log_(logging::logger("monitoring")),
      startedAt_(std::chrono::steady_clock::now()) {
    log_->info("Monitoring service initialized");
}

MonitoringService::~MonitoringService() { stop(); }

void MonitoringService::start() {
    std::lock_guard lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
    log_->info("Monitoring loop started (flush every {}s, sampling every {}s)",
               options_.flushInterval.count(),
               options_.systemSampleInterval.count());
}

void MonitoringService::stop() {
    std::jthread worker;
    {
        std::lock_guard lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        worker = std::move(worker_);
    }
    worker.request_stop();
    cv_.notify_all();
    worker.join();

    if (auto flushed = store_->flush(); !flushed) {
        log_->warn("Final metric flush failed: {}",
                   storageErrorToString(flushed.error()));
    }
    log_->info("Monitoring loop stopped");
}

auto MonitoringService::isRunning() const -> bool {
    std::lock_guard lock(mutex_);
    return worker_.joinable();
}

void MonitoringService::run(std::stop_token stop) {
    using Clock = std::chrono::steady_clock;
    auto nextFlush = Clock::now() + options_.flushInterval;
    auto nextSample = Clock::now() + options_.systemSampleInterval;

    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        auto wake = options_.systemSampling ? std::min(nextFlush, nextSample)
                                            : nextFlush;
        cv_.wait_until(lock, stop, wake, [] { return false; });
        if (stop.stop_requested()) {
            break;
        }
        lock.unlock();

        auto now = Clock::now();
        if (now >= nextFlush) {
            if (auto flushed = store_->flush(); !flushed) {
                log_->warn("Periodic metric flush failed: {}",
                           storageErrorToString(flushed.error()));
            }
            nextFlush = now + options_.flushInterval;
        }
        if (options_.systemSampling && now >= nextSample) {
            sampleSystem();
            nextSample = now + options_.systemSampleInterval;
        }

        lock.lock();
    }
}

void MonitoringService::recordExecution(const sandbox::ExecutionResult& result) {
    json metadata = {{"testId", result.id},
                     {"projectId", result.projectId},
                     {"versionId", result.versionId},
                     {"status", sandbox::executionStatusToString(result.status)}};

    store_->record({MetricKind::Execution, "codepage_execution_time",
                    static_cast<double>(result.executionTimeMs), "ms", metadata});
    store_->record({MetricKind::Execution, "codepage_memory_usage",
                    static_cast<double>(result.peakMemoryBytes), "bytes",
                    metadata});
    store_->record({MetricKind::Execution, "codepage_api_calls",
                    static_cast<double>(result.apiCallCount), "count", metadata});
    store_->record({MetricKind::Execution, "codepage_errors",
                    static_cast<double>(result.errors.size()), "count",
                    metadata});
    log_->debug("Recorded execution metrics for {}", result.id);
}

void MonitoringService::recordApiResponse(const ApiResponseSample& sample) {
    json metadata = {{"endpoint", sample.endpoint},
                     {"method", sample.method},
                     {"statusCode", sample.statusCode}};

    store_->record({MetricKind::ApiResponse, "api_response_time",
                    sample.responseTimeMs, "ms", metadata});
    store_->record({MetricKind::ApiResponse, "api_request_size",
                    static_cast<double>(sample.requestSize), "bytes",
                    {{"endpoint", sample.endpoint}, {"method", sample.method}}});
    store_->record({MetricKind::ApiResponse, "api_response_size",
                    static_cast<double>(sample.responseSize), "bytes", metadata});
    if (sample.statusCode >= 400) {
        store_->record(
            {MetricKind::ApiResponse, "api_errors", 1, "count", metadata});
    }
}

void MonitoringService::sampleSystem() {
    auto sample = probe_->sample();
    if (!sample) {
        log_->warn("System sampling unavailable on this host");
        return;
    }
    store_->record({MetricKind::SystemResource, "system_cpu_usage",
                    sample->cpuPercent, "percent", json::object()});
    store_->record({MetricKind::SystemResource, "system_memory_usage",
                    static_cast<double>(sample->memoryBytes), "bytes",
                    json::object()});
}

auto MonitoringService::summarize(std::optional<MetricKind> kind,
                                  int windowMinutes) const -> MetricSummary {
    return store_->summarize(kind, windowMinutes);
}

auto MonitoringService::systemHealth() const -> SystemHealth {
    SystemHealth health;
    auto active = alerts_->activeAlerts();
    health.activeAlerts = active.size();
    for (const auto& alert : active) {
        if (alert.severity == Severity::Critical) {
            health.criticalAlerts++;
        }
    }

    auto since = store_->clock()() - kHealthWindow;
    MetricFilter filter;
    filter.kind = MetricKind::SystemResource;
    filter.since = since;

    filter.name = "system_cpu_usage";
    double cpu = average(store_->query(filter));
    filter.name = "system_memory_usage";
    double memory = average(store_->query(filter));

    filter.kind = MetricKind::ApiResponse;
    filter.name = "api_response_time";
    double response = average(store_->query(filter));

    if (health.criticalAlerts > 0 || cpu > 90 || response > 10000) {
        health.status = HealthStatus::Critical;
    } else if (health.activeAlerts > 0 || cpu > 70 || response > 5000) {
        health.status = HealthStatus::Warning;
    }

    health.cpuUsage = round2(cpu);
    health.memoryUsageMb = round2(memory / 1024.0 / 1024.0);
    health.responseTimeMs = round2(response);
    health.uptimeSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                      startedAt_)
            .count();
    return health;
}

}  // namespace codepage::monitoring
