/*
 * monitoring_service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Execution telemetry, periodic flushing and system health

**************************************************/

#ifndef CODEPAGE_MONITORING_MONITORING_SERVICE_HPP
#define CODEPAGE_MONITORING_MONITORING_SERVICE_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "alert_engine.hpp"
#include "metrics_store.hpp"
#include "script/sandbox/types.hpp"
#include "system_probe.hpp"

namespace codepage::monitoring {

struct MonitoringServiceOptions {
    std::chrono::seconds flushInterval{30};
    std::chrono::seconds systemSampleInterval{60};
    bool systemSampling{true};
};

/**
 * @brief One response served by the platform API
 */
struct ApiResponseSample {
    std::string endpoint;
    std::string method;
    int statusCode{200};
    double responseTimeMs{0};
    size_t requestSize{0};
    size_t responseSize{0};
};

/**
 * @brief Turns execution results and API responses into metrics and runs
 * the periodic flush and system sampling loop
 */
class MonitoringService : public sandbox::ExecutionObserver {
public:
    MonitoringService(MonitoringServiceOptions options,
                      std::shared_ptr<MetricsStore> store,
                      std::shared_ptr<AlertEngine> alerts,
                      std::shared_ptr<SystemProbe> probe = nullptr);
    ~MonitoringService() override;

    MonitoringService(const MonitoringService&) = delete;
    MonitoringService& operator=(const MonitoringService&) = delete;

    void start();

    /**
     * @brief Stop the background loop and flush the buffer
     */
    void stop();
    [[nodiscard]] auto isRunning() const -> bool;

    /**
     * @brief codepage_execution_time, codepage_memory_usage,
     * codepage_api_calls and codepage_errors
     */
    void recordExecution(const sandbox::ExecutionResult& result);

    void onExecutionResult(const sandbox::ExecutionResult& result) override {
        recordExecution(result);
    }

    /**
     * @brief api_response_time, api_request_size, api_response_size and,
     * for status >= 400, api_errors
     */
    void recordApiResponse(const ApiResponseSample& sample);

    /**
     * @brief Record system_cpu_usage and system_memory_usage now
     */
    void sampleSystem();

    [[nodiscard]] auto summarize(std::optional<MetricKind> kind,
                                 int windowMinutes = 60) const -> MetricSummary;

    [[nodiscard]] auto systemHealth() const -> SystemHealth;

private:
    void run(std::stop_token stop);

    MonitoringServiceOptions options_;
    std::shared_ptr<MetricsStore> store_;
    std::shared_ptr<AlertEngine> alerts_;
    std::shared_ptr<SystemProbe> probe_;
    std::shared_ptr<spdlog::logger> log_;
    std::chrono::steady_clock::time_point startedAt_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread worker_;
};

}  // namespace codepage::monitoring

#endif  // CODEPAGE_MONITORING_MONITORING_SERVICE_HPP
