/*
 * execution_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Script execution defaults and engine options

**************************************************/

#ifndef CODEPAGE_CONFIG_SECTIONS_EXECUTION_CONFIG_HPP
#define CODEPAGE_CONFIG_SECTIONS_EXECUTION_CONFIG_HPP

#include <cstddef>
#include <string>

#include "../types.hpp"

namespace codepage::config {

struct ExecutionSection {
    static constexpr std::string_view NAME = "execution";

    size_t timeoutMs{30000};                      ///< Default wall-clock limit
    size_t memoryLimitBytes{128 * 1024 * 1024};   ///< Default memory ceiling
    size_t apiCallLimit{100};                     ///< Default mock API calls
    std::string environment{"development"};       ///< development, staging, production
    size_t pollIntervalMs{100};                   ///< Supervisor tick
    double latencyScale{1.0};                     ///< Mock API latency multiplier
    size_t maxConcurrentExecutions{4};            ///< Runs admitted at once

    [[nodiscard]] json toJson() const {
        return {{"timeoutMs", timeoutMs},
                {"memoryLimitBytes", memoryLimitBytes},
                {"apiCallLimit", apiCallLimit},
                {"environment", environment},
                {"pollIntervalMs", pollIntervalMs},
                {"latencyScale", latencyScale},
                {"maxConcurrentExecutions", maxConcurrentExecutions}};
    }

    [[nodiscard]] static ExecutionSection fromJson(const json& j) {
        ExecutionSection cfg;
        cfg.timeoutMs = j.value("timeoutMs", cfg.timeoutMs);
        cfg.memoryLimitBytes = j.value("memoryLimitBytes", cfg.memoryLimitBytes);
        cfg.apiCallLimit = j.value("apiCallLimit", cfg.apiCallLimit);
        cfg.environment = j.value("environment", cfg.environment);
        cfg.pollIntervalMs = j.value("pollIntervalMs", cfg.pollIntervalMs);
        cfg.latencyScale = j.value("latencyScale", cfg.latencyScale);
        cfg.maxConcurrentExecutions =
            j.value("maxConcurrentExecutions", cfg.maxConcurrentExecutions);
        return cfg;
    }

    [[nodiscard]] ValidationResult validate() const {
        ValidationResult result;
        if (timeoutMs == 0) {
            result.addError(NAME, "timeoutMs", "must be positive");
        }
        if (memoryLimitBytes == 0) {
            result.addError(NAME, "memoryLimitBytes", "must be positive");
        }
        if (environment != "development" && environment != "staging" &&
            environment != "production") {
            result.addError(NAME, "environment",
                            "must be development, staging or production");
        }
        if (pollIntervalMs == 0 || pollIntervalMs > 1000) {
            result.addError(NAME, "pollIntervalMs", "must be in 1..1000");
        }
        if (latencyScale < 0.0) {
            result.addError(NAME, "latencyScale", "must not be negative");
        }
        if (maxConcurrentExecutions == 0) {
            result.addError(NAME, "maxConcurrentExecutions",
                            "must be positive");
        }
        return result;
    }
};

}  // namespace codepage::config

#endif  // CODEPAGE_CONFIG_SECTIONS_EXECUTION_CONFIG_HPP
