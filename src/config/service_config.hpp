/*
 * service_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Top-level configuration of the codepage core

**************************************************/

#ifndef CODEPAGE_CONFIG_SERVICE_CONFIG_HPP
#define CODEPAGE_CONFIG_SERVICE_CONFIG_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "logging/types.hpp"
#include "sections/execution_config.hpp"
#include "sections/monitoring_config.hpp"
#include "sections/reporting_config.hpp"
#include "types.hpp"

namespace codepage::config {

/**
 * @brief Looks up an environment variable; nullopt when unset
 */
using EnvironmentLookup =
    std::function<std::optional<std::string>(const std::string&)>;

[[nodiscard]] auto processEnvironment() -> EnvironmentLookup;

struct ServiceConfig {
    ExecutionSection execution;
    ReportingSection reporting;
    MonitoringSection monitoring;
    logging::LoggingConfig logging;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static ServiceConfig fromJson(const json& j);
    [[nodiscard]] ValidationResult validate() const;

    /**
     * @brief Load a .yaml/.yml or .json file, apply environment overrides
     * and validate
     *
     * Overrides are named CODEPAGE_<SECTION>_<KEY> with the key in upper
     * snake case, e.g. CODEPAGE_EXECUTION_TIMEOUT_MS=5000. Values are parsed
     * as JSON first and fall back to plain strings.
     */
    [[nodiscard]] static ConfigResult<ServiceConfig> load(
        const std::filesystem::path& path,
        const EnvironmentLookup& env = processEnvironment());

    /**
     * @brief Defaults with environment overrides applied
     */
    [[nodiscard]] static ConfigResult<ServiceConfig> fromEnvironment(
        const EnvironmentLookup& env = processEnvironment());
};

/**
 * @brief Overlay CODEPAGE_<SECTION>_<KEY> variables onto a config document
 *
 * Only keys already present in the document are considered.
 */
void applyEnvironmentOverrides(json& document, const EnvironmentLookup& env);

/**
 * @brief camelCase to UPPER_SNAKE, e.g. timeoutMs -> TIMEOUT_MS
 */
[[nodiscard]] auto toEnvironmentKey(std::string_view key) -> std::string;

}  // namespace codepage::config

#endif  // CODEPAGE_CONFIG_SERVICE_CONFIG_HPP
