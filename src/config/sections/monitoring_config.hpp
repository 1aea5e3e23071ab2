/*
 * monitoring_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Metrics buffer, retention and alerting options

**************************************************/

#ifndef CODEPAGE_CONFIG_SECTIONS_MONITORING_CONFIG_HPP
#define CODEPAGE_CONFIG_SECTIONS_MONITORING_CONFIG_HPP

#include <cstddef>
#include <string>

#include "../types.hpp"

namespace codepage::config {

struct MonitoringSection {
    static constexpr std::string_view NAME = "monitoring";

    size_t bufferSize{1000};             ///< Buffered metrics before a flush
    size_t retentionHours{24};           ///< Retained metric horizon
    size_t flushIntervalSeconds{30};     ///< Periodic flush
    size_t systemSampleSeconds{60};      ///< CPU / memory sampling
    bool defaultRules{true};             ///< Install the built-in alert rules
    bool systemSampling{true};           ///< Run the sampling thread
    std::string repository{"memory"};    ///< memory or sqlite
    std::string databasePath{"data/metrics.db"};

    [[nodiscard]] json toJson() const {
        return {{"bufferSize", bufferSize},
                {"retentionHours", retentionHours},
                {"flushIntervalSeconds", flushIntervalSeconds},
                {"systemSampleSeconds", systemSampleSeconds},
                {"defaultRules", defaultRules},
                {"systemSampling", systemSampling},
                {"repository", repository},
                {"databasePath", databasePath}};
    }

    [[nodiscard]] static MonitoringSection fromJson(const json& j) {
        MonitoringSection cfg;
        cfg.bufferSize = j.value("bufferSize", cfg.bufferSize);
        cfg.retentionHours = j.value("retentionHours", cfg.retentionHours);
        cfg.flushIntervalSeconds =
            j.value("flushIntervalSeconds", cfg.flushIntervalSeconds);
        cfg.systemSampleSeconds =
            j.value("systemSampleSeconds", cfg.systemSampleSeconds);
        cfg.defaultRules = j.value("defaultRules", cfg.defaultRules);
        cfg.systemSampling = j.value("systemSampling", cfg.systemSampling);
        cfg.repository = j.value("repository", cfg.repository);
        cfg.databasePath = j.value("databasePath", cfg.databasePath);
        return cfg;
    }

    [[nodiscard]] ValidationResult validate() const {
        ValidationResult result;
        if (bufferSize == 0) {
            result.addError(NAME, "bufferSize", "must be positive");
        }
        if (retentionHours == 0 || retentionHours > 24) {
            result.addError(NAME, "retentionHours", "must be in 1..24");
        }
        if (flushIntervalSeconds == 0) {
            result.addError(NAME, "flushIntervalSeconds", "must be positive");
        }
        if (systemSampleSeconds == 0) {
            result.addError(NAME, "systemSampleSeconds", "must be positive");
        }
        if (repository != "memory" && repository != "sqlite") {
            result.addError(NAME, "repository", "must be memory or sqlite");
        }
        if (repository == "sqlite" && databasePath.empty()) {
            result.addError(NAME, "databasePath",
                            "required for the sqlite repository");
        }
        return result;
    }
};

}  // namespace codepage::config

#endif  // CODEPAGE_CONFIG_SECTIONS_MONITORING_CONFIG_HPP
