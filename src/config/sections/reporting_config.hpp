/*
 * reporting_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_CONFIG_SECTIONS_REPORTING_CONFIG_HPP
#define CODEPAGE_CONFIG_SECTIONS_REPORTING_CONFIG_HPP

#include <cstddef>

#include "../types.hpp"

namespace codepage::config {

struct ReportingSection {
    static constexpr std::string_view NAME = "reporting";

    size_t historyCapacity{100};     ///< Results kept per project/version
    size_t reportResultCount{20};    ///< Results embedded in a detailed report
    bool autoGenerateOnError{true};  ///< Regenerate when a failing run lands

    [[nodiscard]] json toJson() const {
        return {{"historyCapacity", historyCapacity},
                {"reportResultCount", reportResultCount},
                {"autoGenerateOnError", autoGenerateOnError}};
    }

    [[nodiscard]] static ReportingSection fromJson(const json& j) {
        ReportingSection cfg;
        cfg.historyCapacity = j.value("historyCapacity", cfg.historyCapacity);
        cfg.reportResultCount =
            j.value("reportResultCount", cfg.reportResultCount);
        cfg.autoGenerateOnError =
            j.value("autoGenerateOnError", cfg.autoGenerateOnError);
        return cfg;
    }

    [[nodiscard]] ValidationResult validate() const {
        ValidationResult result;
        if (historyCapacity == 0) {
            result.addError(NAME, "historyCapacity", "must be positive");
        }
        if (reportResultCount == 0) {
            result.addError(NAME, "reportResultCount", "must be positive");
        }
        return result;
    }
};

}  // namespace codepage::config

#endif  // CODEPAGE_CONFIG_SECTIONS_REPORTING_CONFIG_HPP
