/*
 * analysis.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Pure report computations over a window of execution results

**************************************************/

#ifndef CODEPAGE_REPORTING_ANALYSIS_HPP
#define CODEPAGE_REPORTING_ANALYSIS_HPP

#include <span>
#include <vector>

#include "types.hpp"

namespace codepage::reporting {

inline constexpr double kSlowP95ExecutionMs = 10000.0;
inline constexpr double kHighP95MemoryBytes = 100.0 * 1024 * 1024;
inline constexpr double kSlowAverageApiMs = 1000.0;
inline constexpr size_t kMessageGroupLength = 100;
inline constexpr size_t kTopCommonErrors = 10;
inline constexpr size_t kTopCriticalErrors = 5;
inline constexpr size_t kTopSlowCalls = 5;

/**
 * @brief Nearest-rank percentile: values[ceil(p/100 * n) - 1], clamped
 * @param sorted ascending values
 * @return 0 for an empty input
 */
[[nodiscard]] auto percentile(std::span<const double> sorted, double p)
    -> double;

/**
 * @brief Middle value, or the mean of the two middle values
 */
[[nodiscard]] auto median(std::span<const double> sorted) -> double;

/**
 * @brief min/max/average/median/p95; values need not be sorted
 */
[[nodiscard]] auto distribution(std::vector<double> values) -> Distribution;

[[nodiscard]] auto summarize(std::span<const ExecutionResult> results)
    -> TestSummary;

[[nodiscard]] auto analyzePerformance(std::span<const ExecutionResult> results)
    -> PerformanceAnalysis;

[[nodiscard]] auto analyzeErrors(std::span<const ExecutionResult> results)
    -> ErrorAnalysis;

/**
 * @brief Critical: NameError, ReferenceError, TypeError, or a message
 * mentioning a timeout or memory
 */
[[nodiscard]] auto isCriticalError(const ExecutionError& error) -> bool;

/**
 * @brief Fixed-order recommendation rules
 */
[[nodiscard]] auto recommend(const TestSummary& summary,
                             const PerformanceAnalysis& performance,
                             const ErrorAnalysis& errors)
    -> std::vector<std::string>;

}  // namespace codepage::reporting

#endif  // CODEPAGE_REPORTING_ANALYSIS_HPP
