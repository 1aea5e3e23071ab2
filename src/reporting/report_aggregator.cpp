/*
 * report_aggregator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "report_aggregator.hpp"

#include <algorithm>
#include <cmath>

#include "analysis.hpp"
#include "logging/logging_manager.hpp"
#include "utils/id_generator.hpp"

namespace codepage::reporting {

ReportAggregator::ReportAggregator(AggregatorOptions options,
                                   std::shared_ptr<ReportStore> store)
    : options_(std::move(options)),
      store_(store ? std::move(store)
                   : std::make_shared<storage::InMemoryStore<TestReport>>()),
      log_(logging::logger("reporting")) {
    if (options_.historyCapacity == 0) {
        options_.historyCapacity = 1;
    }
    if (!options_.clock) {
        options_.clock = utils::systemClock();
    }
    log_->info("Report aggregator initialized (history {} per project)",
               options_.historyCapacity);
}

auto ReportAggregator::history(const Key& key, bool create) const
    -> std::shared_ptr<History> {
    std::lock_guard lock(historiesMutex_);
    auto it = histories_.find(key);
    if (it != histories_.end()) {
        return it->second;
    }
    if (!create) {
        return nullptr;
    }
    auto entry = std::make_shared<History>();
    histories_.emplace(key, entry);
    return entry;
}

auto ReportAggregator::histories() const
    -> std::vector<std::shared_ptr<History>> {
    std::lock_guard lock(historiesMutex_);
    std::vector<std::shared_ptr<History>> out;
    out.reserve(histories_.size());
    for (const auto& [key, entry] : histories_) {
        out.push_back(entry);
    }
    return out;
}

void ReportAggregator::record(const ExecutionResult& result) {
    auto entry = history({result.projectId, result.versionId}, true);
    {
        std::lock_guard lock(entry->mutex);
        entry->results.push_back(result);
        while (entry->results.size() > options_.historyCapacity) {
            entry->results.pop_front();
        }
    }
    log_->debug("Test result captured: {} ({})", result.id,
                sandbox::executionStatusToString(result.status));

    bool significant = result.status == sandbox::ExecutionStatus::Error ||
                       !result.errors.empty();
    if (significant && options_.autoGenerateOnError) {
        auto report = generate(result.projectId, result.versionId);
        if (!report) {
            log_->warn("Automatic report for {}/{} failed: {}",
                       result.projectId, result.versionId,
                       reportErrorToString(report.error()));
        }
    }
}

auto ReportAggregator::generate(const std::string& projectId,
                                const std::string& versionId,
                                const ReportOptions& options)
    -> std::expected<TestReport, ReportError> {
    std::vector<ExecutionResult> window = results(projectId, versionId);
    if (window.empty()) {
        return std::unexpected(ReportError::NoResults);
    }

    auto now = options_.clock();
    TestReport report;
    report.id = utils::generateId("report", now);
    report.projectId = projectId;
    report.versionId = versionId;
    report.detailLevel = options.detailLevel;
    report.generatedAt = now;

    report.summary = summarize(window);
    if (options.includePerformanceAnalysis) {
        report.performanceAnalysis = analyzePerformance(window);
    }
    if (options.includeErrorAnalysis) {
        report.errorAnalysis = analyzeErrors(window);
    }
    if (options.includeRecommendations) {
        report.recommendations = recommend(
            report.summary, report.performanceAnalysis, report.errorAnalysis);
    }

    switch (options.detailLevel) {
        case DetailLevel::Basic:
            break;
        case DetailLevel::Detailed: {
            size_t keep = std::min(window.size(), options_.reportResultCount);
            report.testResults.assign(window.end() - static_cast<long>(keep),
                                      window.end());
            break;
        }
        case DetailLevel::Comprehensive:
            report.testResults = window;
            break;
    }

    store_->put(report.id, report);
    log_->info("Test report generated: {} for {}/{} ({} tests, {:.1f}% passed, "
               "avg {}ms)",
               report.id, projectId, versionId, report.summary.totalTests,
               report.summary.successRate,
               report.summary.averageExecutionTimeMs);
    return report;
}

auto ReportAggregator::get(const std::string& reportId) const
    -> std::expected<TestReport, ReportError> {
    auto report = store_->get(reportId);
    if (!report) {
        return std::unexpected(ReportError::NotFound);
    }
    return *report;
}

auto ReportAggregator::projectReports(const std::string& projectId) const
    -> std::vector<TestReport> {
    auto reports = store_->list([&](const TestReport& report) {
        return report.projectId == projectId;
    });
    std::stable_sort(reports.begin(), reports.end(),
                     [](const TestReport& a, const TestReport& b) {
                         return a.generatedAt > b.generatedAt;
                     });
    return reports;
}

auto ReportAggregator::results(const std::string& projectId,
                               const std::string& versionId) const
    -> std::vector<ExecutionResult> {
    auto entry = history({projectId, versionId}, false);
    if (!entry) {
        return {};
    }
    std::lock_guard lock(entry->mutex);
    return {entry->results.begin(), entry->results.end()};
}

auto ReportAggregator::deleteOlderThan(std::chrono::days age) -> size_t {
    auto cutoff = options_.clock() - age;
    size_t deleted = 0;

    for (const auto& entry : histories()) {
        std::lock_guard lock(entry->mutex);
        deleted += std::erase_if(entry->results, [&](const ExecutionResult& r) {
            return r.createdAt <= cutoff;
        });
    }
    deleted += store_->removeIf(
        [&](const TestReport& report) { return report.generatedAt < cutoff; });

    log_->info("Cleaned up {} old test results and reports", deleted);
    return deleted;
}

auto ReportAggregator::stats() const -> ReportingStats {
    ReportingStats stats;
    auto entries = histories();
    for (const auto& entry : entries) {
        std::lock_guard lock(entry->mutex);
        stats.totalResults += entry->results.size();
        for (const auto& result : entry->results) {
            if (!stats.oldestResult || result.createdAt < *stats.oldestResult) {
                stats.oldestResult = result.createdAt;
            }
            if (!stats.newestResult || result.createdAt > *stats.newestResult) {
                stats.newestResult = result.createdAt;
            }
        }
    }
    stats.totalReports = store_->size();
    if (!entries.empty()) {
        stats.averageResultsPerProject = static_cast<size_t>(std::llround(
            static_cast<double>(stats.totalResults) /
            static_cast<double>(entries.size())));
    }
    return stats;
}

}  // namespace codepage::reporting
