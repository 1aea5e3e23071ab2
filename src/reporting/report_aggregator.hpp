/*
 * report_aggregator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Rolling per-project result history and report generation

**************************************************/

#ifndef CODEPAGE_REPORTING_REPORT_AGGREGATOR_HPP
#define CODEPAGE_REPORTING_REPORT_AGGREGATOR_HPP

#include <chrono>
#include <deque>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "script/sandbox/types.hpp"
#include "storage/store.hpp"
#include "types.hpp"

namespace codepage::reporting {

struct AggregatorOptions {
    size_t historyCapacity{100};    ///< Results retained per project/version
    size_t reportResultCount{20};   ///< Results embedded at detailed level
    bool autoGenerateOnError{true};
    utils::Clock clock = utils::systemClock();
};

/**
 * @brief Keeps the most recent results of every (project, version) pair
 * and derives TestReports from them
 *
 * Each pair owns an independent ring guarded by its own mutex. Reports are
 * kept in the injected store and are never updated once generated.
 */
class ReportAggregator : public sandbox::ExecutionObserver {
public:
    using ReportStore = storage::KeyValueStore<TestReport>;

    explicit ReportAggregator(AggregatorOptions options = {},
                              std::shared_ptr<ReportStore> store = nullptr);

    /**
     * @brief Append a result; a result with errors triggers a detailed
     * report for its pair when auto generation is enabled
     */
    void record(const ExecutionResult& result);

    void onExecutionResult(const ExecutionResult& result) override {
        record(result);
    }

    [[nodiscard]] auto generate(const std::string& projectId,
                                const std::string& versionId,
                                const ReportOptions& options = {})
        -> std::expected<TestReport, ReportError>;

    [[nodiscard]] auto get(const std::string& reportId) const
        -> std::expected<TestReport, ReportError>;

    /**
     * @brief Reports of a project, newest first
     */
    [[nodiscard]] auto projectReports(const std::string& projectId) const
        -> std::vector<TestReport>;

    [[nodiscard]] auto results(const std::string& projectId,
                               const std::string& versionId) const
        -> std::vector<ExecutionResult>;

    /**
     * @brief Drop results created and reports generated before now - age
     * @return Number of results and reports removed
     */
    auto deleteOlderThan(std::chrono::days age) -> size_t;

    [[nodiscard]] auto stats() const -> ReportingStats;

private:
    using Key = std::pair<std::string, std::string>;

    struct History {
        mutable std::mutex mutex;
        std::deque<ExecutionResult> results;
    };

    auto history(const Key& key, bool create) const
        -> std::shared_ptr<History>;
    auto histories() const -> std::vector<std::shared_ptr<History>>;

    AggregatorOptions options_;
    std::shared_ptr<ReportStore> store_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex historiesMutex_;
    mutable std::map<Key, std::shared_ptr<History>> histories_;
};

}  // namespace codepage::reporting

#endif  // CODEPAGE_REPORTING_REPORT_AGGREGATOR_HPP
