/*
 * metrics_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Buffered, append-only metric ingestion

**************************************************/

#ifndef CODEPAGE_MONITORING_METRICS_STORE_HPP
#define CODEPAGE_MONITORING_METRICS_STORE_HPP

#include <chrono>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "metric_repository.hpp"
#include "types.hpp"

namespace codepage::monitoring {

struct MetricsStoreOptions {
    size_t bufferSize{1000};
    std::chrono::hours retention{24};  ///< Clamped to 1..24 hours
    utils::Clock clock = utils::systemClock();
};

/**
 * @brief Ingestion point for all telemetry
 *
 * record() appends to an in-memory buffer which is moved into the
 * repository in one batch once it holds bufferSize metrics, or on flush().
 * Every flush prunes the repository to the retention horizon. A failed
 * batch goes back to the front of the buffer. Queries see both retained
 * and buffered metrics.
 *
 * Observers run on the recording thread after the metric is stored and
 * outside the store lock; they may query the store.
 */
class MetricsStore : public MetricWindow {
public:
    explicit MetricsStore(MetricsStoreOptions options = {},
                          std::shared_ptr<MetricRepository> repository = nullptr);

    /**
     * @brief Stamp id and timestamp, store, then notify observers
     */
    auto record(MetricInput input) -> Metric;

    /**
     * @brief Store a fully formed metric (id and timestamp kept)
     */
    void ingest(Metric metric);

    /**
     * @return Matching metrics, newest first
     */
    [[nodiscard]] auto query(const MetricFilter& filter) const
        -> std::vector<Metric>;

    /**
     * @brief Count, average, min and max over the last windowMinutes
     */
    [[nodiscard]] auto summarize(std::optional<MetricKind> kind,
                                 int windowMinutes = 60) const -> MetricSummary;

    [[nodiscard]] auto window(const std::string& name, TimePoint since) const
        -> std::vector<Metric> override;

    /**
     * @return Number of metrics moved into the repository
     */
    auto flush() -> std::expected<size_t, StorageError>;

    [[nodiscard]] auto bufferedCount() const -> size_t;
    [[nodiscard]] auto retainedCount() const -> size_t;

    void addObserver(std::weak_ptr<MetricObserver> observer);
    [[nodiscard]] auto clock() const -> const utils::Clock& {
        return options_.clock;
    }

private:
    auto flushLocked() -> std::expected<size_t, StorageError>;
    void notify(const Metric& metric);

    MetricsStoreOptions options_;
    std::shared_ptr<MetricRepository> repository_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex mutex_;
    std::deque<Metric> buffer_;

    std::mutex observersMutex_;
    std::vector<std::weak_ptr<MetricObserver>> observers_;
};

}  // namespace codepage::monitoring

#endif  // CODEPAGE_MONITORING_METRICS_STORE_HPP
