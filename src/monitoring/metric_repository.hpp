/*
 * metric_repository.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Retained metric storage

**************************************************/

#ifndef CODEPAGE_MONITORING_METRIC_REPOSITORY_HPP
#define CODEPAGE_MONITORING_METRIC_REPOSITORY_HPP

#include <expected>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <vector>

#include "types.hpp"

namespace codepage::monitoring {

/**
 * @brief Durable side of the metrics store
 *
 * append() is all-or-nothing: on error none of the batch is kept.
 */
class MetricRepository {
public:
    virtual ~MetricRepository() = default;

    virtual auto append(std::span<const Metric> batch)
        -> std::expected<void, StorageError> = 0;

    /**
     * @brief Remove metrics older than cutoff
     * @return Number removed
     */
    virtual auto prune(TimePoint cutoff) -> std::expected<size_t, StorageError> = 0;

    /**
     * @return Matching metrics, newest first, at most filter.limit
     */
    [[nodiscard]] virtual auto query(const MetricFilter& filter) const
        -> std::vector<Metric> = 0;

    [[nodiscard]] virtual auto size() const -> size_t = 0;
};

class InMemoryMetricRepository final : public MetricRepository {
public:
    auto append(std::span<const Metric> batch)
        -> std::expected<void, StorageError> override;
    auto prune(TimePoint cutoff) -> std::expected<size_t, StorageError> override;
    [[nodiscard]] auto query(const MetricFilter& filter) const
        -> std::vector<Metric> override;
    [[nodiscard]] auto size() const -> size_t override;

private:
    mutable std::mutex mutex_;
    std::multimap<TimePoint, Metric> metrics_;  // Ordered by timestamp
};

}  // namespace codepage::monitoring

#endif  // CODEPAGE_MONITORING_METRIC_REPOSITORY_HPP
