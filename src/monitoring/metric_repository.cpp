/*
 * metric_repository.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "metric_repository.hpp"

#include <iterator>

namespace codepage::monitoring {

auto InMemoryMetricRepository::append(std::span<const Metric> batch)
    -> std::expected<void, StorageError> {
    std::lock_guard lock(mutex_);
    for (const auto& metric : batch) {
        metrics_.emplace(metric.timestamp, metric);
    }
    return {};
}

auto InMemoryMetricRepository::prune(TimePoint cutoff)
    -> std::expected<size_t, StorageError> {
    std::lock_guard lock(mutex_);
    auto end = metrics_.lower_bound(cutoff);
    auto removed = static_cast<size_t>(std::distance(metrics_.begin(), end));
    metrics_.erase(metrics_.begin(), end);
    return removed;
}

auto InMemoryMetricRepository::query(const MetricFilter& filter) const
    -> std::vector<Metric> {
    std::lock_guard lock(mutex_);
    std::vector<Metric> out;
    for (auto it = metrics_.rbegin(); it != metrics_.rend(); ++it) {
        if (out.size() >= filter.limit) {
            break;
        }
        if (filter.since && it->first < *filter.since) {
            break;
        }
        if (filter.matches(it->second)) {
            out.push_back(it->second);
        }
    }
    return out;
}

auto InMemoryMetricRepository::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return metrics_.size();
}

}  // namespace codepage::monitoring
