/*
 * metrics_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "metrics_store.hpp"

#include <algorithm>
#include <limits>

#include "logging/logging_manager.hpp"
#include "utils/id_generator.hpp"

namespace codepage::monitoring {

MetricsStore::MetricsStore(MetricsStoreOptions options,
                           std::shared_ptr<MetricRepository> repository)
    : options_(std::move(options)),
      repository_(repository ? std::move(repository)
                             : std::make_shared<InMemoryMetricRepository>()),
      log_(logging::logger("monitoring")) {
    options_.bufferSize = std::max<size_t>(options_.bufferSize, 1);
    options_.retention = std::clamp(options_.retention, std::chrono::hours(1),
                                    std::chrono::hours(24));
    if (!options_.clock) {
        options_.clock = utils::systemClock();
    }
    log_->info("Metrics store initialized (buffer {}, retention {}h)",
               options_.bufferSize, options_.retention.count());
}

auto MetricsStore::record(MetricInput input) -> Metric {
    Metric metric;
    metric.timestamp = options_.clock();
    metric.id = utils::generateId("metric", metric.timestamp);
    metric.kind = input.kind;
    metric.name = std::move(input.name);
    metric.value = input.value;
    metric.unit = std::move(input.unit);
    metric.metadata =
        input.metadata.is_object() ? std::move(input.metadata) : json::object();
    ingest(metric);
    return metric;
}

void MetricsStore::ingest(Metric metric) {
    {
        std::lock_guard lock(mutex_);
        buffer_.push_back(metric);
        if (buffer_.size() >= options_.bufferSize) {
            auto flushed = flushLocked();
            if (!flushed) {
                log_->warn("Buffer flush failed ({}), {} metrics pending",
                           storageErrorToString(flushed.error()),
                           buffer_.size());
            }
        }
    }
    notify(metric);
}

auto MetricsStore::flush() -> std::expected<size_t, StorageError> {
    std::lock_guard lock(mutex_);
    return flushLocked();
}

auto MetricsStore::flushLocked() -> std::expected<size_t, StorageError> {
    std::vector<Metric> batch(std::make_move_iterator(buffer_.begin()),
                              std::make_move_iterator(buffer_.end()));
    buffer_.clear();

    if (!batch.empty()) {
        std::expected<void, StorageError> appended;
        try {
            appended = repository_->append(batch);
        } catch (const std::exception& e) {
            log_->error("Metric repository threw while appending: {}",
                        e.what());
            appended = std::unexpected(StorageError::WriteFailed);
        }
        if (!appended) {
            log_->warn("Error flushing {} metrics: {}; re-queued for retry",
                       batch.size(), storageErrorToString(appended.error()));
            buffer_.insert(buffer_.begin(), std::make_move_iterator(batch.begin()),
                           std::make_move_iterator(batch.end()));
            return std::unexpected(appended.error());
        }
    }

    auto cutoff = options_.clock() - options_.retention;
    auto pruned = repository_->prune(cutoff);
    if (!pruned) {
        log_->warn("Retention pruning failed: {}",
                   storageErrorToString(pruned.error()));
    } else if (*pruned > 0) {
        log_->debug("Pruned {} metrics older than {}", *pruned,
                    utils::toIsoString(cutoff));
    }

    if (!batch.empty()) {
        log_->debug("Flushed {} metrics to storage", batch.size());
    }
    return batch.size();
}

auto MetricsStore::query(const MetricFilter& filter) const
    -> std::vector<Metric> {
    std::vector<Metric> out;
    {
        std::lock_guard lock(mutex_);
        for (const auto& metric : buffer_) {
            if (filter.matches(metric)) {
                out.push_back(metric);
            }
        }
        auto retained = repository_->query(filter);
        out.insert(out.end(), std::make_move_iterator(retained.begin()),
                   std::make_move_iterator(retained.end()));
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const Metric& a, const Metric& b) {
                         return a.timestamp > b.timestamp;
                     });
    if (out.size() > filter.limit) {
        out.resize(filter.limit);
    }
    return out;
}

auto MetricsStore::summarize(std::optional<MetricKind> kind,
                             int windowMinutes) const -> MetricSummary {
    MetricSummary summary;
    summary.windowEnd = options_.clock();
    summary.windowStart =
        summary.windowEnd - std::chrono::minutes(std::max(windowMinutes, 0));

    MetricFilter filter;
    filter.kind = kind;
    filter.since = summary.windowStart;
    filter.limit = std::numeric_limits<size_t>::max();
    auto metrics = query(filter);
    if (metrics.empty()) {
        return summary;
    }

    summary.totalMetrics = metrics.size();
    summary.minValue = metrics.front().value;
    summary.maxValue = metrics.front().value;
    double total = 0;
    for (const auto& metric : metrics) {
        total += metric.value;
        summary.minValue = std::min(summary.minValue, metric.value);
        summary.maxValue = std::max(summary.maxValue, metric.value);
    }
    summary.averageValue = total / static_cast<double>(metrics.size());
    return summary;
}

auto MetricsStore::window(const std::string& name, TimePoint since) const
    -> std::vector<Metric> {
    MetricFilter filter;
    filter.name = name;
    filter.since = since;
    filter.limit = std::numeric_limits<size_t>::max();
    return query(filter);
}

auto MetricsStore::bufferedCount() const -> size_t {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

auto MetricsStore::retainedCount() const -> size_t {
    return repository_->size();
}

void MetricsStore::addObserver(std::weak_ptr<MetricObserver> observer) {
    std::lock_guard lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

void MetricsStore::notify(const Metric& metric) {
    std::vector<std::shared_ptr<MetricObserver>> live;
    {
        std::lock_guard lock(observersMutex_);
        std::erase_if(observers_,
                      [](const auto& observer) { return observer.expired(); });
        for (const auto& observer : observers_) {
            if (auto locked = observer.lock()) {
                live.push_back(std::move(locked));
            }
        }
    }
    for (const auto& observer : live) {
        try {
            observer->onMetric(metric);
        } catch (const std::exception& e) {
            log_->error("Metric observer failed on {}: {}", metric.name,
                        e.what());
        }
    }
}

}  // namespace codepage::monitoring
