/*
 * sqlite_metric_repository.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_MONITORING_SQLITE_METRIC_REPOSITORY_HPP
#define CODEPAGE_MONITORING_SQLITE_METRIC_REPOSITORY_HPP

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

#include "metric_repository.hpp"
#include "storage/sqlite/database.hpp"

namespace codepage::monitoring {

/**
 * @brief Metric repository backed by a SQLite table, one transaction per
 * appended batch
 */
class SqliteMetricRepository final : public MetricRepository {
public:
    /**
     * @param path Database file, or ":memory:"
     * @throws storage::sqlite::SqliteError if the database cannot be opened
     */
    explicit SqliteMetricRepository(const std::string& path);

    auto append(std::span<const Metric> batch)
        -> std::expected<void, StorageError> override;
    auto prune(TimePoint cutoff) -> std::expected<size_t, StorageError> override;
    [[nodiscard]] auto query(const MetricFilter& filter) const
        -> std::vector<Metric> override;
    [[nodiscard]] auto size() const -> size_t override;

private:
    mutable std::mutex mutex_;
    std::unique_ptr<storage::sqlite::Database> db_;
    std::shared_ptr<spdlog::logger> log_;
};

}  // namespace codepage::monitoring

#endif  // CODEPAGE_MONITORING_SQLITE_METRIC_REPOSITORY_HPP
