/*
 * sqlite_metric_repository.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sqlite_metric_repository.hpp"

#include "logging/logging_manager.hpp"
#include "storage/sqlite/statement.hpp"
#include "storage/sqlite/transaction.hpp"

namespace codepage::monitoring {

namespace {

constexpr const char* kSchema = R"(
CREATE TABLE IF NOT EXISTS metrics (
    id        TEXT PRIMARY KEY,
    kind      TEXT NOT NULL,
    name      TEXT NOT NULL,
    value     REAL NOT NULL,
    unit      TEXT NOT NULL,
    timestamp INTEGER NOT NULL,
    metadata  TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_metrics_name_time ON metrics(name, timestamp);
CREATE INDEX IF NOT EXISTS idx_metrics_time ON metrics(timestamp);
)";

}  // namespace

SqliteMetricRepository::SqliteMetricRepository(const std::string& path)
    : db_(std::make_unique<storage::sqlite::Database>(path)),
      log_(logging::logger("storage")) {
    db_->execute(kSchema);
    log_->info("Metric repository ready at {}", path);
}

auto SqliteMetricRepository::append(std::span<const Metric> batch)
    -> std::expected<void, StorageError> {
    std::lock_guard lock(mutex_);
    try {
        auto txn = db_->beginTransaction();
        auto stmt = db_->prepare(
            "INSERT OR REPLACE INTO metrics "
            "(id, kind, name, value, unit, timestamp, metadata) "
            "VALUES (?, ?, ?, ?, ?, ?, ?);");
        for (const auto& metric : batch) {
            stmt->reset()
                .bind(1, metric.id)
                .bind(2, std::string(metricKindToString(metric.kind)))
                .bind(3, metric.name)
                .bind(4, metric.value)
                .bind(5, metric.unit)
                .bind(6, utils::toEpochMillis(metric.timestamp))
                .bind(7, metric.metadata.dump(-1, ' ', false,
                                              json::error_handler_t::replace));
            stmt->execute();
        }
        txn->commit();
    } catch (const storage::sqlite::SqliteError& e) {
        log_->error("Failed to append {} metrics: {}", batch.size(), e.what());
        return std::unexpected(StorageError::WriteFailed);
    } catch (const json::exception& e) {
        log_->error("Failed to encode {} metrics: {}", batch.size(), e.what());
        return std::unexpected(StorageError::WriteFailed);
    }
    return {};
}

auto SqliteMetricRepository::prune(TimePoint cutoff)
    -> std::expected<size_t, StorageError> {
    std::lock_guard lock(mutex_);
    try {
        auto stmt = db_->prepare("DELETE FROM metrics WHERE timestamp < ?;");
        stmt->bind(1, utils::toEpochMillis(cutoff));
        stmt->execute();
        return static_cast<size_t>(sqlite3_changes(db_->get()));
    } catch (const storage::sqlite::SqliteError& e) {
        log_->error("Failed to prune metrics: {}", e.what());
        return std::unexpected(StorageError::WriteFailed);
    }
}

auto SqliteMetricRepository::query(const MetricFilter& filter) const
    -> std::vector<Metric> {
    std::string sql =
        "SELECT id, kind, name, value, unit, timestamp, metadata FROM metrics "
        "WHERE 1 = 1";
    if (filter.kind) {
        sql += " AND kind = ?";
    }
    if (filter.name) {
        sql += " AND name = ?";
    }
    if (filter.since) {
        sql += " AND timestamp >= ?";
    }
    if (filter.until) {
        sql += " AND timestamp <= ?";
    }
    sql += " ORDER BY timestamp DESC LIMIT ?;";

    std::vector<Metric> out;
    std::lock_guard lock(mutex_);
    try {
        auto stmt = db_->prepare(sql);
        int index = 1;
        if (filter.kind) {
            stmt->bind(index++, std::string(metricKindToString(*filter.kind)));
        }
        if (filter.name) {
            stmt->bind(index++, *filter.name);
        }
        if (filter.since) {
            stmt->bind(index++, utils::toEpochMillis(*filter.since));
        }
        if (filter.until) {
            stmt->bind(index++, utils::toEpochMillis(*filter.until));
        }
        stmt->bind(index, static_cast<int64_t>(filter.limit));

        while (stmt->step()) {
            Metric metric;
            metric.id = stmt->getText(0);
            metric.kind = metricKindFromString(stmt->getText(1))
                              .value_or(MetricKind::Execution);
            metric.name = stmt->getText(2);
            metric.value = stmt->getDouble(3);
            metric.unit = stmt->getText(4);
            metric.timestamp = utils::fromEpochMillis(stmt->getInt64(5));
            metric.metadata = json::parse(stmt->getText(6), nullptr, false);
            if (metric.metadata.is_discarded()) {
                metric.metadata = json::object();
            }
            out.push_back(std::move(metric));
        }
    } catch (const storage::sqlite::SqliteError& e) {
        log_->error("Metric query failed: {}", e.what());
    }
    return out;
}

auto SqliteMetricRepository::size() const -> size_t {
    std::lock_guard lock(mutex_);
    try {
        auto stmt = db_->prepare("SELECT COUNT(*) FROM metrics;");
        return stmt->step() ? static_cast<size_t>(stmt->getInt64(0)) : 0;
    } catch (const storage::sqlite::SqliteError& e) {
        log_->error("Metric count failed: {}", e.what());
        return 0;
    }
}

}  // namespace codepage::monitoring
