/*
 * mock_api.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file mock_api.hpp
 * @brief Stand-in for the platform data API used by scripts under test
 */

#ifndef CODEPAGE_SCRIPT_SANDBOX_MOCK_API_HPP
#define CODEPAGE_SCRIPT_SANDBOX_MOCK_API_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "cancellation.hpp"
#include "resource_monitor.hpp"
#include "types.hpp"

namespace codepage::sandbox {

/**
 * @brief Artificial latency of one operation: base + U(0, jitter)
 */
struct Latency {
    std::chrono::milliseconds base{0};
    std::chrono::milliseconds jitter{0};
};

struct LatencyProfile {
    Latency query{std::chrono::milliseconds(50), std::chrono::milliseconds(100)};
    Latency create{std::chrono::milliseconds(100), std::chrono::milliseconds(200)};
    Latency update{std::chrono::milliseconds(80), std::chrono::milliseconds(150)};
    Latency remove{std::chrono::milliseconds(60), std::chrono::milliseconds(100)};
    Latency get{std::chrono::milliseconds(40), std::chrono::milliseconds(80)};
    Latency bulkPerRecord{std::chrono::milliseconds(50), std::chrono::milliseconds(0)};
    Latency bulkJitter{std::chrono::milliseconds(0), std::chrono::milliseconds(200)};
};

/**
 * @brief Canonical fixture tables shared by all runs
 *
 * Each run receives its own copy through snapshot(); writes made by a
 * script never reach the canonical tables.
 */
class MockApi {
public:
    MockApi();

    void setFixture(const std::string& table, json records);
    [[nodiscard]] std::optional<json> fixture(const std::string& table) const;
    [[nodiscard]] json fixtures() const;
    [[nodiscard]] json snapshot() const { return fixtures(); }

    void setLatencyProfile(const LatencyProfile& profile);
    [[nodiscard]] LatencyProfile latencyProfile() const;

    /**
     * @brief Multiplier applied to every latency, 0 disables waiting
     */
    void setLatencyScale(double scale);
    [[nodiscard]] double latencyScale() const;

    /**
     * @brief Default vehicles, options and discounts tables
     */
    [[nodiscard]] static json defaultFixtures();

private:
    mutable std::mutex mutex_;
    json tables_;
    LatencyProfile profile_;
    double latencyScale_{1.0};
};

/**
 * @brief The API as seen by one run
 *
 * Every operation is counted against the run's call ceiling before it
 * executes. A rejected call is logged to the run and throws
 * ResourceLimitException; an executed call appends one ApiCallRecord.
 * Latency waits end early when the run's token is cancelled.
 */
class MockApiSession {
public:
    MockApiSession(std::shared_ptr<ExecutionContext> context,
                   std::shared_ptr<ResourceMonitor> monitor,
                   std::shared_ptr<CancellationToken> token, json tables,
                   LatencyProfile profile, double latencyScale);

    /**
     * @param params {tableId, where?, top?}; where is an equality object or
     * a query string, a string mentioning Available keeps available rows
     */
    json query(const json& params);

    /**
     * @param params {tableId, fields}
     */
    json create(const json& params);

    /**
     * @param params {tableId, recordId, fields}
     */
    json update(const json& params);

    /**
     * @param params {tableId, recordId}
     */
    json remove(const json& params);

    /**
     * @param params {tableId, recordId}
     */
    json get(const json& params);

    /**
     * @param params {tableId, records: [...]}
     */
    json bulkCreate(const json& params);

    [[nodiscard]] const json& tables() const { return tables_; }

private:
    template <typename Op>
    json invoke(std::string_view method, const json& params,
                std::chrono::milliseconds latency, Op&& op);

    std::chrono::milliseconds draw(const Latency& latency);
    json& table(const json& params);
    int64_t nextId(const json& rows);

    std::shared_ptr<ExecutionContext> context_;
    std::shared_ptr<ResourceMonitor> monitor_;
    std::shared_ptr<CancellationToken> token_;
    json tables_;
    LatencyProfile profile_;
    double latencyScale_;
    std::mt19937 rng_;
};

/**
 * @brief Strip the "_table_id" suffix scripts use for table ids
 */
[[nodiscard]] std::string normalizeTableId(std::string tableId);

}  // namespace codepage::sandbox

#endif  // CODEPAGE_SCRIPT_SANDBOX_MOCK_API_HPP
