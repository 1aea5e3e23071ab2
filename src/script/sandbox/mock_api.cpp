/*
 * mock_api.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mock_api.hpp"

#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "exception/exception.hpp"
#include "logging/logging_manager.hpp"

namespace codepage::sandbox {

namespace {

constexpr std::string_view kTableSuffix = "_table_id";

auto requireField(const json& params, const char* key) -> const json& {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        throw std::invalid_argument(fmt::format("missing '{}' parameter", key));
    }
    return *it;
}

auto sameId(const json& row, const json& id) -> bool {
    auto it = row.find("id");
    if (it == row.end()) {
        return false;
    }
    if (it->is_number() && id.is_number()) {
        return it->get<double>() == id.get<double>();
    }
    return *it == id;
}

auto matches(const json& row, const json& where) -> bool {
    if (where.is_object()) {
        for (const auto& [key, expected] : where.items()) {
            auto it = row.find(key);
            if (it == row.end() || *it != expected) {
                return false;
            }
        }
        return true;
    }
    if (where.is_string() &&
        where.get<std::string>().find("Available") != std::string::npos) {
        auto it = row.find("status");
        return it != row.end() && *it == "Available";
    }
    return true;
}

auto nowIso() -> std::string {
    return utils::toIsoString(std::chrono::system_clock::now());
}

}  // namespace

std::string normalizeTableId(std::string tableId) {
    if (tableId.size() > kTableSuffix.size() &&
        tableId.ends_with(kTableSuffix)) {
        tableId.resize(tableId.size() - kTableSuffix.size());
    }
    return tableId;
}

// ============================================================================
// MockApi
// ============================================================================

MockApi::MockApi() : tables_(defaultFixtures()) {}

json MockApi::defaultFixtures() {
    return {
        {"vehicles",
         json::array(
             {{{"id", 1}, {"make", "Toyota"}, {"model", "Camry"}, {"price", 28000}, {"status", "Available"}},
              {{"id", 2}, {"make", "Honda"}, {"model", "Accord"}, {"price", 32000}, {"status", "Available"}},
              {{"id", 3}, {"make", "Ford"}, {"model", "F-150"}, {"price", 45000}, {"status", "Available"}},
              {{"id", 4}, {"make", "BMW"}, {"model", "X5"}, {"price", 65000}, {"status", "Sold"}}})},
        {"options",
         json::array(
             {{{"id", "premium"}, {"name", "Premium Package"}, {"price", 2500}},
              {{"id", "navigation"}, {"name", "Navigation System"}, {"price", 1200}},
              {{"id", "sunroof"}, {"name", "Sunroof"}, {"price", 800}},
              {{"id", "leather"}, {"name", "Leather Seats"}, {"price", 1500}}})},
        {"discounts",
         json::array(
             {{{"id", "loyalty"}, {"name", "Loyalty Discount"}, {"amount", 1000}},
              {{"id", "trade"}, {"name", "Trade-in Credit"}, {"amount", 3000}},
              {{"id", "military"}, {"name", "Military Discount"}, {"amount", 500}}})}};
}

void MockApi::setFixture(const std::string& table, json records) {
    if (!records.is_array()) {
        throw std::invalid_argument("fixture records must be an array");
    }
    std::lock_guard lock(mutex_);
    tables_[normalizeTableId(table)] = std::move(records);
    logging::logger("sandbox")->info("Mock data updated: {}", table);
}

std::optional<json> MockApi::fixture(const std::string& table) const {
    std::lock_guard lock(mutex_);
    auto it = tables_.find(normalizeTableId(table));
    if (it == tables_.end()) {
        return std::nullopt;
    }
    return *it;
}

json MockApi::fixtures() const {
    std::lock_guard lock(mutex_);
    return tables_;
}

void MockApi::setLatencyProfile(const LatencyProfile& profile) {
    std::lock_guard lock(mutex_);
    profile_ = profile;
}

LatencyProfile MockApi::latencyProfile() const {
    std::lock_guard lock(mutex_);
    return profile_;
}

void MockApi::setLatencyScale(double scale) {
    std::lock_guard lock(mutex_);
    latencyScale_ = scale < 0.0 ? 0.0 : scale;
}

double MockApi::latencyScale() const {
    std::lock_guard lock(mutex_);
    return latencyScale_;
}

// ============================================================================
// MockApiSession
// ============================================================================

MockApiSession::MockApiSession(std::shared_ptr<ExecutionContext> context,
                               std::shared_ptr<ResourceMonitor> monitor,
                               std::shared_ptr<CancellationToken> token,
                               json tables, LatencyProfile profile,
                               double latencyScale)
    : context_(std::move(context)),
      monitor_(std::move(monitor)),
      token_(std::move(token)),
      tables_(std::move(tables)),
      profile_(profile),
      latencyScale_(latencyScale),
      rng_(std::random_device{}()) {}

std::chrono::milliseconds MockApiSession::draw(const Latency& latency) {
    std::uniform_int_distribution<int64_t> jitter(0, latency.jitter.count());
    return latency.base + std::chrono::milliseconds(jitter(rng_));
}

template <typename Op>
json MockApiSession::invoke(std::string_view method, const json& params,
                            std::chrono::milliseconds latency, Op&& op) {
    if (!monitor_->recordApiCall()) {
        auto message =
            fmt::format("API call limit exceeded ({}): {} was not executed",
                        context_->config().apiCallLimit, method);
        context_->addLog(formatLogLine(std::chrono::system_clock::now(),
                                       "ERROR", message));
        throw exception::ResourceLimitException(
            std::string(limitViolationToString(
                LimitViolation::ApiCallLimitExceeded)),
            message);
    }

    auto timestamp = std::chrono::system_clock::now();
    auto start = std::chrono::steady_clock::now();

    auto scaled = std::chrono::milliseconds(static_cast<int64_t>(
        static_cast<double>(latency.count()) * latencyScale_));
    if (scaled.count() > 0 && !token_->sleepFor(scaled)) {
        auto kind = monitor_->violation().value_or(LimitViolation::Cancelled);
        throw exception::ResourceLimitException(
            std::string(limitViolationToString(kind)),
            fmt::format("{} aborted: run cancelled", method));
    }

    json response = op();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    context_->addApiCall(
        {std::string(method), params, response, timestamp, duration});
    return response;
}

json& MockApiSession::table(const json& params) {
    auto name = normalizeTableId(requireField(params, "tableId").get<std::string>());
    if (!tables_.contains(name)) {
        tables_[name] = json::array();
    }
    return tables_[name];
}

int64_t MockApiSession::nextId(const json& rows) {
    int64_t maxId = 0;
    for (const auto& row : rows) {
        auto it = row.find("id");
        if (it != row.end() && it->is_number_integer()) {
            maxId = std::max(maxId, it->get<int64_t>());
        }
    }
    if (maxId > 0) {
        return maxId + 1;
    }
    std::uniform_int_distribution<int64_t> dist(1000, 10999);
    return dist(rng_);
}

json MockApiSession::query(const json& params) {
    return invoke("query", params, draw(profile_.query), [&] {
        const json& rows = table(params);
        json where = params.value("where", json());
        size_t top = params.value("top", rows.size());

        json data = json::array();
        for (const auto& row : rows) {
            if (data.size() >= top) {
                break;
            }
            if (where.is_null() || matches(row, where)) {
                data.push_back(row);
            }
        }
        size_t returned = data.size();
        return json{{"data", std::move(data)},
                    {"metadata",
                     {{"totalRecords", rows.size()},
                      {"skip", 0},
                      {"top", returned}}}};
    });
}

json MockApiSession::create(const json& params) {
    return invoke("create", params, draw(profile_.create), [&] {
        json& rows = table(params);
        json record = params.value("fields", json::object());
        if (!record.is_object()) {
            throw std::invalid_argument("'fields' must be an object");
        }
        auto id = nextId(rows);
        record["id"] = id;
        rows.push_back(record);
        return json{{"id", id}, {"createdDate", nowIso()}};
    });
}

json MockApiSession::update(const json& params) {
    return invoke("update", params, draw(profile_.update), [&] {
        json& rows = table(params);
        const json& id = requireField(params, "recordId");
        json fields = params.value("fields", json::object());
        for (auto& row : rows) {
            if (sameId(row, id) && fields.is_object()) {
                for (const auto& [key, value] : fields.items()) {
                    if (key != "id") {
                        row[key] = value;
                    }
                }
            }
        }
        return json{{"id", id}, {"updatedDate", nowIso()}};
    });
}

json MockApiSession::remove(const json& params) {
    return invoke("delete", params, draw(profile_.remove), [&] {
        json& rows = table(params);
        const json& id = requireField(params, "recordId");
        json kept = json::array();
        for (const auto& row : rows) {
            if (!sameId(row, id)) {
                kept.push_back(row);
            }
        }
        rows = std::move(kept);
        return json{{"id", id}, {"deletedDate", nowIso()}};
    });
}

json MockApiSession::get(const json& params) {
    return invoke("get", params, draw(profile_.get), [&] {
        const json& rows = table(params);
        const json& id = requireField(params, "recordId");
        for (const auto& row : rows) {
            if (sameId(row, id)) {
                return json{{"id", id}, {"fields", row}};
            }
        }
        return json{{"id", id}, {"fields", nullptr}};
    });
}

json MockApiSession::bulkCreate(const json& params) {
    json records = params.value("records", json::array());
    size_t count = records.is_array() && !records.empty() ? records.size() : 1;
    auto latency = draw(profile_.bulkPerRecord) * static_cast<int64_t>(count) +
                   draw(profile_.bulkJitter);

    return invoke("bulkCreate", params, latency, [&] {
        json& rows = table(params);
        json ids = json::array();
        if (records.is_array()) {
            for (auto record : records) {
                if (!record.is_object()) {
                    continue;
                }
                auto id = nextId(rows);
                record["id"] = id;
                rows.push_back(record);
                ids.push_back(id);
            }
        }
        return json{{"metadata",
                     {{"createdRecordIds", ids},
                      {"totalNumberOfRecordsProcessed", ids.size()}}}};
    });
}

}  // namespace codepage::sandbox
