/*
 * test_mock_api.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_mock_api.cpp
 * @brief Tests for the fixture-backed mock API and its per-run sessions
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "exception/exception.hpp"
#include "script/sandbox/mock_api.hpp"

using namespace codepage::sandbox;
using ::testing::HasSubstr;

class MockApiSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.apiCallLimit = 10;
        monitor = std::make_shared<ResourceMonitor>();
        monitor->start(config);
        context = std::make_shared<ExecutionContext>(
            "test-1", "project", "current", config,
            std::chrono::system_clock::now());
        token = std::make_shared<CancellationToken>();
    }

    MockApiSession makeSession(double latencyScale = 0.0) {
        return MockApiSession(context, monitor, token, api.snapshot(),
                              api.latencyProfile(), latencyScale);
    }

    ExecutionConfig config;
    MockApi api;
    std::shared_ptr<ResourceMonitor> monitor;
    std::shared_ptr<ExecutionContext> context;
    std::shared_ptr<CancellationToken> token;
};

// ============================================================================
// Fixtures
// ============================================================================

TEST(MockApiTest, DefaultFixtures) {
    MockApi api;
    auto vehicles = api.fixture("vehicles");
    ASSERT_TRUE(vehicles.has_value());
    EXPECT_EQ(vehicles->size(), 4u);
    EXPECT_EQ(api.fixture("options")->size(), 4u);
    EXPECT_EQ(api.fixture("discounts")->size(), 3u);
    EXPECT_FALSE(api.fixture("customers").has_value());
}

TEST(MockApiTest, SetFixtureNormalizesTableId) {
    MockApi api;
    api.setFixture("customers_table_id", json::array({{{"id", 1}}}));
    ASSERT_TRUE(api.fixture("customers").has_value());
    EXPECT_EQ(api.fixture("customers_table_id")->size(), 1u);
    EXPECT_THROW(api.setFixture("customers", json::object()),
                 std::invalid_argument);
}

TEST(MockApiTest, NormalizeTableId) {
    EXPECT_EQ(normalizeTableId("vehicles_table_id"), "vehicles");
    EXPECT_EQ(normalizeTableId("vehicles"), "vehicles");
    EXPECT_EQ(normalizeTableId("_table_id"), "_table_id");
}

TEST(MockApiTest, LatencyScaleNeverNegative) {
    MockApi api;
    api.setLatencyScale(-3.0);
    EXPECT_DOUBLE_EQ(api.latencyScale(), 0.0);
}

// ============================================================================
// Operations
// ============================================================================

TEST_F(MockApiSessionTest, QueryWithEqualityFilter) {
    auto session = makeSession();
    auto response = session.query({{"tableId", "vehicles_table_id"},
                                   {"where", {{"make", "Honda"}}}});
    ASSERT_EQ(response["data"].size(), 1u);
    EXPECT_EQ(response["data"][0]["model"], "Accord");
    EXPECT_EQ(response["metadata"]["totalRecords"], 4);
    EXPECT_EQ(response["metadata"]["top"], 1);
}

TEST_F(MockApiSessionTest, QueryWithAvailabilityStringAndTop) {
    auto session = makeSession();
    auto available = session.query(
        {{"tableId", "vehicles"}, {"where", "status = 'Available'"}});
    EXPECT_EQ(available["data"].size(), 3u);

    auto top = session.query({{"tableId", "vehicles"}, {"top", 2}});
    EXPECT_EQ(top["data"].size(), 2u);
}

TEST_F(MockApiSessionTest, CreateAssignsNextId) {
    auto session = makeSession();
    auto created = session.create(
        {{"tableId", "vehicles"}, {"fields", {{"make", "Kia"}}}});
    EXPECT_EQ(created["id"], 5);
    EXPECT_TRUE(created.contains("createdDate"));
    EXPECT_EQ(session.tables()["vehicles"].size(), 5u);
}

TEST_F(MockApiSessionTest, CreateInEmptyTableUsesRandomId) {
    auto session = makeSession();
    auto created = session.create({{"tableId", "orders"}, {"fields", json::object()}});
    auto id = created["id"].get<int64_t>();
    EXPECT_GE(id, 1000);
    EXPECT_LE(id, 10999);
}

TEST_F(MockApiSessionTest, UpdateGetDelete) {
    auto session = makeSession();
    session.update({{"tableId", "vehicles"},
                    {"recordId", 2},
                    {"fields", {{"price", 30000}, {"id", 99}}}});
    auto fetched = session.get({{"tableId", "vehicles"}, {"recordId", 2}});
    EXPECT_EQ(fetched["fields"]["price"], 30000);
    EXPECT_EQ(fetched["fields"]["id"], 2);

    session.remove({{"tableId", "vehicles"}, {"recordId", 2}});
    auto missing = session.get({{"tableId", "vehicles"}, {"recordId", 2}});
    EXPECT_TRUE(missing["fields"].is_null());
}

TEST_F(MockApiSessionTest, StringIdsMatch) {
    auto session = makeSession();
    auto fetched = session.get({{"tableId", "options"}, {"recordId", "sunroof"}});
    EXPECT_EQ(fetched["fields"]["price"], 800);
}

TEST_F(MockApiSessionTest, BulkCreate) {
    auto session = makeSession();
    auto response = session.bulkCreate(
        {{"tableId", "vehicles"},
         {"records", json::array({{{"make", "A"}}, {{"make", "B"}}, 7})}});
    EXPECT_EQ(response["metadata"]["totalNumberOfRecordsProcessed"], 2);
    EXPECT_EQ(response["metadata"]["createdRecordIds"],
              json::array({5, 6}));
}

TEST_F(MockApiSessionTest, MissingParameterThrows) {
    auto session = makeSession();
    EXPECT_THROW(session.query(json::object()), std::invalid_argument);
    EXPECT_THROW(session.get({{"tableId", "vehicles"}}), std::invalid_argument);
}

TEST_F(MockApiSessionTest, WritesStayInSession) {
    auto session = makeSession();
    session.remove({{"tableId", "vehicles"}, {"recordId", 1}});
    EXPECT_EQ(session.tables()["vehicles"].size(), 3u);
    EXPECT_EQ(api.fixture("vehicles")->size(), 4u);
}

// ============================================================================
// Accounting
// ============================================================================

TEST_F(MockApiSessionTest, EachCallIsRecorded) {
    auto session = makeSession();
    session.query({{"tableId", "vehicles"}});
    session.get({{"tableId", "vehicles"}, {"recordId", 1}});

    auto calls = context->apiCalls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].method, "query");
    EXPECT_EQ(calls[1].method, "get");
    EXPECT_EQ(calls[1].params["recordId"], 1);
    EXPECT_TRUE(calls[1].response.contains("fields"));
}

TEST_F(MockApiSessionTest, CallPastCeilingIsRejected) {
    config.apiCallLimit = 1;
    monitor = std::make_shared<ResourceMonitor>();
    monitor->start(config);
    context = std::make_shared<ExecutionContext>(
        "test-2", "project", "current", config,
        std::chrono::system_clock::now());
    auto session = makeSession();

    session.query({{"tableId", "vehicles"}});
    try {
        session.query({{"tableId", "vehicles"}});
        FAIL() << "expected ResourceLimitException";
    } catch (const codepage::exception::ResourceLimitException& e) {
        EXPECT_EQ(e.kind(), "ApiCallLimitExceeded");
    }

    EXPECT_EQ(context->apiCalls().size(), 1u);
    auto logs = context->logs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_THAT(logs[0], HasSubstr("ERROR: API call limit exceeded (1)"));
    EXPECT_EQ(*monitor->violation(), LimitViolation::ApiCallLimitExceeded);
}

TEST_F(MockApiSessionTest, LatencyProfileIsApplied) {
    LatencyProfile profile;
    profile.get = {std::chrono::milliseconds(30), std::chrono::milliseconds(0)};
    api.setLatencyProfile(profile);
    EXPECT_EQ(api.latencyProfile().get.base, std::chrono::milliseconds(30));

    auto session = makeSession(1.0);
    session.get({{"tableId", "vehicles"}, {"recordId", 1}});
    auto calls = context->apiCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_GE(calls[0].duration, std::chrono::milliseconds(30));
}

TEST_F(MockApiSessionTest, CancelledTokenAbortsLatencyWait) {
    auto session = makeSession(1.0);
    token->cancel();
    monitor->flag(LimitViolation::TimeoutExceeded);
    try {
        session.query({{"tableId", "vehicles"}});
        FAIL() << "expected ResourceLimitException";
    } catch (const codepage::exception::ResourceLimitException& e) {
        EXPECT_EQ(e.kind(), "TimeoutExceeded");
    }
    EXPECT_TRUE(context->apiCalls().empty());
}
