/*
 * test_logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Tests for LoggingManager

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/logging_manager.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace codepage::logging;

class LoggingManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& manager = LoggingManager::getInstance();
        if (manager.isInitialized()) {
            manager.shutdown();
        }
    }

    void TearDown() override {
        auto& manager = LoggingManager::getInstance();
        manager.unsubscribe("test");
        if (manager.isInitialized()) {
            manager.shutdown();
        }
    }

    LoggingConfig createTestConfig() {
        LoggingConfig config;
        config.default_level = spdlog::level::debug;
        config.ring_buffer_size = 16;
        return config;
    }
};

// ============================================================================
// Initialization Tests
// ============================================================================

TEST_F(LoggingManagerTest, SingletonInstance) {
    EXPECT_EQ(&LoggingManager::getInstance(), &LoggingManager::getInstance());
}

TEST_F(LoggingManagerTest, InitializeAndShutdown) {
    auto& manager = LoggingManager::getInstance();
    EXPECT_FALSE(manager.isInitialized());

    manager.initialize(createTestConfig());
    EXPECT_TRUE(manager.isInitialized());
    EXPECT_EQ(manager.getConfig().ring_buffer_size, 16u);

    manager.shutdown();
    EXPECT_FALSE(manager.isInitialized());
    EXPECT_EQ(manager.getConfig().default_level, spdlog::level::info);
}

// ============================================================================
// Logger Tests
// ============================================================================

TEST_F(LoggingManagerTest, SameNameReturnsSameLogger) {
    auto first = logger("sandbox");
    auto second = LoggingManager::getInstance().getLogger("sandbox");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_THAT(LoggingManager::getInstance().loggerNames(),
                ::testing::Contains("sandbox"));
}

TEST_F(LoggingManagerTest, LoggerCreatedBeforeInitializeUsesNewSinks) {
    auto& manager = LoggingManager::getInstance();
    auto early = logger("early");

    manager.initialize(createTestConfig());
    manager.clearLogBuffer();
    early->info("after initialize");

    auto recent = manager.getRecentLogs(10);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].logger_name, "early");
    EXPECT_EQ(recent[0].message, "after initialize");
}

TEST_F(LoggingManagerTest, SetLoggerLevel) {
    auto& manager = LoggingManager::getInstance();
    auto log = logger("levels");
    EXPECT_TRUE(manager.setLoggerLevel("levels", spdlog::level::err));
    EXPECT_EQ(log->level(), spdlog::level::err);
    EXPECT_FALSE(manager.setLoggerLevel("missing-logger", spdlog::level::err));
}

TEST_F(LoggingManagerTest, GlobalLevelAppliesToAllLoggers) {
    auto& manager = LoggingManager::getInstance();
    auto a = logger("a");
    auto b = logger("b");
    manager.setGlobalLevel(spdlog::level::warn);
    EXPECT_EQ(a->level(), spdlog::level::warn);
    EXPECT_EQ(b->level(), spdlog::level::warn);
    manager.setGlobalLevel(spdlog::level::info);
}

// ============================================================================
// Ring Buffer Tests
// ============================================================================

TEST_F(LoggingManagerTest, FilteredLogs) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(createTestConfig());
    manager.clearLogBuffer();

    logger("reporting")->info("report generated");
    logger("alerts")->warn("rule fired");
    logger("alerts")->debug("evaluated");

    auto warnings = manager.getLogsFiltered(spdlog::level::warn, std::nullopt);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].message, "rule fired");

    auto alerts = manager.getLogsFiltered(std::nullopt, "alerts");
    EXPECT_EQ(alerts.size(), 2u);
}

TEST_F(LoggingManagerTest, RingBufferKeepsMostRecent) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(createTestConfig());
    manager.clearLogBuffer();

    auto log = logger("ring");
    for (int i = 0; i < 40; ++i) {
        log->info("message {}", i);
    }
    auto recent = manager.getRecentLogs(0);
    ASSERT_EQ(recent.size(), 16u);
    EXPECT_EQ(recent.front().message, "message 24");
    EXPECT_EQ(recent.back().message, "message 39");
}

TEST_F(LoggingManagerTest, SubscribeReceivesEntries) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(createTestConfig());

    std::atomic<int> received{0};
    manager.subscribe("test", [&](const LogEntry& entry) {
        if (entry.logger_name == "subscribed") {
            received++;
        }
    });
    logger("subscribed")->info("one");
    logger("subscribed")->info("two");
    manager.unsubscribe("test");
    logger("subscribed")->info("three");

    EXPECT_EQ(received.load(), 2);
}

TEST_F(LoggingManagerTest, ConcurrentLoggerCreation) {
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<spdlog::logger>> loggers(8);
    for (size_t i = 0; i < loggers.size(); ++i) {
        threads.emplace_back([&, i] { loggers[i] = logger("shared"); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& log : loggers) {
        EXPECT_EQ(log.get(), loggers[0].get());
    }
}
