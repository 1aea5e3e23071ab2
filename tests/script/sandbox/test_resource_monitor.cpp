/*
 * test_resource_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_resource_monitor.cpp
 * @brief Tests for the per-run ResourceMonitor and the process probes
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "script/sandbox/cancellation.hpp"
#include "script/sandbox/resource_monitor.hpp"

using namespace codepage::sandbox;
using namespace std::chrono_literals;

class ResourceMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.timeout = 50ms;
        config.memoryLimitBytes = 1000;
        config.apiCallLimit = 2;
        monitor.start(config);
    }

    ExecutionConfig config;
    ResourceMonitor monitor;
};

// =============================================================================
// Limit Tests
// =============================================================================

TEST_F(ResourceMonitorTest, MemoryUnderLimit) {
    EXPECT_TRUE(monitor.sampleMemory(400));
    EXPECT_TRUE(monitor.sampleMemory(900));
    EXPECT_TRUE(monitor.sampleMemory(300));
    EXPECT_EQ(monitor.peakMemory(), 900u);
    EXPECT_EQ(monitor.usage().memoryUsage, 300u);
    EXPECT_FALSE(monitor.violation().has_value());
}

TEST_F(ResourceMonitorTest, MemoryOverLimitFlags) {
    EXPECT_FALSE(monitor.sampleMemory(1001));
    ASSERT_TRUE(monitor.violation().has_value());
    EXPECT_EQ(*monitor.violation(), LimitViolation::MemoryExceeded);
}

TEST_F(ResourceMonitorTest, ApiCallCeiling) {
    EXPECT_TRUE(monitor.recordApiCall());
    EXPECT_TRUE(monitor.recordApiCall());
    EXPECT_FALSE(monitor.recordApiCall());
    EXPECT_FALSE(monitor.recordApiCall());
    EXPECT_EQ(monitor.usage().apiCallCount, 2u);
    EXPECT_EQ(*monitor.violation(), LimitViolation::ApiCallLimitExceeded);
}

TEST_F(ResourceMonitorTest, FirstViolationWins) {
    EXPECT_TRUE(monitor.flag(LimitViolation::TimeoutExceeded));
    EXPECT_FALSE(monitor.flag(LimitViolation::Cancelled));
    EXPECT_FALSE(monitor.sampleMemory(5000));
    EXPECT_EQ(*monitor.violation(), LimitViolation::TimeoutExceeded);
}

TEST_F(ResourceMonitorTest, Deadline) {
    EXPECT_FALSE(monitor.isExpired());
    std::this_thread::sleep_for(60ms);
    EXPECT_TRUE(monitor.isExpired());
    EXPECT_GE(monitor.elapsed().count(), 50);
}

TEST_F(ResourceMonitorTest, ConcurrentApiCallsNeverPassCeiling) {
    ExecutionConfig wide;
    wide.apiCallLimit = 100;
    ResourceMonitor shared;
    shared.start(wide);

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                if (shared.recordApiCall()) {
                    accepted++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(accepted.load(), 100);
    EXPECT_EQ(shared.usage().apiCallCount, 100u);
}

// =============================================================================
// Process Probe Tests
// =============================================================================

TEST(ResourceMonitorProbeTest, CurrentProcessMemory) {
    auto memory = ResourceMonitor::getMemoryUsage();
    ASSERT_TRUE(memory.has_value());
    EXPECT_GT(*memory, 0u);

    ProcessMemoryProbe probe;
    EXPECT_TRUE(probe.sample().has_value());
}

TEST(ResourceMonitorProbeTest, NonexistentProcess) {
    EXPECT_FALSE(ResourceMonitor::getMemoryUsage(999999999).has_value());
    EXPECT_FALSE(ResourceMonitor::getPeakMemoryUsage(999999999).has_value());
}

TEST(ResourceMonitorProbeTest, CpuTimeIsMonotonic) {
    auto before = ResourceMonitor::getCpuTime();
    volatile double sink = 0;
    for (int i = 0; i < 2000000; ++i) {
        sink = sink + i * 0.5;
    }
    EXPECT_GE(ResourceMonitor::getCpuTime(), before);
}

// =============================================================================
// Cancellation Token Tests
// =============================================================================

TEST(CancellationTokenTest, SleepCompletes) {
    CancellationToken token;
    EXPECT_TRUE(token.sleepFor(5ms));
    EXPECT_FALSE(token.isCancelled());
}

TEST(CancellationTokenTest, CancelCutsSleepShort) {
    CancellationToken token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.sleepFor(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    canceller.join();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_FALSE(token.sleepFor(1ms));
}
