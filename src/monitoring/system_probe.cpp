/*
 * system_probe.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "system_probe.hpp"

#include <algorithm>

#include "script/sandbox/resource_monitor.hpp"

namespace codepage::monitoring {

using sandbox::ResourceMonitor;

ProcessSystemProbe::ProcessSystemProbe()
    : lastWall_(std::chrono::steady_clock::now()),
      lastCpu_(ResourceMonitor::getCpuTime()) {}

auto ProcessSystemProbe::sample() -> std::optional<SystemSample> {
    auto memory = ResourceMonitor::getMemoryUsage();
    if (!memory) {
        return std::nullopt;
    }

    std::lock_guard lock(mutex_);
    auto wall = std::chrono::steady_clock::now();
    auto cpu = ResourceMonitor::getCpuTime();
    auto wallDelta =
        std::chrono::duration_cast<std::chrono::microseconds>(wall - lastWall_);
    auto cpuDelta = cpu - lastCpu_;
    lastWall_ = wall;
    lastCpu_ = cpu;

    SystemSample sample;
    sample.memoryBytes = *memory;
    if (wallDelta.count() > 0) {
        sample.cpuPercent = std::clamp(
            static_cast<double>(cpuDelta.count()) /
                static_cast<double>(wallDelta.count()) * 100.0,
            0.0, 100.0);
    }
    return sample;
}

}  // namespace codepage::monitoring
