/*
 * resource_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_monitor.hpp"

#include <sys/resource.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <string>

namespace codepage::sandbox {

namespace {

std::string procPath(int processId, const char* entry) {
    if (processId <= 0) {
        return std::string("/proc/self/") + entry;
    }
    return "/proc/" + std::to_string(processId) + "/" + entry;
}

}  // namespace

std::optional<size_t> ProcessMemoryProbe::sample() {
    return ResourceMonitor::getMemoryUsage();
}

void ResourceMonitor::start(const ExecutionConfig& config) {
    config_ = config;
    startedAt_ = SteadyClock::now();
    deadline_ = startedAt_ + config.timeout;
}

bool ResourceMonitor::sampleMemory(size_t bytes) {
    lastMemory_.store(bytes);
    size_t peak = peakMemory_.load();
    while (bytes > peak && !peakMemory_.compare_exchange_weak(peak, bytes)) {
    }
    if (bytes > config_.memoryLimitBytes) {
        flag(LimitViolation::MemoryExceeded);
        return false;
    }
    return true;
}

bool ResourceMonitor::recordApiCall() {
    size_t current = apiCalls_.load();
    do {
        if (current >= config_.apiCallLimit) {
            flag(LimitViolation::ApiCallLimitExceeded);
            return false;
        }
    } while (!apiCalls_.compare_exchange_weak(current, current + 1));
    return true;
}

std::chrono::milliseconds ResourceMonitor::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - startedAt_);
}

bool ResourceMonitor::isExpired() const {
    return SteadyClock::now() >= deadline_;
}

bool ResourceMonitor::flag(LimitViolation violation) {
    std::lock_guard lock(mutex_);
    if (violation_) {
        return false;
    }
    violation_ = violation;
    return true;
}

std::optional<LimitViolation> ResourceMonitor::violation() const {
    std::lock_guard lock(mutex_);
    return violation_;
}

ResourceUsage ResourceMonitor::usage() const {
    return {lastMemory_.load(), apiCalls_.load(), elapsed().count()};
}

std::optional<size_t> ResourceMonitor::getMemoryUsage(int processId) {
    std::ifstream statm(procPath(processId, "statm"));
    size_t size = 0;
    size_t resident = 0;
    if (statm >> size >> resident) {
        return resident * static_cast<size_t>(sysconf(_SC_PAGESIZE));
    }
    return std::nullopt;
}

std::optional<size_t> ResourceMonitor::getPeakMemoryUsage(int processId) {
    std::ifstream status(procPath(processId, "status"));
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 6, "VmPeak") == 0) {
            size_t value = 0;
            if (std::sscanf(line.c_str(), "VmPeak: %zu kB", &value) == 1) {
                return value * 1024;
            }
        }
    }
    return std::nullopt;
}

std::chrono::microseconds ResourceMonitor::getCpuTime() {
    rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return std::chrono::microseconds(0);
    }
    auto toMicros = [](const timeval& tv) {
        return std::chrono::seconds(tv.tv_sec) +
               std::chrono::microseconds(tv.tv_usec);
    };
    return toMicros(usage.ru_utime) + toMicros(usage.ru_stime);
}

}  // namespace codepage::sandbox
