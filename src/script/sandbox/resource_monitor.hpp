/*
 * resource_monitor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_SCRIPT_SANDBOX_RESOURCE_MONITOR_HPP
#define CODEPAGE_SCRIPT_SANDBOX_RESOURCE_MONITOR_HPP

#include "types.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>

namespace codepage::sandbox {

/**
 * @brief Source of memory samples for a running script
 */
class MemoryProbe {
public:
    virtual ~MemoryProbe() = default;
    [[nodiscard]] virtual std::optional<size_t> sample() = 0;
};

/**
 * @brief Samples the resident set of the current process
 *
 * The embedded interpreter shares the host process, so concurrent runs see
 * each other's allocations.
 */
class ProcessMemoryProbe : public MemoryProbe {
public:
    [[nodiscard]] std::optional<size_t> sample() override;
};

/**
 * @brief Enforces the time, memory and API-call ceilings of one run
 *
 * The first limit crossed is recorded as the run's violation and never
 * replaced. All methods are thread-safe.
 */
class ResourceMonitor {
public:
    using SteadyClock = std::chrono::steady_clock;

    ResourceMonitor() = default;

    /**
     * @brief Arm the monitor; the deadline is now + config.timeout
     */
    void start(const ExecutionConfig& config);

    /**
     * @brief Record a memory sample
     * @return false if the sample crossed the memory limit
     */
    bool sampleMemory(size_t bytes);

    /**
     * @brief Account for one API call before it executes
     * @return false if the call would pass the ceiling; the call must not run
     */
    bool recordApiCall();

    [[nodiscard]] std::chrono::milliseconds elapsed() const;
    [[nodiscard]] bool isExpired() const;
    [[nodiscard]] SteadyClock::time_point deadline() const { return deadline_; }

    /**
     * @brief Record a violation if none was recorded yet
     * @return true if this call set the violation
     */
    bool flag(LimitViolation violation);

    [[nodiscard]] std::optional<LimitViolation> violation() const;

    [[nodiscard]] ResourceUsage usage() const;
    [[nodiscard]] size_t peakMemory() const { return peakMemory_.load(); }

    // ========================================================================
    // Process probes
    // ========================================================================

    /**
     * @brief Current resident memory of a process (0 = self)
     */
    [[nodiscard]] static std::optional<size_t> getMemoryUsage(int processId = 0);

    /**
     * @brief Peak virtual memory of a process (0 = self)
     */
    [[nodiscard]] static std::optional<size_t> getPeakMemoryUsage(
        int processId = 0);

    /**
     * @brief User + system CPU time consumed by this process
     */
    [[nodiscard]] static std::chrono::microseconds getCpuTime();

private:
    ExecutionConfig config_;
    SteadyClock::time_point startedAt_{};
    SteadyClock::time_point deadline_{};

    std::atomic<size_t> lastMemory_{0};
    std::atomic<size_t> peakMemory_{0};
    std::atomic<size_t> apiCalls_{0};

    mutable std::mutex mutex_;
    std::optional<LimitViolation> violation_;
};

}  // namespace codepage::sandbox

#endif  // CODEPAGE_SCRIPT_SANDBOX_RESOURCE_MONITOR_HPP
