/*
 * system_probe.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_MONITORING_SYSTEM_PROBE_HPP
#define CODEPAGE_MONITORING_SYSTEM_PROBE_HPP

#include <chrono>
#include <mutex>
#include <optional>

namespace codepage::monitoring {

struct SystemSample {
    double cpuPercent{0};
    size_t memoryBytes{0};
};

class SystemProbe {
public:
    virtual ~SystemProbe() = default;
    [[nodiscard]] virtual auto sample() -> std::optional<SystemSample> = 0;
};

/**
 * @brief CPU share of this process since the previous sample (capped at
 * 100) and its resident memory
 */
class ProcessSystemProbe : public SystemProbe {
public:
    ProcessSystemProbe();
    [[nodiscard]] auto sample() -> std::optional<SystemSample> override;

private:
    std::mutex mutex_;
    std::chrono::steady_clock::time_point lastWall_;
    std::chrono::microseconds lastCpu_{0};
};

}  // namespace codepage::monitoring

#endif  // CODEPAGE_MONITORING_SYSTEM_PROBE_HPP
