/*
 * time_utils.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_UTILS_TIME_UTILS_HPP
#define CODEPAGE_UTILS_TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace codepage::utils {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Injectable wall clock
 */
using Clock = std::function<TimePoint()>;

[[nodiscard]] auto systemClock() -> Clock;

/**
 * @brief Format as ISO-8601 UTC with milliseconds, e.g.
 * 2024-05-01T12:30:00.250Z
 */
[[nodiscard]] auto toIsoString(TimePoint tp) -> std::string;

/**
 * @brief UTC hour bucket key, e.g. 2024-05-01T12
 */
[[nodiscard]] auto hourKey(TimePoint tp) -> std::string;

[[nodiscard]] auto toEpochMillis(TimePoint tp) -> int64_t;
[[nodiscard]] auto fromEpochMillis(int64_t ms) -> TimePoint;

[[nodiscard]] inline auto millisBetween(TimePoint from, TimePoint to)
    -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from)
        .count();
}

}  // namespace codepage::utils

#endif  // CODEPAGE_UTILS_TIME_UTILS_HPP
