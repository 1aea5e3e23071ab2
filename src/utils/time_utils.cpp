/*
 * time_utils.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "time_utils.hpp"

#include <ctime>

#include <spdlog/fmt/fmt.h>

namespace codepage::utils {

namespace {

auto toUtc(TimePoint tp) -> std::tm {
    auto seconds = std::chrono::system_clock::to_time_t(
        std::chrono::time_point_cast<std::chrono::seconds>(tp));
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    return tm;
}

}  // namespace

auto systemClock() -> Clock {
    return [] { return std::chrono::system_clock::now(); };
}

auto toIsoString(TimePoint tp) -> std::string {
    auto floored = std::chrono::floor<std::chrono::seconds>(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp - floored)
            .count();
    std::tm tm = toUtc(floored);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

auto hourKey(TimePoint tp) -> std::string {
    std::tm tm = toUtc(std::chrono::floor<std::chrono::seconds>(tp));
    return fmt::format("{:04}-{:02}-{:02}T{:02}", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);
}

auto toEpochMillis(TimePoint tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

auto fromEpochMillis(int64_t ms) -> TimePoint {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(ms)));
}

}  // namespace codepage::utils
