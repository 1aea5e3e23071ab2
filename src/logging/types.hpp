/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Logging system type definitions

**************************************************/

#ifndef CODEPAGE_LOGGING_TYPES_HPP
#define CODEPAGE_LOGGING_TYPES_HPP

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace codepage::logging {

/**
 * @brief Log entry captured by the in-memory ring buffer
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    spdlog::level::level_enum level{spdlog::level::info};
    std::string logger_name;
    std::string message;
    std::string thread_id;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Sink configuration structure
 */
struct SinkConfig {
    std::string name;
    std::string type;  // "console", "file", "rotating_file"
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    // File sink options
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{5};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief Logging manager configuration
 *
 * Every component logger ("sandbox", "reporting", "monitoring", "alerts",
 * "storage") shares the configured sinks plus the ring buffer.
 */
struct LoggingConfig {
    spdlog::level::level_enum default_level{spdlog::level::info};
    std::string default_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    size_t ring_buffer_size{1000};
    std::vector<SinkConfig> sinks;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;
};

[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace codepage::logging

#endif  // CODEPAGE_LOGGING_TYPES_HPP
