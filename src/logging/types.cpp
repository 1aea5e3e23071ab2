/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include "utils/time_utils.hpp"

namespace codepage::logging {

auto LogEntry::toJson() const -> nlohmann::json {
    return {{"timestamp", utils::toIsoString(timestamp)},
            {"level", levelToString(level)},
            {"logger", logger_name},
            {"message", message},
            {"thread_id", thread_id}};
}

// ============================================================================
// SinkConfig Implementation
// ============================================================================

auto SinkConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"name", name},
                        {"type", type},
                        {"level", levelToString(level)},
                        {"pattern", pattern}};

    if (type == "file" || type == "rotating_file") {
        j["file_path"] = file_path;
    }
    if (type == "rotating_file") {
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
    }
    return j;
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> SinkConfig {
    SinkConfig config;
    config.name = j.value("name", "");
    config.type = j.value("type", "console");
    config.level = levelFromString(j.value("level", "trace"));
    config.pattern = j.value("pattern", "");
    config.file_path = j.value("file_path", "");
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    return config;
}

// ============================================================================
// LoggingConfig Implementation
// ============================================================================

auto LoggingConfig::toJson() const -> nlohmann::json {
    nlohmann::json sinks_json = nlohmann::json::array();
    for (const auto& sink : sinks) {
        sinks_json.push_back(sink.toJson());
    }

    return {{"default_level", levelToString(default_level)},
            {"default_pattern", default_pattern},
            {"ring_buffer_size", ring_buffer_size},
            {"sinks", sinks_json}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.default_level = levelFromString(j.value("default_level", "info"));
    config.default_pattern =
        j.value("default_pattern", config.default_pattern);
    config.ring_buffer_size =
        j.value("ring_buffer_size", config.ring_buffer_size);

    if (j.contains("sinks") && j["sinks"].is_array()) {
        for (const auto& sink_json : j["sinks"]) {
            config.sinks.push_back(SinkConfig::fromJson(sink_json));
        }
    }
    return config;
}

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "critical" || level == "fatal")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto sv = spdlog::level::to_string_view(level);
    return std::string(sv.data(), sv.size());
}

}  // namespace codepage::logging
