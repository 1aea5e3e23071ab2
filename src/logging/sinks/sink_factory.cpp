/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace codepage::logging {

auto SinkFactory::createSink(const SinkConfig& config) -> spdlog::sink_ptr {
    try {
        if (config.type == "console" || config.type == "stderr") {
            return createConsoleSink(config.level, config.pattern);
        }
        if (config.type == "file") {
            return createFileSink(config.file_path, config.level,
                                  config.pattern);
        }
        if (config.type == "rotating_file") {
            return createRotatingFileSink(config.file_path,
                                          config.max_file_size,
                                          config.max_files, config.level,
                                          config.pattern);
        }
        spdlog::warn("Unknown sink type: {}", config.type);
        return nullptr;
    } catch (const std::exception& e) {
        spdlog::error("Failed to create sink '{}': {}", config.name, e.what());
        return nullptr;
    }
}

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern)
    -> spdlog::sink_ptr {
    return configure(std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                     level, pattern);
}

auto SinkFactory::createFileSink(const std::string& file_path,
                                 spdlog::level::level_enum level,
                                 const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    return configure(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false),
        level, pattern);
}

auto SinkFactory::createRotatingFileSink(const std::string& file_path,
                                         size_t max_size, size_t max_files,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    return configure(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                         file_path, max_size, max_files),
                     level, pattern);
}

auto SinkFactory::configure(spdlog::sink_ptr sink,
                            spdlog::level::level_enum level,
                            const std::string& pattern) -> spdlog::sink_ptr {
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

void SinkFactory::ensureDirectoryExists(const std::string& file_path) {
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

}  // namespace codepage::logging
