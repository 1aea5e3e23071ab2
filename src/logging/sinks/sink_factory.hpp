/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Factory for creating spdlog sinks from configuration

**************************************************/

#ifndef CODEPAGE_LOGGING_SINKS_SINK_FACTORY_HPP
#define CODEPAGE_LOGGING_SINKS_SINK_FACTORY_HPP

#include <string>

#include <spdlog/spdlog.h>

#include "../types.hpp"

namespace codepage::logging {

/**
 * @brief Creates the sinks named in a LoggingConfig
 *
 * Console output goes to stderr so that stdout stays reserved for the JSON
 * emitted by the runner.
 */
class SinkFactory {
public:
    /**
     * @brief Create a sink from configuration
     * @return Created sink, or nullptr for an unknown type or an unusable path
     */
    [[nodiscard]] static auto createSink(const SinkConfig& config)
        -> spdlog::sink_ptr;

    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

    [[nodiscard]] static auto createFileSink(
        const std::string& file_path,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

    [[nodiscard]] static auto createRotatingFileSink(
        const std::string& file_path, size_t max_size, size_t max_files,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

private:
    static auto configure(spdlog::sink_ptr sink,
                          spdlog::level::level_enum level,
                          const std::string& pattern) -> spdlog::sink_ptr;
    static void ensureDirectoryExists(const std::string& file_path);
};

}  // namespace codepage::logging

#endif  // CODEPAGE_LOGGING_SINKS_SINK_FACTORY_HPP
