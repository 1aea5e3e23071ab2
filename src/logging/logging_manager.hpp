/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Central manager for the component loggers

**************************************************/

#ifndef CODEPAGE_LOGGING_LOGGING_MANAGER_HPP
#define CODEPAGE_LOGGING_LOGGING_MANAGER_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "sinks/ring_buffer_sink.hpp"
#include "types.hpp"

namespace codepage::logging {

/**
 * @brief Owns the shared sinks and the named component loggers
 *
 * Every logger handed out shares the same sink set: the configured sinks
 * plus an in-memory ring buffer holding the most recent entries. Loggers
 * obtained before initialize() keep working and pick up the new sinks.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    /**
     * @brief Replace sinks and levels with the given configuration
     */
    void initialize(const LoggingConfig& config);

    /**
     * @brief Flush every logger and fall back to the default configuration
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Get or create a named logger
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    [[nodiscard]] auto loggerNames() const -> std::vector<std::string>;

    auto setLoggerLevel(const std::string& name,
                        spdlog::level::level_enum level) -> bool;
    void setGlobalLevel(spdlog::level::level_enum level);

    [[nodiscard]] auto getRecentLogs(size_t count = 100) const
        -> std::vector<LogEntry>;
    [[nodiscard]] auto getLogsFiltered(
        std::optional<spdlog::level::level_enum> level,
        std::optional<std::string> logger, size_t limit = 100) const
        -> std::vector<LogEntry>;
    void clearLogBuffer();

    void subscribe(const std::string& subscriber_id, LogCallback callback);
    void unsubscribe(const std::string& subscriber_id);

    void flush();

    [[nodiscard]] auto getConfig() const -> LoggingConfig;

private:
    LoggingManager();

    void rebuildSinks();
    auto createLogger(const std::string& name)
        -> std::shared_ptr<spdlog::logger>;

    mutable std::shared_mutex mutex_;
    bool initialized_{false};
    LoggingConfig config_;
    std::shared_ptr<RingBufferSink> ring_buffer_sink_;
    std::vector<spdlog::sink_ptr> sinks_;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
};

/**
 * @brief Shorthand for LoggingManager::getInstance().getLogger(name)
 */
auto logger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

}  // namespace codepage::logging

#endif  // CODEPAGE_LOGGING_LOGGING_MANAGER_HPP
