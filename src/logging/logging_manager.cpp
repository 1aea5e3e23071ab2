/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include "sinks/sink_factory.hpp"

namespace codepage::logging {

namespace {

auto defaultConfig() -> LoggingConfig {
    LoggingConfig config;
    SinkConfig console;
    console.name = "console";
    console.type = "console";
    config.sinks.push_back(console);
    return config;
}

}  // namespace

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::LoggingManager() : config_(defaultConfig()) {
    rebuildSinks();
}

void LoggingManager::initialize(const LoggingConfig& config) {
    size_t sinkCount = 0;
    {
        std::unique_lock lock(mutex_);
        config_ = config;
        rebuildSinks();
        for (auto& [name, log] : loggers_) {
            log->sinks() = sinks_;
            log->set_level(config_.default_level);
            log->set_pattern(config_.default_pattern);
        }
        initialized_ = true;
        sinkCount = sinks_.size();
    }
    getLogger("codepage")->info("Logging initialized with {} sinks",
                                sinkCount);
}

void LoggingManager::shutdown() {
    flush();
    std::unique_lock lock(mutex_);
    if (!initialized_) {
        return;
    }
    config_ = defaultConfig();
    rebuildSinks();
    for (auto& [name, log] : loggers_) {
        log->sinks() = sinks_;
        log->set_level(config_.default_level);
    }
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    {
        std::shared_lock lock(mutex_);
        if (auto it = loggers_.find(name); it != loggers_.end()) {
            return it->second;
        }
    }
    std::unique_lock lock(mutex_);
    if (auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }
    return createLogger(name);
}

auto LoggingManager::loggerNames() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(loggers_.size());
    for (const auto& [name, log] : loggers_) {
        names.push_back(name);
    }
    return names;
}

auto LoggingManager::setLoggerLevel(const std::string& name,
                                    spdlog::level::level_enum level) -> bool {
    std::unique_lock lock(mutex_);
    auto it = loggers_.find(name);
    if (it == loggers_.end()) {
        return false;
    }
    it->second->set_level(level);
    return true;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);
    config_.default_level = level;
    for (auto& [name, log] : loggers_) {
        log->set_level(level);
    }
}

auto LoggingManager::getRecentLogs(size_t count) const
    -> std::vector<LogEntry> {
    std::shared_lock lock(mutex_);
    return ring_buffer_sink_->getEntries(count);
}

auto LoggingManager::getLogsFiltered(
    std::optional<spdlog::level::level_enum> level,
    std::optional<std::string> logger, size_t limit) const
    -> std::vector<LogEntry> {
    std::shared_lock lock(mutex_);
    return ring_buffer_sink_->getEntriesFiltered(level, std::move(logger),
                                                 limit);
}

void LoggingManager::clearLogBuffer() {
    std::shared_lock lock(mutex_);
    ring_buffer_sink_->clear();
}

void LoggingManager::subscribe(const std::string& subscriber_id,
                               LogCallback callback) {
    std::shared_lock lock(mutex_);
    ring_buffer_sink_->addCallback(subscriber_id, std::move(callback));
}

void LoggingManager::unsubscribe(const std::string& subscriber_id) {
    std::shared_lock lock(mutex_);
    ring_buffer_sink_->removeCallback(subscriber_id);
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);
    for (const auto& [name, log] : loggers_) {
        log->flush();
    }
}

auto LoggingManager::getConfig() const -> LoggingConfig {
    std::shared_lock lock(mutex_);
    return config_;
}

void LoggingManager::rebuildSinks() {
    sinks_.clear();
    ring_buffer_sink_ =
        std::make_shared<RingBufferSink>(config_.ring_buffer_size);
    ring_buffer_sink_->set_level(spdlog::level::trace);
    sinks_.push_back(ring_buffer_sink_);

    for (const auto& sink_config : config_.sinks) {
        if (auto sink = SinkFactory::createSink(sink_config)) {
            sinks_.push_back(std::move(sink));
        }
    }
}

auto LoggingManager::createLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    auto log =
        std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    log->set_level(config_.default_level);
    log->set_pattern(config_.default_pattern);
    log->flush_on(spdlog::level::warn);
    loggers_[name] = log;
    return log;
}

auto logger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    return LoggingManager::getInstance().getLogger(name);
}

}  // namespace codepage::logging
