/*
 * ring_buffer_sink.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: In-memory sink keeping the most recent log entries

**************************************************/

#ifndef CODEPAGE_LOGGING_SINKS_RING_BUFFER_SINK_HPP
#define CODEPAGE_LOGGING_SINKS_RING_BUFFER_SINK_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/details/log_msg.h>
#include <spdlog/sinks/base_sink.h>

#include "../types.hpp"

namespace codepage::logging {

using LogCallback = std::function<void(const LogEntry&)>;

/**
 * @brief Fixed-capacity circular buffer of log entries
 *
 * Subscribers are notified synchronously for each entry. A subscriber that
 * throws is counted in failedCallbacks() and does not affect the others.
 */
template <typename Mutex>
class RingBufferSinkMt : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit RingBufferSinkMt(size_t max_items);

    /**
     * @brief Most recent entries, oldest first
     * @param count Number of entries to retrieve (0 = all)
     */
    [[nodiscard]] auto getEntries(size_t count = 0) const
        -> std::vector<LogEntry>;

    /**
     * @brief Entries of at least the given level whose logger name contains
     * the given substring
     */
    [[nodiscard]] auto getEntriesFiltered(
        std::optional<spdlog::level::level_enum> level_filter,
        std::optional<std::string> logger_filter, size_t max_count = 100) const
        -> std::vector<LogEntry>;

    void clear();

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto capacity() const -> size_t { return max_items_; }

    void addCallback(const std::string& id, LogCallback callback);
    void removeCallback(const std::string& id);

    [[nodiscard]] auto failedCallbacks() const -> size_t {
        return failed_callbacks_.load();
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override;
    void flush_() override {}

private:
    template <typename Pred>
    auto collect(Pred&& pred, size_t limit) const -> std::vector<LogEntry>;

    size_t max_items_;
    std::vector<LogEntry> buffer_;
    size_t head_{0};
    size_t count_{0};
    mutable std::mutex buffer_mutex_;

    std::unordered_map<std::string, LogCallback> callbacks_;
    mutable std::mutex callback_mutex_;
    std::atomic<size_t> failed_callbacks_{0};
};

using RingBufferSink = RingBufferSinkMt<std::mutex>;

}  // namespace codepage::logging

#endif  // CODEPAGE_LOGGING_SINKS_RING_BUFFER_SINK_HPP
