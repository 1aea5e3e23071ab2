/*
 * ring_buffer_sink.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "ring_buffer_sink.hpp"

#include <sstream>

namespace codepage::logging {

template <typename Mutex>
RingBufferSinkMt<Mutex>::RingBufferSinkMt(size_t max_items)
    : max_items_(max_items == 0 ? 1 : max_items) {
    buffer_.resize(max_items_);
}

template <typename Mutex>
void RingBufferSinkMt<Mutex>::sink_it_(const spdlog::details::log_msg& msg) {
    LogEntry entry;
    entry.timestamp = msg.time;
    entry.level = msg.level;
    entry.logger_name =
        std::string(msg.logger_name.data(), msg.logger_name.size());
    entry.message = std::string(msg.payload.data(), msg.payload.size());

    std::ostringstream oss;
    oss << msg.thread_id;
    entry.thread_id = oss.str();

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        buffer_[head_] = entry;
        head_ = (head_ + 1) % max_items_;
        if (count_ < max_items_) {
            ++count_;
        }
    }

    std::lock_guard<std::mutex> lock(callback_mutex_);
    for (const auto& [id, callback] : callbacks_) {
        try {
            callback(entry);
        } catch (const std::exception&) {
            // Logging from inside a sink would re-enter this sink
            failed_callbacks_.fetch_add(1);
        }
    }
}

template <typename Mutex>
template <typename Pred>
auto RingBufferSinkMt<Mutex>::collect(Pred&& pred, size_t limit) const
    -> std::vector<LogEntry> {
    std::vector<LogEntry> result;
    size_t start = (head_ + max_items_ - count_) % max_items_;
    for (size_t i = 0; i < count_ && result.size() < limit; ++i) {
        const auto& entry = buffer_[(start + i) % max_items_];
        if (pred(entry)) {
            result.push_back(entry);
        }
    }
    return result;
}

template <typename Mutex>
auto RingBufferSinkMt<Mutex>::getEntries(size_t count) const
    -> std::vector<LogEntry> {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    size_t actual = (count == 0 || count > count_) ? count_ : count;

    std::vector<LogEntry> result;
    result.reserve(actual);
    size_t start = (head_ + max_items_ - actual) % max_items_;
    for (size_t i = 0; i < actual; ++i) {
        result.push_back(buffer_[(start + i) % max_items_]);
    }
    return result;
}

template <typename Mutex>
auto RingBufferSinkMt<Mutex>::getEntriesFiltered(
    std::optional<spdlog::level::level_enum> level_filter,
    std::optional<std::string> logger_filter, size_t max_count) const
    -> std::vector<LogEntry> {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return collect(
        [&](const LogEntry& entry) {
            if (level_filter && entry.level < *level_filter) {
                return false;
            }
            return !logger_filter ||
                   entry.logger_name.find(*logger_filter) != std::string::npos;
        },
        max_count);
}

template <typename Mutex>
void RingBufferSinkMt<Mutex>::clear() {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    head_ = 0;
    count_ = 0;
}

template <typename Mutex>
auto RingBufferSinkMt<Mutex>::size() const -> size_t {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return count_;
}

template <typename Mutex>
void RingBufferSinkMt<Mutex>::addCallback(const std::string& id,
                                          LogCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callbacks_[id] = std::move(callback);
}

template <typename Mutex>
void RingBufferSinkMt<Mutex>::removeCallback(const std::string& id) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callbacks_.erase(id);
}

template class RingBufferSinkMt<std::mutex>;

}  // namespace codepage::logging
