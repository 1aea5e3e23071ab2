/*
 * store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Keyed storage interface and its in-memory implementation

**************************************************/

#ifndef CODEPAGE_STORAGE_STORE_HPP
#define CODEPAGE_STORAGE_STORE_HPP

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace codepage::storage {

/**
 * @brief Keyed storage used by the core for reports and other records
 *
 * Implementations must be safe for concurrent use.
 */
template <typename T>
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    [[nodiscard]] virtual auto get(const std::string& key) const
        -> std::optional<T> = 0;
    virtual void put(const std::string& key, T value) = 0;

    /**
     * @brief Values accepted by the filter, in key order
     */
    [[nodiscard]] virtual auto list(
        const std::function<bool(const T&)>& filter = nullptr) const
        -> std::vector<T> = 0;

    /**
     * @return true if the key existed
     */
    virtual auto remove(const std::string& key) -> bool = 0;

    /**
     * @return Number of removed entries
     */
    virtual auto removeIf(const std::function<bool(const T&)>& pred)
        -> size_t = 0;

    [[nodiscard]] virtual auto size() const -> size_t = 0;
};

template <typename T>
class InMemoryStore final : public KeyValueStore<T> {
public:
    [[nodiscard]] auto get(const std::string& key) const
        -> std::optional<T> override {
        std::shared_lock lock(mutex_);
        auto it = items_.find(key);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void put(const std::string& key, T value) override {
        std::unique_lock lock(mutex_);
        items_.insert_or_assign(key, std::move(value));
    }

    [[nodiscard]] auto list(
        const std::function<bool(const T&)>& filter = nullptr) const
        -> std::vector<T> override {
        std::shared_lock lock(mutex_);
        std::vector<T> out;
        for (const auto& [key, value] : items_) {
            if (!filter || filter(value)) {
                out.push_back(value);
            }
        }
        return out;
    }

    auto remove(const std::string& key) -> bool override {
        std::unique_lock lock(mutex_);
        return items_.erase(key) > 0;
    }

    auto removeIf(const std::function<bool(const T&)>& pred)
        -> size_t override {
        std::unique_lock lock(mutex_);
        return std::erase_if(items_,
                             [&](const auto& item) { return pred(item.second); });
    }

    [[nodiscard]] auto size() const -> size_t override {
        std::shared_lock lock(mutex_);
        return items_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, T> items_;
};

}  // namespace codepage::storage

#endif  // CODEPAGE_STORAGE_STORE_HPP
