/*
 * notification.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Pluggable alert notification channels

**************************************************/

#ifndef CODEPAGE_MONITORING_NOTIFICATION_HPP
#define CODEPAGE_MONITORING_NOTIFICATION_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace codepage::monitoring {

class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @throws std::exception on delivery failure
     */
    virtual void send(const Alert& alert) = 0;
};

/**
 * @brief Human-readable line on the "alerts" logger at warn level
 */
class ConsoleChannel : public NotificationChannel {
public:
    ConsoleChannel();
    [[nodiscard]] auto name() const -> std::string override { return "console"; }
    void send(const Alert& alert) override;

private:
    std::shared_ptr<spdlog::logger> log_;
};

/**
 * @brief Structured JSON record on the "alerts" logger
 */
class LogChannel : public NotificationChannel {
public:
    LogChannel();
    [[nodiscard]] auto name() const -> std::string override { return "log"; }
    void send(const Alert& alert) override;

    [[nodiscard]] static auto format(const Alert& alert) -> json;

private:
    std::shared_ptr<spdlog::logger> log_;
};

/**
 * @brief Hands a rendered payload to an external transport
 */
using Transport = std::function<void(const std::string& payload)>;

/**
 * @brief Renders a subject/body message; without a transport the message
 * is only logged
 */
class EmailChannel : public NotificationChannel {
public:
    explicit EmailChannel(std::vector<std::string> recipients = {},
                          Transport transport = nullptr);
    [[nodiscard]] auto name() const -> std::string override { return "email"; }
    void send(const Alert& alert) override;

    [[nodiscard]] auto render(const Alert& alert) const -> json;

private:
    std::vector<std::string> recipients_;
    Transport transport_;
    std::shared_ptr<spdlog::logger> log_;
};

/**
 * @brief Renders a Slack webhook payload; without a transport the payload
 * is only logged
 */
class SlackChannel : public NotificationChannel {
public:
    explicit SlackChannel(std::string channel = "#alerts",
                          Transport transport = nullptr);
    [[nodiscard]] auto name() const -> std::string override { return "slack"; }
    void send(const Alert& alert) override;

    [[nodiscard]] auto render(const Alert& alert) const -> json;

private:
    std::string channel_;
    Transport transport_;
    std::shared_ptr<spdlog::logger> log_;
};

/**
 * @brief Routes an alert to the channels a rule names
 *
 * Each channel is attempted independently; a failure is logged and does
 * not stop the remaining channels.
 */
class NotificationDispatcher {
public:
    /**
     * @brief Dispatcher with console, log, email and slack registered
     */
    static auto withDefaultChannels() -> std::shared_ptr<NotificationDispatcher>;

    NotificationDispatcher();

    void registerChannel(std::shared_ptr<NotificationChannel> channel);
    [[nodiscard]] auto channels() const -> std::vector<std::string>;

    /**
     * @return Number of channels that accepted the alert
     */
    auto dispatch(const Alert& alert, const std::vector<std::string>& names)
        -> size_t;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<NotificationChannel>> channels_;
    std::shared_ptr<spdlog::logger> log_;
};

}  // namespace codepage::monitoring

#endif  // CODEPAGE_MONITORING_NOTIFICATION_HPP
