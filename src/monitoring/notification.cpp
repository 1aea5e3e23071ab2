/*
 * notification.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "notification.hpp"

#include <algorithm>
#include <cctype>

#include "logging/logging_manager.hpp"

namespace codepage::monitoring {

namespace {

auto upper(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

}  // namespace

ConsoleChannel::ConsoleChannel() : log_(logging::logger("alerts")) {}

void ConsoleChannel::send(const Alert& alert) {
    log_->warn("ALERT [{}]: {}", upper(severityToString(alert.severity)),
               alert.message);
}

LogChannel::LogChannel() : log_(logging::logger("alerts")) {}

auto LogChannel::format(const Alert& alert) -> json {
    return {{"type", "alert"},
            {"level", severityToString(alert.severity)},
            {"message", alert.message},
            {"alertId", alert.id},
            {"ruleId", alert.ruleId},
            {"timestamp", utils::toIsoString(alert.createdAt)},
            {"metadata", alert.metadata}};
}

void LogChannel::send(const Alert& alert) {
    log_->info("{}", format(alert).dump(-1, ' ', false,
                                        json::error_handler_t::replace));
}

EmailChannel::EmailChannel(std::vector<std::string> recipients,
                           Transport transport)
    : recipients_(std::move(recipients)),
      transport_(std::move(transport)),
      log_(logging::logger("alerts")) {}

auto EmailChannel::render(const Alert& alert) const -> json {
    return {{"to", recipients_},
            {"subject", fmt::format("[{}] {}",
                                    upper(severityToString(alert.severity)),
                                    alert.ruleName)},
            {"body", fmt::format("{}\n\nTrigger value: {}\nThreshold: {}\n"
                                 "Raised at: {}",
                                 alert.message, alert.triggerValue,
                                 alert.threshold,
                                 utils::toIsoString(alert.createdAt))}};
}

void EmailChannel::send(const Alert& alert) {
    auto payload = render(alert).dump(-1, ' ', false,
                                       json::error_handler_t::replace);
    if (transport_) {
        transport_(payload);
    }
    log_->info("Email alert sent: {}", alert.message);
}

SlackChannel::SlackChannel(std::string channel, Transport transport)
    : channel_(std::move(channel)),
      transport_(std::move(transport)),
      log_(logging::logger("alerts")) {}

auto SlackChannel::render(const Alert& alert) const -> json {
    json fields = json::array();
    fields.push_back({{"title", "Rule"}, {"value", alert.ruleName}});
    fields.push_back({{"title", "Trigger value"}, {"value", alert.triggerValue}});
    fields.push_back({{"title", "Threshold"}, {"value", alert.threshold}});

    json attachment;
    attachment["fields"] = std::move(fields);

    json payload;
    payload["channel"] = channel_;
    payload["text"] = fmt::format(":rotating_light: *{}* {}",
                                  upper(severityToString(alert.severity)),
                                  alert.message);
    payload["attachments"] = json::array({std::move(attachment)});
    return payload;
}

void SlackChannel::send(const Alert& alert) {
    auto payload = render(alert).dump(-1, ' ', false,
                                       json::error_handler_t::replace);
    if (transport_) {
        transport_(payload);
    }
    log_->info("Slack alert sent: {}", alert.message);
}

NotificationDispatcher::NotificationDispatcher()
    : log_(logging::logger("alerts")) {}

auto NotificationDispatcher::withDefaultChannels()
    -> std::shared_ptr<NotificationDispatcher> {
    auto dispatcher = std::make_shared<NotificationDispatcher>();
    dispatcher->registerChannel(std::make_shared<ConsoleChannel>());
    dispatcher->registerChannel(std::make_shared<LogChannel>());
    dispatcher->registerChannel(std::make_shared<EmailChannel>());
    dispatcher->registerChannel(std::make_shared<SlackChannel>());
    return dispatcher;
}

void NotificationDispatcher::registerChannel(
    std::shared_ptr<NotificationChannel> channel) {
    std::lock_guard lock(mutex_);
    auto name = channel->name();
    channels_.insert_or_assign(std::move(name), std::move(channel));
}

auto NotificationDispatcher::channels() const -> std::vector<std::string> {
    std::lock_guard lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, channel] : channels_) {
        names.push_back(name);
    }
    return names;
}

auto NotificationDispatcher::dispatch(const Alert& alert,
                                      const std::vector<std::string>& names)
    -> size_t {
    size_t delivered = 0;
    for (const auto& name : names) {
        std::shared_ptr<NotificationChannel> channel;
        {
            std::lock_guard lock(mutex_);
            auto it = channels_.find(name);
            if (it != channels_.end()) {
                channel = it->second;
            }
        }
        if (!channel) {
            log_->warn("Unknown notification channel: {}", name);
            continue;
        }
        try {
            channel->send(alert);
            ++delivered;
        } catch (const std::exception& e) {
            log_->error("Error sending alert {} to {}: {}", alert.id, name,
                        e.what());
        }
    }
    return delivered;
}

}  // namespace codepage::monitoring
