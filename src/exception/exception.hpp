/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file exception.hpp
 * @brief Exception hierarchy shared by the sandbox, storage and monitoring
 * layers
 */

#ifndef CODEPAGE_EXCEPTION_EXCEPTION_HPP
#define CODEPAGE_EXCEPTION_EXCEPTION_HPP

#include <chrono>
#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#undef ERROR

namespace codepage::exception {

using json = nlohmann::json;

enum class ErrorSeverity : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    FATAL = 6
};

/**
 * @brief Closed error taxonomy of the core
 *
 * SCRIPT and RESOURCE_LIMIT failures are always captured into an execution
 * result; INFRASTRUCTURE failures are retried or logged by their owner.
 */
enum class ErrorCategory : uint16_t {
    UNKNOWN = 0,
    SCRIPT = 100,
    RESOURCE_LIMIT = 200,
    INFRASTRUCTURE = 300,
    STORAGE = 400,
    CONFIGURATION = 500,
    SECURITY = 600
};

[[nodiscard]] constexpr std::string_view errorCategoryToString(
    ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::UNKNOWN: return "Unknown";
        case ErrorCategory::SCRIPT: return "Script";
        case ErrorCategory::RESOURCE_LIMIT: return "ResourceLimit";
        case ErrorCategory::INFRASTRUCTURE: return "Infrastructure";
        case ErrorCategory::STORAGE: return "Storage";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::SECURITY: return "Security";
    }
    return "Unknown";
}

// Error context information
struct ErrorContext {
    std::string operation;
    std::string module;
    std::string function;
    json metadata;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    ErrorContext(std::string_view op = "", std::string_view mod = "",
                 std::string_view func = "", json meta = {})
        : operation(op),
          module(mod),
          function(func),
          metadata(std::move(meta)),
          timestamp(std::chrono::system_clock::now()),
          threadId(std::this_thread::get_id()) {}

    [[nodiscard]] auto toJson() const -> json {
        return json{
            {"operation", operation},
            {"module", module},
            {"function", function},
            {"metadata", metadata},
            {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                              timestamp.time_since_epoch())
                              .count()},
            {"threadId", std::to_string(std::hash<std::thread::id>{}(threadId))}};
    }
};

/**
 * @brief Base exception carrying category, code and source location
 */
class CodepageException : public std::runtime_error {
public:
    explicit CodepageException(
        ErrorCategory category, uint32_t errorCode, std::string_view message,
        ErrorContext context = {},
        ErrorSeverity severity = ErrorSeverity::ERROR,
        const std::source_location& location = std::source_location::current())
        : std::runtime_error(std::string(message)),
          severity_(severity),
          category_(category),
          errorCode_(errorCode),
          context_(std::move(context)),
          file_(location.file_name()),
          line_(location.line()) {
        if (context_.function.empty()) {
            context_.function = location.function_name();
        }
    }

    [[nodiscard]] auto getSeverity() const noexcept -> ErrorSeverity {
        return severity_;
    }
    [[nodiscard]] auto getCategory() const noexcept -> ErrorCategory {
        return category_;
    }
    [[nodiscard]] auto getErrorCode() const noexcept -> uint32_t {
        return errorCode_;
    }
    [[nodiscard]] auto getContext() const noexcept -> const ErrorContext& {
        return context_;
    }
    [[nodiscard]] auto getFile() const noexcept -> const std::string& {
        return file_;
    }
    [[nodiscard]] auto getLine() const noexcept -> uint32_t { return line_; }

    [[nodiscard]] auto toJson() const -> json {
        return json{{"type", "CodepageException"},
                    {"message", what()},
                    {"severity", static_cast<uint8_t>(severity_)},
                    {"category", errorCategoryToString(category_)},
                    {"errorCode", errorCode_},
                    {"file", file_},
                    {"line", line_},
                    {"context", context_.toJson()}};
    }

    [[nodiscard]] auto toString() const -> std::string {
        return fmt::format("[{}:{}] {} ({}:{})",
                           errorCategoryToString(category_), errorCode_,
                           what(), file_, line_);
    }

private:
    ErrorSeverity severity_;
    ErrorCategory category_;
    uint32_t errorCode_;
    ErrorContext context_;
    std::string file_;
    uint32_t line_;
};

/**
 * @brief Raised inside the sandbox when a run crosses one of its ceilings
 *
 * The kind string ("TimeoutExceeded", "MemoryExceeded",
 * "ApiCallLimitExceeded", "Cancelled") becomes the ExecutionError kind.
 */
class ResourceLimitException : public CodepageException {
public:
    ResourceLimitException(
        std::string kind, std::string_view message, ErrorContext context = {},
        const std::source_location& location = std::source_location::current())
        : CodepageException(ErrorCategory::RESOURCE_LIMIT, 1, message,
                            std::move(context), ErrorSeverity::WARNING,
                            location),
          kind_(std::move(kind)) {}

    [[nodiscard]] auto kind() const noexcept -> const std::string& {
        return kind_;
    }

private:
    std::string kind_;
};

class InfrastructureException : public CodepageException {
public:
    explicit InfrastructureException(
        std::string_view message, ErrorContext context = {},
        const std::source_location& location = std::source_location::current())
        : CodepageException(ErrorCategory::INFRASTRUCTURE, 1, message,
                            std::move(context), ErrorSeverity::ERROR,
                            location) {}
};

class ConfigurationException : public CodepageException {
public:
    explicit ConfigurationException(
        std::string_view message, ErrorContext context = {},
        const std::source_location& location = std::source_location::current())
        : CodepageException(ErrorCategory::CONFIGURATION, 1, message,
                            std::move(context), ErrorSeverity::ERROR,
                            location) {}
};

}  // namespace codepage::exception

#define CODEPAGE_THROW_INFRASTRUCTURE(...) \
    throw codepage::exception::InfrastructureException(fmt::format(__VA_ARGS__))

#define CODEPAGE_THROW_CONFIGURATION(...) \
    throw codepage::exception::ConfigurationException(fmt::format(__VA_ARGS__))

#endif  // CODEPAGE_EXCEPTION_EXCEPTION_HPP
