/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Shared types of the configuration layer

**************************************************/

#ifndef CODEPAGE_CONFIG_TYPES_HPP
#define CODEPAGE_CONFIG_TYPES_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace codepage::config {

using json = nlohmann::json;

enum class ConfigError : uint8_t {
    FileNotFound,
    ParseError,
    UnsupportedFormat,
    ValidationFailed
};

[[nodiscard]] constexpr auto configErrorToString(ConfigError error) noexcept
    -> std::string_view {
    switch (error) {
        case ConfigError::FileNotFound: return "FileNotFound";
        case ConfigError::ParseError: return "ParseError";
        case ConfigError::UnsupportedFormat: return "UnsupportedFormat";
        case ConfigError::ValidationFailed: return "ValidationFailed";
    }
    return "Unknown";
}

template <typename T>
using ConfigResult = std::expected<T, ConfigError>;

/**
 * @brief Accumulated validation messages, "<section>.<key>: <reason>"
 */
struct ValidationResult {
    std::vector<std::string> errors;

    [[nodiscard]] auto ok() const -> bool { return errors.empty(); }

    void addError(std::string_view section, std::string_view key,
                  std::string_view reason) {
        errors.push_back(std::string(section) + "." + std::string(key) +
                         ": " + std::string(reason));
    }

    void merge(const ValidationResult& other) {
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    }
};

}  // namespace codepage::config

#endif  // CODEPAGE_CONFIG_TYPES_HPP
