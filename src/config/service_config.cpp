/*
 * service_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "service_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>

#include "logging/logging_manager.hpp"
#include "yaml_parser.hpp"

namespace codepage::config {

namespace {

auto parseDocument(const std::filesystem::path& path) -> ConfigResult<json> {
    auto ext = path.extension().string();
    if (ext == ".yaml" || ext == ".yml") {
        return YamlParser::parseFile(path);
    }
    if (ext != ".json") {
        return std::unexpected(ConfigError::UnsupportedFormat);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError::FileNotFound);
    }
    json document = json::parse(file, nullptr, false, true);
    if (document.is_discarded()) {
        logging::logger("config")->error("Invalid JSON in {}", path.string());
        return std::unexpected(ConfigError::ParseError);
    }
    return document;
}

auto finish(const json& document) -> ConfigResult<ServiceConfig> {
    ServiceConfig config;
    try {
        config = ServiceConfig::fromJson(document);
    } catch (const json::exception& e) {
        logging::logger("config")->error("Mistyped configuration value: {}",
                                         e.what());
        return std::unexpected(ConfigError::ValidationFailed);
    }
    auto validation = config.validate();
    if (!validation.ok()) {
        for (const auto& error : validation.errors) {
            logging::logger("config")->error("Invalid configuration: {}",
                                             error);
        }
        return std::unexpected(ConfigError::ValidationFailed);
    }
    return config;
}

}  // namespace

auto processEnvironment() -> EnvironmentLookup {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

json ServiceConfig::toJson() const {
    return {{std::string(ExecutionSection::NAME), execution.toJson()},
            {std::string(ReportingSection::NAME), reporting.toJson()},
            {std::string(MonitoringSection::NAME), monitoring.toJson()},
            {"logging", logging.toJson()}};
}

ServiceConfig ServiceConfig::fromJson(const json& j) {
    ServiceConfig config;
    auto section = [&j](std::string_view name) {
        auto it = j.find(std::string(name));
        return it != j.end() && it->is_object() ? *it : json::object();
    };
    config.execution = ExecutionSection::fromJson(section(ExecutionSection::NAME));
    config.reporting = ReportingSection::fromJson(section(ReportingSection::NAME));
    config.monitoring =
        MonitoringSection::fromJson(section(MonitoringSection::NAME));
    config.logging = logging::LoggingConfig::fromJson(section("logging"));
    return config;
}

ValidationResult ServiceConfig::validate() const {
    ValidationResult result = execution.validate();
    result.merge(reporting.validate());
    result.merge(monitoring.validate());
    if (logging.ring_buffer_size == 0) {
        result.addError("logging", "ring_buffer_size", "must be positive");
    }
    return result;
}

ConfigResult<ServiceConfig> ServiceConfig::load(
    const std::filesystem::path& path, const EnvironmentLookup& env) {
    auto loaded = parseDocument(path);
    if (!loaded) {
        logging::logger("config")->error(
            "Failed to load {}: {}", path.string(),
            configErrorToString(loaded.error()));
        return std::unexpected(loaded.error());
    }

    // Start from the full default document so every key can be overridden
    json document = ServiceConfig{}.toJson();
    document.merge_patch(*loaded);
    applyEnvironmentOverrides(document, env);
    logging::logger("config")->info("Loaded configuration from {}",
                                    path.string());
    return finish(document);
}

ConfigResult<ServiceConfig> ServiceConfig::fromEnvironment(
    const EnvironmentLookup& env) {
    json document = ServiceConfig{}.toJson();
    applyEnvironmentOverrides(document, env);
    return finish(document);
}

void applyEnvironmentOverrides(json& document, const EnvironmentLookup& env) {
    for (auto& [sectionName, section] : document.items()) {
        if (!section.is_object()) {
            continue;
        }
        for (auto& [key, value] : section.items()) {
            if (value.is_structured()) {
                continue;
            }
            auto name = "CODEPAGE_" + toEnvironmentKey(sectionName) + "_" +
                        toEnvironmentKey(key);
            auto raw = env(name);
            if (!raw) {
                continue;
            }
            json parsed = json::parse(*raw, nullptr, false);
            value = parsed.is_discarded() ? json(*raw) : parsed;
            logging::logger("config")->debug("Override {} from environment",
                                             name);
        }
    }
}

auto toEnvironmentKey(std::string_view key) -> std::string {
    std::string out;
    out.reserve(key.size() + 4);
    for (size_t i = 0; i < key.size(); ++i) {
        auto c = static_cast<unsigned char>(key[i]);
        if (std::isupper(c) && i > 0 && key[i - 1] != '_') {
            out.push_back('_');
        }
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

}  // namespace codepage::config
