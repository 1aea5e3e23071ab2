/*
 * yaml_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "yaml_parser.hpp"

#include <charconv>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "logging/logging_manager.hpp"

namespace codepage::config {

thread_local std::string YamlParser::lastError_;

namespace {

json scalarToJson(const YAML::Node& node) {
    const std::string& value = node.Scalar();
    if (node.Tag() == "!") {
        return json(value);
    }

    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "on" || value == "On") {
        return json(true);
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "off" || value == "Off") {
        return json(false);
    }
    if (value == "null" || value == "Null" || value == "~" || value.empty()) {
        return json(nullptr);
    }

    const char* first = value.data();
    const char* last = value.data() + value.size();

    long long intVal = 0;
    auto [intEnd, intErr] = std::from_chars(first, last, intVal);
    if (intErr == std::errc() && intEnd == last) {
        return json(intVal);
    }

    double floatVal = 0.0;
    auto [floatEnd, floatErr] = std::from_chars(first, last, floatVal);
    if (floatErr == std::errc() && floatEnd == last) {
        return json(floatVal);
    }

    return json(value);
}

json yamlNodeToJson(const YAML::Node& node, size_t depth, size_t maxDepth) {
    if (depth > maxDepth) {
        throw std::runtime_error("Maximum nesting depth exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalarToJson(node);

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlNodeToJson(item, depth + 1, maxDepth));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& pair : node) {
                obj[pair.first.as<std::string>()] =
                    yamlNodeToJson(pair.second, depth + 1, maxDepth);
            }
            return obj;
        }

        default:
            return json(nullptr);
    }
}

YAML::Node jsonToYamlNode(const json& j) {
    YAML::Node node;
    if (j.is_boolean()) {
        node = j.get<bool>();
    } else if (j.is_number_integer()) {
        node = j.get<int64_t>();
    } else if (j.is_number_float()) {
        node = j.get<double>();
    } else if (j.is_string()) {
        node = j.get<std::string>();
    } else if (j.is_array()) {
        for (const auto& item : j) {
            node.push_back(jsonToYamlNode(item));
        }
    } else if (j.is_object()) {
        for (const auto& [key, value] : j.items()) {
            node[key] = jsonToYamlNode(value);
        }
    }
    return node;
}

}  // namespace

ConfigResult<json> YamlParser::parse(std::string_view content,
                                     size_t maxDepth) {
    lastError_.clear();
    try {
        return yamlNodeToJson(YAML::Load(std::string(content)), 0, maxDepth);
    } catch (const std::exception& e) {
        lastError_ = std::string("YAML parse error: ") + e.what();
        logging::logger("config")->error("YamlParser: {}", lastError_);
        return std::unexpected(ConfigError::ParseError);
    }
}

ConfigResult<json> YamlParser::parseFile(const std::filesystem::path& path,
                                         size_t maxDepth) {
    lastError_.clear();
    if (!std::filesystem::exists(path)) {
        lastError_ = "No such file: " + path.string();
        return std::unexpected(ConfigError::FileNotFound);
    }
    try {
        return yamlNodeToJson(YAML::LoadFile(path.string()), 0, maxDepth);
    } catch (const std::exception& e) {
        lastError_ = std::string("YAML parse error: ") + e.what();
        logging::logger("config")->error("YamlParser: Failed to parse {}: {}",
                                         path.string(), lastError_);
        return std::unexpected(ConfigError::ParseError);
    }
}

std::string YamlParser::emit(const json& data) {
    YAML::Emitter emitter;
    emitter.SetIndent(2);
    emitter << jsonToYamlNode(data);
    return emitter.c_str();
}

std::string YamlParser::getLastError() { return lastError_; }

}  // namespace codepage::config
