/*
 * yaml_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: YAML to JSON bridge for configuration files

**************************************************/

#ifndef CODEPAGE_CONFIG_YAML_PARSER_HPP
#define CODEPAGE_CONFIG_YAML_PARSER_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include "types.hpp"

namespace codepage::config {

/**
 * @brief Parses YAML documents into JSON using yaml-cpp
 *
 * Plain scalars are typed the YAML 1.1 way (true/yes/on, integers, floats,
 * ~ and null). Quoted scalars always stay strings.
 */
class YamlParser {
public:
    [[nodiscard]] static ConfigResult<json> parse(std::string_view content,
                                                  size_t maxDepth = 64);

    [[nodiscard]] static ConfigResult<json> parseFile(
        const std::filesystem::path& path, size_t maxDepth = 64);

    [[nodiscard]] static std::string emit(const json& data);

    /**
     * @brief Message of the last failed parse on this thread
     */
    [[nodiscard]] static std::string getLastError();

private:
    static thread_local std::string lastError_;
};

}  // namespace codepage::config

#endif  // CODEPAGE_CONFIG_YAML_PARSER_HPP
