/*
 * runner_options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Command line options of codepage-runner

**************************************************/

#ifndef CODEPAGE_CORE_RUNNER_OPTIONS_HPP
#define CODEPAGE_CORE_RUNNER_OPTIONS_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codepage::core {

struct RunnerOptions {
    std::filesystem::path script;
    std::optional<std::filesystem::path> data;
    std::optional<std::filesystem::path> config;
    std::string projectId{"local"};
    std::string versionId{"current"};
    std::optional<size_t> timeoutMs;
    bool report{false};
};

/**
 * @brief Bad command line or unreadable runner input; exit status 2
 */
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Parse the runner's arguments, args[0] being the program name
 * @throws UsageError on unknown or malformed arguments, a missing --script
 * or a timeout that is not a positive number of milliseconds
 */
auto parseRunnerOptions(const std::vector<std::string>& args) -> RunnerOptions;

}  // namespace codepage::core

#endif  // CODEPAGE_CORE_RUNNER_OPTIONS_HPP
