/*
 * runner_options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "runner_options.hpp"

#include <spdlog/fmt/fmt.h>

#include "atom/utils/argsview.hpp"

using namespace std::string_literals;

namespace codepage::core {

namespace {

auto makeParser() -> atom::utils::ArgumentParser {
    using ArgType = atom::utils::ArgumentParser::ArgType;
    atom::utils::ArgumentParser program("codepage-runner"s);

    program.addArgument("script", ArgType::STRING, true, {},
                        "Script to execute", {"s"});
    program.addArgument("data", ArgType::STRING, false, {},
                        "JSON file exposed to the script as testData", {"d"});
    program.addArgument("config", ArgType::STRING, false, {},
                        "YAML or JSON service configuration", {"c"});
    program.addArgument("project", ArgType::STRING, false, "local"s,
                        "Project id", {"p"});
    program.addArgument("version", ArgType::STRING, false, "current"s,
                        "Version id", {"v"});
    program.addArgument("timeout", ArgType::INTEGER, false, {},
                        "Override the execution timeout in milliseconds",
                        {"t"});
    program.addFlag("report", "Also print the generated test report", {"r"});

    program.addDescription("Runs one codepage script and prints the result as "
                           "JSON:");
    program.addEpilog("Exit status: 0 passed, 1 failed or error, 2 usage.");
    return program;
}

}  // namespace

auto parseRunnerOptions(const std::vector<std::string>& args) -> RunnerOptions {
    auto program = makeParser();
    try {
        program.parse(static_cast<int>(args.size()), args);
    } catch (const std::exception& e) {
        throw UsageError(e.what());
    }

    RunnerOptions options;
    auto script = program.get<std::string>("script");
    if (!script || script->empty()) {
        throw UsageError("--script is required");
    }
    options.script = *script;
    if (auto data = program.get<std::string>("data")) {
        options.data = *data;
    }
    if (auto config = program.get<std::string>("config")) {
        options.config = *config;
    }
    options.projectId = program.get<std::string>("project").value_or("local"s);
    options.versionId = program.get<std::string>("version").value_or("current"s);
    if (auto timeout = program.get<int>("timeout")) {
        if (*timeout <= 0) {
            throw UsageError(fmt::format(
                "invalid timeout '{}': expected milliseconds", *timeout));
        }
        options.timeoutMs = static_cast<size_t>(*timeout);
    }
    options.report = program.getFlag("report");
    return options;
}

}  // namespace codepage::core
