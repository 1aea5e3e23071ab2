/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: codepage-runner, runs one script through the core and prints
the result as JSON

**************************************************/

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include "config/service_config.hpp"
#include "core/codepage_core.hpp"
#include "core/runner_options.hpp"
#include "exception/exception.hpp"
#include "logging/logging_manager.hpp"
#include "script/sandbox/python_runtime.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using codepage::core::RunnerOptions;
using codepage::core::UsageError;

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

auto readFile(const fs::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw UsageError(fmt::format("cannot read {}", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

auto loadConfig(const RunnerOptions& options)
    -> codepage::config::ServiceConfig {
    auto loaded = options.config
                      ? codepage::config::ServiceConfig::load(*options.config)
                      : codepage::config::ServiceConfig::fromEnvironment();
    if (!loaded) {
        throw UsageError(fmt::format(
            "cannot load configuration: {}",
            codepage::config::configErrorToString(loaded.error())));
    }
    auto config = std::move(*loaded);
    // A single run has no use for the sampling thread.
    config.monitoring.systemSampling = false;
    return config;
}

auto run(const RunnerOptions& options) -> int {
    auto config = loadConfig(options);
    codepage::logging::LoggingManager::getInstance().initialize(config.logging);
    auto log = codepage::logging::logger("codepage");

    codepage::sandbox::ExecutionRequest request;
    request.projectId = options.projectId;
    request.versionId = options.versionId;
    request.scriptSource = readFile(options.script);
    if (options.data) {
        try {
            request.testData = json::parse(readFile(*options.data));
        } catch (const json::parse_error& e) {
            throw UsageError(fmt::format("invalid test data in {}: {}",
                                         options.data->string(), e.what()));
        }
    }
    if (options.timeoutMs) {
        request.overrides.timeout = std::chrono::milliseconds(*options.timeoutMs);
    }

    codepage::sandbox::PythonRuntime runtime;
    codepage::core::CodepageCore core(std::move(config));
    core.start();

    auto result = core.execute(request);
    json output = {{"result", result.toJson()}};

    if (options.report) {
        codepage::reporting::ReportOptions reportOptions;
        reportOptions.detailLevel = codepage::reporting::DetailLevel::Comprehensive;
        auto report =
            core.generateReport(request.projectId, request.versionId, reportOptions);
        if (report) {
            output["report"] = report->toJson();
        } else {
            log->warn("No report generated: {}",
                      codepage::reporting::reportErrorToString(report.error()));
        }
    }
    output["health"] = core.systemHealth().toJson();
    core.stop();

    std::cout << output.dump(2) << std::endl;
    return result.passed() ? kExitPassed : kExitFailed;
}

}  // namespace

int main(int argc, char* argv[]) {
    RunnerOptions options;
    try {
        options = codepage::core::parseRunnerOptions(
            std::vector<std::string>(argv, argv + argc));
    } catch (const UsageError& e) {
        std::cerr << "codepage-runner: " << e.what()
                  << "\nRun with --help for usage.\n";
        return kExitUsage;
    }

    try {
        return run(options);
    } catch (const UsageError& e) {
        std::cerr << "codepage-runner: " << e.what() << "\n";
        return kExitUsage;
    } catch (const codepage::exception::CodepageException& e) {
        codepage::logging::logger("codepage")->critical("Run aborted: {}",
                                                        e.toString());
        return kExitFailed;
    } catch (const std::exception& e) {
        codepage::logging::logger("codepage")->critical("Unexpected error: {}",
                                                        e.what());
        return kExitFailed;
    }
}
