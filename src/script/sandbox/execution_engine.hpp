/*
 * execution_engine.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file execution_engine.hpp
 * @brief Runs user scripts in the embedded interpreter under resource limits
 */

#ifndef CODEPAGE_SCRIPT_SANDBOX_EXECUTION_ENGINE_HPP
#define CODEPAGE_SCRIPT_SANDBOX_EXECUTION_ENGINE_HPP

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "mock_api.hpp"
#include "resource_monitor.hpp"
#include "types.hpp"

namespace codepage::sandbox {

struct EngineOptions {
    ExecutionConfig defaults;                        ///< Platform defaults
    std::chrono::milliseconds pollInterval{100};     ///< Supervisor tick
    /// How long a script may keep running after a limit is hit before its
    /// worker is abandoned and the limit result returned
    std::chrono::milliseconds unwindGrace{1000};
    size_t maxConcurrentExecutions{4};
    std::shared_ptr<MockApi> mockApi;                ///< Created when null
    std::shared_ptr<MemoryProbe> memoryProbe;        ///< Process RSS when null
};

/**
 * @brief Main execution engine for sandboxed scripts
 *
 * Each run gets a fresh restricted namespace, its own resource monitor and
 * a private copy of the mock API fixtures. The script runs on a worker
 * thread; the calling thread supervises it, samples memory every poll
 * interval and raises ResourceLimitExceeded into the script once a limit
 * is crossed. A script that is still running unwindGrace after a limit is
 * left to its worker and the limit result is returned anyway. execute()
 * never throws for script or limit failures, they are returned inside the
 * result. A test id may only be active once at a time.
 *
 * A PythonRuntime must exist, and the caller must not hold the GIL.
 */
class ExecutionEngine {
public:
    explicit ExecutionEngine(EngineOptions options = {});
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * @brief Run one script to completion, blocking the caller
     */
    [[nodiscard]] ExecutionResult execute(const ExecutionRequest& request);

    /**
     * @brief Run on a separate thread; the returned future keeps the
     * engine's state alive, so it may outlive the engine
     */
    [[nodiscard]] std::future<ExecutionResult> executeAsync(
        ExecutionRequest request);

    /**
     * @brief Request cancellation of a queued or running execution
     * @return false if no execution with this id is active
     */
    bool cancel(const std::string& testId);

    [[nodiscard]] std::vector<std::string> activeExecutions() const;
    [[nodiscard]] EngineStats stats() const;

    void addObserver(std::shared_ptr<ExecutionObserver> observer);
    void removeObserver(const std::shared_ptr<ExecutionObserver>& observer);

    [[nodiscard]] std::shared_ptr<MockApi> mockApi() const;
    [[nodiscard]] const ExecutionConfig& defaults() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl_;  ///< Shared with pending executeAsync calls
};

}  // namespace codepage::sandbox

#endif  // CODEPAGE_SCRIPT_SANDBOX_EXECUTION_ENGINE_HPP
