/*
 * execution_engine.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "execution_engine.hpp"

#include <pybind11/embed.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <semaphore>
#include <thread>

#include <spdlog/fmt/fmt.h>

#include "bindings.hpp"
#include "cancellation.hpp"
#include "exception/exception.hpp"
#include "logging/logging_manager.hpp"
#include "script_guard.hpp"
#include "utils/id_generator.hpp"

namespace codepage::sandbox {

namespace {

constexpr const char* kScriptFile = "<codepage>";

/**
 * @brief Everything the worker touches while a script runs
 *
 * Owned jointly by the supervisor and the worker thread, so a worker that
 * outlives its supervisor keeps a valid copy of its inputs and bindings.
 */
struct RunState {
    RunState(const ExecutionRequest& request, RunBindings runBindings)
        : source(request.scriptSource),
          testData(request.testData),
          bindings(std::move(runBindings)) {}

    const std::string source;
    const json testData;
    const RunBindings bindings;

    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
    std::optional<ExecutionError> scriptError;

    std::atomic<bool> interruptPending{false};

    // Written and read with the GIL held
    bool threadStarted{false};
    bool scriptFinished{false};
    unsigned long threadId{0};
};

ExecutionError infrastructureError(std::string message) {
    ExecutionError error;
    error.kind = std::string(error_kind::kInfrastructureError);
    error.message = std::move(message);
    return error;
}

std::string limitMessage(LimitViolation violation, const ExecutionConfig& config,
                         size_t peakMemory) {
    switch (violation) {
        case LimitViolation::TimeoutExceeded:
            return fmt::format("Execution timed out after {}ms",
                               config.timeout.count());
        case LimitViolation::MemoryExceeded:
            return fmt::format(
                "Memory limit exceeded: {} bytes used, limit is {} bytes",
                peakMemory, config.memoryLimitBytes);
        case LimitViolation::ApiCallLimitExceeded:
            return fmt::format("API call limit exceeded ({})",
                               config.apiCallLimit);
        case LimitViolation::Cancelled:
            return "Execution cancelled";
    }
    return "Execution cancelled";
}

/**
 * @brief Stop any further interruption of the worker; must run with the GIL
 * held, before the worker executes other Python code
 */
void finishScript(RunState& state) {
    if (!state.scriptFinished) {
        state.scriptFinished = true;
        PyThreadState_SetAsyncExc(state.threadId, nullptr);
    }
}

/**
 * @brief Raise ResourceLimitExceeded in the worker from a helper thread
 *
 * The helper waits for the GIL on its own, so a worker stuck inside a long
 * builtin never blocks the supervisor. At most one helper is pending per
 * run.
 */
void interrupt(const std::shared_ptr<RunState>& state) {
    if (state->interruptPending.exchange(true)) {
        return;
    }
    std::thread([state] {
        {
            py::gil_scoped_acquire gil;
            if (state->threadStarted && !state->scriptFinished) {
                py::object type = resourceLimitExceededType();
                PyThreadState_SetAsyncExc(state->threadId, type.ptr());
            }
        }
        state->interruptPending.store(false);
    }).detach();
}

/**
 * @brief Translate a Python exception escaping the script, must hold the GIL
 */
ExecutionError captureError(py::error_already_set& e) {
    ExecutionError error;
    error.kind = py::str(e.type().attr("__name__")).cast<std::string>();
    error.message = py::str(e.value()).cast<std::string>();

    try {
        py::object trace = e.trace() ? e.trace() : py::none();
        py::module_ traceback = py::module_::import("traceback");

        std::string stack;
        for (auto line :
             traceback.attr("format_exception")(e.type(), e.value(), trace)) {
            stack += line.cast<std::string>();
        }
        error.stack = std::move(stack);

        if (!trace.is_none()) {
            for (auto frame : traceback.attr("extract_tb")(trace)) {
                if (frame.attr("filename").cast<std::string>() != kScriptFile) {
                    continue;
                }
                error.lineNumber = frame.attr("lineno").cast<int>();
                error.columnNumber.reset();
                if (py::hasattr(frame, "colno") &&
                    !frame.attr("colno").is_none()) {
                    error.columnNumber = frame.attr("colno").cast<int>() + 1;
                }
            }
        }

        if (e.matches(PyExc_SyntaxError) && !error.lineNumber) {
            py::object value = e.value();
            if (!value.attr("lineno").is_none()) {
                error.lineNumber = value.attr("lineno").cast<int>();
            }
            if (!value.attr("offset").is_none()) {
                error.columnNumber = value.attr("offset").cast<int>();
            }
        }
    } catch (py::error_already_set& inner) {
        logging::logger("sandbox")->warn("Failed to format script traceback: {}",
                                         inner.what());
    }
    return error;
}

}  // namespace

class ExecutionEngine::Impl {
    struct SlotGuard {
        explicit SlotGuard(std::counting_semaphore<>& slots) : slots_(slots) {
            slots_.acquire();
        }
        ~SlotGuard() { slots_.release(); }
        SlotGuard(const SlotGuard&) = delete;
        SlotGuard& operator=(const SlotGuard&) = delete;

        std::counting_semaphore<>& slots_;
    };

public:
    explicit Impl(EngineOptions options)
        : options_(std::move(options)),
          slots_(static_cast<std::ptrdiff_t>(
              std::max<size_t>(options_.maxConcurrentExecutions, 1))),
          log_(logging::logger("sandbox")) {
        if (!options_.mockApi) {
            options_.mockApi = std::make_shared<MockApi>();
        }
        if (!options_.memoryProbe) {
            options_.memoryProbe = std::make_shared<ProcessMemoryProbe>();
        }
        if (options_.pollInterval.count() <= 0) {
            options_.pollInterval = std::chrono::milliseconds(100);
        }
        log_->info("ExecutionEngine created: {} concurrent slots, poll {}ms",
                   std::max<size_t>(options_.maxConcurrentExecutions, 1),
                   options_.pollInterval.count());
    }

    ExecutionResult execute(const ExecutionRequest& request) {
        std::string testId = request.testId.value_or(utils::generateId("test"));
        ExecutionConfig config = request.overrides.applyTo(options_.defaults);
        auto createdAt = std::chrono::system_clock::now();

        auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
        bool registered = false;
        {
            std::lock_guard lock(mutex_);
            registered = active_.try_emplace(testId, cancelFlag).second;
        }

        ExecutionResult result;
        if (!registered) {
            result = failedBeforeStart(
                testId, request, createdAt,
                fmt::format("Test {} is already running", testId));
        } else if (!Py_IsInitialized()) {
            result = failedBeforeStart(testId, request, createdAt,
                                       "Python interpreter is not initialized");
        } else if (PyGILState_Check()) {
            result = failedBeforeStart(
                testId, request, createdAt,
                "execute() must not be called while holding the GIL");
        } else {
            SlotGuard slot(slots_);
            try {
                result = cancelFlag->load()
                             ? cancelledBeforeStart(testId, request, config,
                                                    createdAt)
                             : run(testId, request, config, createdAt,
                                   *cancelFlag);
            } catch (const std::exception& e) {
                result = failedBeforeStart(
                    testId, request, createdAt,
                    fmt::format("Sandbox failure: {}", e.what()));
            }
        }

        if (registered) {
            std::lock_guard lock(mutex_);
            active_.erase(testId);
        }
        record(result);
        notify(result);
        return result;
    }

    bool cancel(const std::string& testId) {
        std::lock_guard lock(mutex_);
        auto it = active_.find(testId);
        if (it == active_.end()) {
            return false;
        }
        it->second->store(true);
        log_->info("Cancellation requested for {}", testId);
        return true;
    }

    std::vector<std::string> activeExecutions() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(active_.size());
        for (const auto& [id, flag] : active_) {
            ids.push_back(id);
        }
        return ids;
    }

    EngineStats stats() const {
        std::lock_guard lock(mutex_);
        EngineStats snapshot = stats_;
        snapshot.activeExecutions = active_.size();
        snapshot.averageExecutionTimeMs =
            stats_.totalExecutions == 0
                ? 0.0
                : static_cast<double>(totalExecutionTimeMs_) /
                      static_cast<double>(stats_.totalExecutions);
        return snapshot;
    }

    void addObserver(std::shared_ptr<ExecutionObserver> observer) {
        std::lock_guard lock(mutex_);
        observers_.push_back(std::move(observer));
    }

    void removeObserver(const std::shared_ptr<ExecutionObserver>& observer) {
        std::lock_guard lock(mutex_);
        std::erase(observers_, observer);
    }

    std::shared_ptr<MockApi> mockApi() const { return options_.mockApi; }
    const ExecutionConfig& defaults() const { return options_.defaults; }

private:
    ExecutionResult run(const std::string& testId,
                        const ExecutionRequest& request,
                        const ExecutionConfig& config, TimePoint createdAt,
                        const std::atomic<bool>& cancelFlag) {
        log_->info("Starting test execution {} for project {}", testId,
                   request.projectId);

        auto context = std::make_shared<ExecutionContext>(
            testId, request.projectId, request.versionId, config, createdAt);
        auto monitor = std::make_shared<ResourceMonitor>();
        auto token = std::make_shared<CancellationToken>();
        auto session = std::make_shared<MockApiSession>(
            context, monitor, token, options_.mockApi->snapshot(),
            options_.mockApi->latencyProfile(),
            options_.mockApi->latencyScale());

        monitor->start(config);
        sampleMemory(*context, *monitor);

        auto state = std::make_shared<RunState>(
            request, RunBindings{context, monitor, session});
        std::thread worker([state, log = log_] { runScript(*state, log); });
        if (supervise(state, *context, *monitor, *token, cancelFlag)) {
            worker.join();
        } else {
            // The script ignored every interruption for the whole grace
            // period; it keeps its own state and is left to unwind alone.
            worker.detach();
            log_->error("Test {} did not stop within {}ms of its limit, "
                        "worker abandoned",
                        testId, options_.unwindGrace.count());
        }

        auto elapsed = monitor->elapsed();
        ExecutionResult result = buildResult(*context, createdAt);
        result.executionTimeMs = elapsed.count();
        result.performanceMetrics.executionTimeMs = elapsed.count();

        if (auto violation = monitor->violation()) {
            ExecutionError error;
            error.kind = std::string(limitViolationToString(*violation));
            error.message = limitMessage(*violation, config,
                                         result.peakMemoryBytes);
            result.status = ExecutionStatus::Error;
            result.errors = {std::move(error)};
            log_->warn("Test {} stopped: {}", testId, result.errors[0].message);
        } else if (state->scriptError) {
            result.status = state->scriptError->kind == error_kind::kAssertionError
                                ? ExecutionStatus::Failed
                                : ExecutionStatus::Error;
            result.errors = {std::move(*state->scriptError)};
        }

        log_->info("Test {} completed: {} in {}ms ({} API calls)", testId,
                   executionStatusToString(result.status),
                   result.executionTimeMs, result.apiCallCount);
        return result;
    }

    static void runScript(RunState& state,
                          const std::shared_ptr<spdlog::logger>& log) {
        std::optional<ExecutionError> error;
        {
            py::gil_scoped_acquire gil;
            state.threadId = PyThread_get_thread_ident();
            state.threadStarted = true;

            try {
                auto checked = ScriptGuard::check(state.source);
                if (!checked) {
                    error = std::move(checked.error());
                } else {
                    py::dict globals = buildGlobals(state.bindings, state.testData);
                    py::module_ builtins = py::module_::import("builtins");
                    py::object code = builtins.attr("compile")(
                        state.source, kScriptFile, "exec");
                    builtins.attr("exec")(code, globals);
                    finishScript(state);
                    globals.clear();
                }
            } catch (py::error_already_set& e) {
                finishScript(state);
                if (!e.matches(resourceLimitExceededType())) {
                    error = captureError(e);
                }
            } catch (const exception::ResourceLimitException&) {
                finishScript(state);
            } catch (const std::exception& e) {
                finishScript(state);
                error = infrastructureError(
                    fmt::format("Sandbox failure: {}", e.what()));
                log->error("Sandbox failure in {}: {}",
                           state.bindings.context->testId(), e.what());
            }
            finishScript(state);
        }

        {
            std::lock_guard lock(state.mutex);
            state.scriptError = std::move(error);
            state.done = true;
        }
        state.cv.notify_all();
    }

    /**
     * @brief Wait for the worker, enforcing the limits every tick
     *
     * Once a limit is hit the worker is interrupted on every tick. Returns
     * false when it is still running unwindGrace after the first violation.
     */
    bool supervise(const std::shared_ptr<RunState>& state,
                   ExecutionContext& context, ResourceMonitor& monitor,
                   CancellationToken& token,
                   const std::atomic<bool>& cancelFlag) {
        std::optional<std::chrono::steady_clock::time_point> giveUpAt;
        std::unique_lock lock(state->mutex);
        while (!state->done) {
            auto now = std::chrono::steady_clock::now();
            if (giveUpAt && now >= *giveUpAt) {
                return false;
            }
            auto wake = now + options_.pollInterval;
            if (giveUpAt) {
                wake = std::min(wake, *giveUpAt);
            } else {
                wake = std::min(wake, std::max(monitor.deadline(), now));
            }
            state->cv.wait_until(lock, wake, [&] { return state->done; });
            if (state->done) {
                break;
            }
            lock.unlock();

            sampleMemory(context, monitor);
            if (monitor.isExpired()) {
                monitor.flag(LimitViolation::TimeoutExceeded);
            }
            if (cancelFlag.load()) {
                monitor.flag(LimitViolation::Cancelled);
            }
            if (monitor.violation()) {
                if (!giveUpAt) {
                    giveUpAt =
                        std::chrono::steady_clock::now() + options_.unwindGrace;
                }
                token.cancel();
                interrupt(state);
            }

            lock.lock();
        }
        return true;
    }

    void sampleMemory(ExecutionContext& context, ResourceMonitor& monitor) {
        if (auto bytes = options_.memoryProbe->sample()) {
            context.addMemorySample(*bytes);
            monitor.sampleMemory(*bytes);
        }
    }

    static ExecutionResult buildResult(const ExecutionContext& context,
                                       TimePoint createdAt) {
        ExecutionResult result;
        result.id = context.testId();
        result.projectId = context.projectId();
        result.versionId = context.versionId();
        result.createdAt = createdAt;
        result.completedAt = std::chrono::system_clock::now();
        result.logs = context.logs();
        result.apiCalls = context.apiCalls();
        result.apiCallCount = result.apiCalls.size();

        auto samples = context.memorySamples();
        result.peakMemoryBytes =
            samples.empty() ? 0 : *std::max_element(samples.begin(), samples.end());

        auto& metrics = result.performanceMetrics;
        metrics.memoryUsage = result.peakMemoryBytes;
        metrics.apiCallCount = result.apiCallCount;
        if (!result.apiCalls.empty()) {
            int64_t total = 0;
            for (const auto& call : result.apiCalls) {
                total += call.duration.count();
            }
            metrics.avgApiResponseTimeMs =
                static_cast<double>(total) /
                static_cast<double>(result.apiCalls.size());
        }
        return result;
    }

    ExecutionResult failedBeforeStart(const std::string& testId,
                                      const ExecutionRequest& request,
                                      TimePoint createdAt,
                                      std::string message) {
        log_->error("Test {} could not run: {}", testId, message);
        ExecutionResult result;
        result.id = testId;
        result.projectId = request.projectId;
        result.versionId = request.versionId;
        result.status = ExecutionStatus::Error;
        result.errors = {infrastructureError(std::move(message))};
        result.createdAt = createdAt;
        result.completedAt = std::chrono::system_clock::now();
        return result;
    }

    ExecutionResult cancelledBeforeStart(const std::string& testId,
                                         const ExecutionRequest& request,
                                         const ExecutionConfig& config,
                                         TimePoint createdAt) {
        log_->info("Test {} cancelled before it started", testId);
        ExecutionResult result;
        result.id = testId;
        result.projectId = request.projectId;
        result.versionId = request.versionId;
        result.status = ExecutionStatus::Error;
        ExecutionError error;
        error.kind = std::string(limitViolationToString(LimitViolation::Cancelled));
        error.message = limitMessage(LimitViolation::Cancelled, config, 0);
        result.errors = {std::move(error)};
        result.createdAt = createdAt;
        result.completedAt = std::chrono::system_clock::now();
        return result;
    }

    void record(const ExecutionResult& result) {
        std::lock_guard lock(mutex_);
        stats_.totalExecutions++;
        totalExecutionTimeMs_ += result.executionTimeMs;
        switch (result.status) {
            case ExecutionStatus::Passed: stats_.passed++; break;
            case ExecutionStatus::Failed: stats_.failed++; break;
            case ExecutionStatus::Error: stats_.errored++; break;
        }
        if (result.errors.empty()) {
            return;
        }
        const auto& kind = result.errors.front().kind;
        if (kind == limitViolationToString(LimitViolation::TimeoutExceeded)) {
            stats_.timeouts++;
        } else if (kind == limitViolationToString(LimitViolation::MemoryExceeded)) {
            stats_.memoryViolations++;
        } else if (kind ==
                   limitViolationToString(LimitViolation::ApiCallLimitExceeded)) {
            stats_.apiLimitViolations++;
        } else if (kind == limitViolationToString(LimitViolation::Cancelled)) {
            stats_.cancelled++;
        } else if (kind == error_kind::kSecurityViolation) {
            stats_.securityViolations++;
        }
    }

    void notify(const ExecutionResult& result) {
        std::vector<std::shared_ptr<ExecutionObserver>> observers;
        {
            std::lock_guard lock(mutex_);
            observers = observers_;
        }
        for (const auto& observer : observers) {
            try {
                observer->onExecutionResult(result);
            } catch (const std::exception& e) {
                log_->warn("Execution observer failed for {}: {}", result.id,
                           e.what());
            }
        }
    }

    EngineOptions options_;
    std::counting_semaphore<> slots_;
    std::shared_ptr<spdlog::logger> log_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> active_;
    std::vector<std::shared_ptr<ExecutionObserver>> observers_;
    EngineStats stats_;
    int64_t totalExecutionTimeMs_{0};
};

ExecutionEngine::ExecutionEngine(EngineOptions options)
    : pImpl_(std::make_shared<Impl>(std::move(options))) {}

ExecutionEngine::~ExecutionEngine() = default;

ExecutionResult ExecutionEngine::execute(const ExecutionRequest& request) {
    return pImpl_->execute(request);
}

std::future<ExecutionResult> ExecutionEngine::executeAsync(
    ExecutionRequest request) {
    return std::async(std::launch::async,
                      [impl = pImpl_, request = std::move(request)] {
                          return impl->execute(request);
                      });
}

bool ExecutionEngine::cancel(const std::string& testId) {
    return pImpl_->cancel(testId);
}

std::vector<std::string> ExecutionEngine::activeExecutions() const {
    return pImpl_->activeExecutions();
}

EngineStats ExecutionEngine::stats() const { return pImpl_->stats(); }

void ExecutionEngine::addObserver(std::shared_ptr<ExecutionObserver> observer) {
    pImpl_->addObserver(std::move(observer));
}

void ExecutionEngine::removeObserver(
    const std::shared_ptr<ExecutionObserver>& observer) {
    pImpl_->removeObserver(observer);
}

std::shared_ptr<MockApi> ExecutionEngine::mockApi() const {
    return pImpl_->mockApi();
}

const ExecutionConfig& ExecutionEngine::defaults() const {
    return pImpl_->defaults();
}

}  // namespace codepage::sandbox
