/*
 * bindings.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file bindings.hpp
 * @brief Host objects injected into a script's global namespace
 */

#ifndef CODEPAGE_SCRIPT_SANDBOX_BINDINGS_HPP
#define CODEPAGE_SCRIPT_SANDBOX_BINDINGS_HPP

#include <pybind11/pybind11.h>

#include <memory>

#include "mock_api.hpp"
#include "resource_monitor.hpp"
#include "types.hpp"

namespace py = pybind11;

namespace codepage::sandbox {

/**
 * @brief Name of the embedded module holding the binding types
 */
inline constexpr const char* kBindingModule = "codepage_sandbox";

/**
 * @brief Everything the bindings of one run refer to
 */
struct RunBindings {
    std::shared_ptr<ExecutionContext> context;
    std::shared_ptr<ResourceMonitor> monitor;
    std::shared_ptr<MockApiSession> api;
};

/**
 * @brief Build the global namespace of one run
 *
 * Holds console, api, JSON, Math, Date, getResourceUsage and testData plus
 * a whitelisted __builtins__ in which print writes to the console. Requires
 * the GIL.
 */
[[nodiscard]] py::dict buildGlobals(const RunBindings& bindings,
                                    const json& testData);

/**
 * @brief The BaseException subclass raised into a script that crossed a
 * limit. Requires the GIL.
 */
[[nodiscard]] py::object resourceLimitExceededType();

}  // namespace codepage::sandbox

#endif  // CODEPAGE_SCRIPT_SANDBOX_BINDINGS_HPP
