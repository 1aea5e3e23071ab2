/*
 * python_runtime.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "python_runtime.hpp"

#include "exception/exception.hpp"
#include "logging/logging_manager.hpp"

namespace codepage::sandbox {

PythonRuntime::PythonRuntime() {
    auto log = logging::logger("sandbox");
    if (Py_IsInitialized()) {
        CODEPAGE_THROW_INFRASTRUCTURE(
            "Python interpreter is already initialized in this process");
    }
    interpreter_ = std::make_unique<py::scoped_interpreter>(false);
    {
        py::module_ sys = py::module_::import("sys");
        // Keeps the async exception used for limit enforcement responsive
        sys.attr("setswitchinterval")(0.001);
        log->info("Embedded Python {} initialized",
                  sys.attr("version").cast<std::string>());
    }
    release_ = std::make_unique<py::gil_scoped_release>();
}

PythonRuntime::~PythonRuntime() {
    release_.reset();
    interpreter_.reset();
    logging::logger("sandbox")->info("Embedded Python finalized");
}

bool PythonRuntime::isInitialized() { return Py_IsInitialized() != 0; }

}  // namespace codepage::sandbox
