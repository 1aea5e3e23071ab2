/*
 * python_runtime.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_SCRIPT_SANDBOX_PYTHON_RUNTIME_HPP
#define CODEPAGE_SCRIPT_SANDBOX_PYTHON_RUNTIME_HPP

#include <pybind11/embed.h>

#include <memory>

namespace py = pybind11;

namespace codepage::sandbox {

/**
 * @brief Owns the embedded interpreter for the lifetime of the process
 *
 * Construct once on the main thread before any ExecutionEngine runs a
 * script. The constructing thread gives up the GIL so worker threads can
 * take it; destruction reacquires it and finalizes the interpreter.
 */
class PythonRuntime {
public:
    PythonRuntime();
    ~PythonRuntime();

    PythonRuntime(const PythonRuntime&) = delete;
    PythonRuntime& operator=(const PythonRuntime&) = delete;

    [[nodiscard]] static bool isInitialized();

private:
    std::unique_ptr<py::scoped_interpreter> interpreter_;
    std::unique_ptr<py::gil_scoped_release> release_;
};

}  // namespace codepage::sandbox

#endif  // CODEPAGE_SCRIPT_SANDBOX_PYTHON_RUNTIME_HPP
