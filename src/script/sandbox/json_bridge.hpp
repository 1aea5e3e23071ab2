/*
 * json_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_SCRIPT_SANDBOX_JSON_BRIDGE_HPP
#define CODEPAGE_SCRIPT_SANDBOX_JSON_BRIDGE_HPP

#include <pybind11/pybind11.h>

#include <string>

#include "types.hpp"

namespace py = pybind11;

namespace codepage::sandbox::bridge {

/**
 * @brief Convert a Python value to JSON
 *
 * Accepts None, bool, int, float, str, dict, list and tuple. Other objects
 * raise TypeError unless lenient is set, in which case their str() is used.
 * Nesting deeper than 100 levels raises ValueError. Must hold the GIL.
 */
[[nodiscard]] json toJson(py::handle value, bool lenient = false);

/**
 * @brief Convert JSON to plain Python objects (dict, list, str, ...)
 */
[[nodiscard]] py::object fromJson(const json& value);

/**
 * @brief Text of one console argument: str for scalars, compact JSON for
 * containers
 */
[[nodiscard]] std::string describe(py::handle value);

}  // namespace codepage::sandbox::bridge

#endif  // CODEPAGE_SCRIPT_SANDBOX_JSON_BRIDGE_HPP
