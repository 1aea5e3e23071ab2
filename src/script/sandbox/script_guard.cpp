/*
 * script_guard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "script_guard.hpp"

#include <array>

#include <pybind11/pybind11.h>
#include <spdlog/fmt/fmt.h>

namespace py = pybind11;

namespace codepage::sandbox {

namespace {

constexpr std::array<std::string_view, 18> kBlockedAttributes = {
    "format",   "format_map", "gi_frame", "gi_code",   "gi_yieldfrom",
    "cr_frame", "cr_code",    "ag_frame", "ag_code",   "f_globals",
    "f_locals", "f_builtins", "f_back",   "f_code",    "tb_frame",
    "tb_next",  "co_code",    "mro"};

// Special methods a script class may define; none of them can intercept an
// exception raised through the script.
constexpr std::array<std::string_view, 12> kAllowedSpecialMethods = {
    "__init__", "__repr__", "__str__", "__eq__",  "__ne__",   "__lt__",
    "__le__",   "__gt__",   "__ge__",  "__hash__", "__len__", "__contains__"};

ExecutionError violation(std::string message, const py::handle& node) {
    ExecutionError error;
    error.kind = std::string(error_kind::kSecurityViolation);
    error.message = std::move(message);
    if (py::hasattr(node, "lineno")) {
        error.lineNumber = node.attr("lineno").cast<int>();
        error.columnNumber = node.attr("col_offset").cast<int>() + 1;
    }
    return error;
}

}  // namespace

bool ScriptGuard::isBlockedFunctionName(std::string_view name) {
    if (!name.starts_with("__")) {
        return false;
    }
    for (auto allowed : kAllowedSpecialMethods) {
        if (name == allowed) {
            return false;
        }
    }
    return true;
}

bool ScriptGuard::isBlockedAttribute(std::string_view name) {
    if (name.starts_with("_")) {
        return true;
    }
    for (auto blocked : kBlockedAttributes) {
        if (name == blocked) {
            return true;
        }
    }
    return false;
}

std::expected<void, ExecutionError> ScriptGuard::check(
    std::string_view source) {
    if (source.size() > kMaxSourceBytes) {
        ExecutionError error;
        error.kind = std::string(error_kind::kSecurityViolation);
        error.message = fmt::format("script exceeds {} bytes", kMaxSourceBytes);
        return std::unexpected(std::move(error));
    }

    py::module_ ast = py::module_::import("ast");
    py::object tree;
    try {
        tree = ast.attr("parse")(py::str(source.data(), source.size()),
                                 "<codepage>", "exec");
    } catch (py::error_already_set& e) {
        if (!e.matches(PyExc_SyntaxError)) {
            throw;
        }
        ExecutionError error;
        error.kind = std::string(error_kind::kSyntaxError);
        py::object value = e.value();
        error.message = py::str(value.attr("msg")).cast<std::string>();
        if (!value.attr("lineno").is_none()) {
            error.lineNumber = value.attr("lineno").cast<int>();
        }
        if (!value.attr("offset").is_none()) {
            error.columnNumber = value.attr("offset").cast<int>();
        }
        return std::unexpected(std::move(error));
    }

    py::object importNode = ast.attr("Import");
    py::object importFromNode = ast.attr("ImportFrom");
    py::object nameNode = ast.attr("Name");
    py::object attributeNode = ast.attr("Attribute");
    py::object handlerNode = ast.attr("ExceptHandler");
    py::object functionNode = ast.attr("FunctionDef");
    py::object asyncFunctionNode = ast.attr("AsyncFunctionDef");
    py::object tryNode = ast.attr("Try");
    py::object jumpNodes = py::make_tuple(ast.attr("Continue"), ast.attr("Break"),
                                          ast.attr("Return"));
    py::object tryStarNode =
        py::hasattr(ast, "TryStar") ? ast.attr("TryStar") : tryNode;

    for (py::handle node : ast.attr("walk")(tree)) {
        if (py::isinstance(node, importNode) ||
            py::isinstance(node, importFromNode)) {
            return std::unexpected(
                violation("import statements are not allowed", node));
        }
        if (py::isinstance(node, nameNode)) {
            auto id = node.attr("id").cast<std::string>();
            if (id.starts_with("__")) {
                return std::unexpected(violation(
                    fmt::format("name '{}' is not allowed", id), node));
            }
        } else if (py::isinstance(node, attributeNode)) {
            auto attr = node.attr("attr").cast<std::string>();
            if (isBlockedAttribute(attr)) {
                return std::unexpected(violation(
                    fmt::format("attribute '{}' is not allowed", attr), node));
            }
        } else if (py::isinstance(node, handlerNode) &&
                   node.attr("type").is_none()) {
            return std::unexpected(
                violation("bare except clauses are not allowed", node));
        } else if (py::isinstance(node, functionNode) ||
                   py::isinstance(node, asyncFunctionNode)) {
            auto name = node.attr("name").cast<std::string>();
            if (isBlockedFunctionName(name)) {
                return std::unexpected(violation(
                    fmt::format("method '{}' is not allowed", name), node));
            }
        } else if (py::isinstance(node, tryNode) ||
                   py::isinstance(node, tryStarNode)) {
            // A jump out of a finally block discards the exception in flight
            for (py::handle statement : node.attr("finalbody")) {
                for (py::handle inner : ast.attr("walk")(statement)) {
                    if (PyObject_IsInstance(inner.ptr(), jumpNodes.ptr()) == 1) {
                        return std::unexpected(violation(
                            "continue, break and return are not allowed in a "
                            "finally block",
                            inner));
                    }
                }
            }
        }
    }
    return {};
}

}  // namespace codepage::sandbox
