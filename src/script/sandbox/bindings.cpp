/*
 * bindings.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "bindings.hpp"

#include <pybind11/embed.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numbers>
#include <random>

#include "exception/exception.hpp"
#include "json_bridge.hpp"
#include "utils/time_utils.hpp"

namespace codepage::sandbox {

namespace {

constexpr std::array<const char*, 44> kAllowedBuiltins = {
    "abs",          "all",           "any",
    "bool",         "chr",           "dict",
    "divmod",       "enumerate",     "filter",
    "float",        "int",           "isinstance",
    "len",          "list",          "map",
    "max",          "min",           "ord",
    "pow",          "range",         "repr",
    "reversed",     "round",         "set",
    "sorted",       "str",           "sum",
    "tuple",        "zip",           "__build_class__",
    "ArithmeticError", "AssertionError", "AttributeError",
    "Exception",    "IndexError",    "KeyError",
    "LookupError",  "NameError",     "NotImplementedError",
    "RuntimeError", "StopIteration", "TypeError",
    "ValueError",   "ZeroDivisionError"};

/**
 * @brief console.* writing into the run's log
 */
class ScriptConsole {
public:
    explicit ScriptConsole(std::shared_ptr<ExecutionContext> context)
        : context_(std::move(context)) {}

    void write(std::string_view level, const py::args& args,
               const py::kwargs& kwargs) {
        std::string sep = " ";
        if (kwargs.contains("sep") && !kwargs["sep"].is_none()) {
            sep = py::str(kwargs["sep"]).cast<std::string>();
        }
        std::string message;
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0) {
                message += sep;
            }
            message += bridge::describe(args[i]);
        }
        context_->addLog(formatLogLine(std::chrono::system_clock::now(),
                                       level, message));
    }

private:
    std::shared_ptr<ExecutionContext> context_;
};

struct JsonBinding {};
struct MathBinding {};
struct DateBinding {};

auto toParams(const py::object& params, const py::kwargs& kwargs) -> json {
    json merged = params.is_none() ? json::object() : bridge::toJson(params);
    if (!merged.is_object()) {
        throw py::type_error("API parameters must be a dict");
    }
    for (auto item : kwargs) {
        merged[item.first.cast<std::string>()] = bridge::toJson(item.second);
    }
    return merged;
}

template <json (MockApiSession::*Method)(const json&)>
auto apiMethod() {
    return [](MockApiSession& session, const py::object& params,
              const py::kwargs& kwargs) {
        json request = toParams(params, kwargs);
        json response;
        {
            py::gil_scoped_release release;
            response = (session.*Method)(request);
        }
        return bridge::fromJson(response);
    };
}

auto mathRandom() -> double {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return std::uniform_real_distribution<double>(0.0, 1.0)(engine);
}

auto numbers(const py::args& args) -> std::vector<double> {
    std::vector<double> values;
    for (auto arg : args) {
        values.push_back(arg.cast<double>());
    }
    return values;
}

}  // namespace

PYBIND11_EMBEDDED_MODULE(codepage_sandbox, m) {
    m.doc() = "Host bindings for sandboxed codepage scripts";

    py::register_exception<exception::ResourceLimitException>(
        m, "ResourceLimitExceeded", PyExc_BaseException);

    py::class_<ScriptConsole, std::shared_ptr<ScriptConsole>>(m, "Console")
        .def("log", [](ScriptConsole& c, const py::args& a,
                       const py::kwargs& k) { c.write("", a, k); })
        .def("info", [](ScriptConsole& c, const py::args& a,
                        const py::kwargs& k) { c.write("", a, k); })
        .def("warn", [](ScriptConsole& c, const py::args& a,
                        const py::kwargs& k) { c.write("WARN", a, k); })
        .def("error", [](ScriptConsole& c, const py::args& a,
                         const py::kwargs& k) { c.write("ERROR", a, k); });

    py::class_<MockApiSession, std::shared_ptr<MockApiSession>>(m, "Api")
        .def("query", apiMethod<&MockApiSession::query>(),
             py::arg("params") = py::none())
        .def("create", apiMethod<&MockApiSession::create>(),
             py::arg("params") = py::none())
        .def("update", apiMethod<&MockApiSession::update>(),
             py::arg("params") = py::none())
        .def("delete", apiMethod<&MockApiSession::remove>(),
             py::arg("params") = py::none())
        .def("get", apiMethod<&MockApiSession::get>(),
             py::arg("params") = py::none())
        .def("bulkCreate", apiMethod<&MockApiSession::bulkCreate>(),
             py::arg("params") = py::none());

    py::class_<JsonBinding>(m, "Json")
        .def("stringify",
             [](JsonBinding&, const py::object& value,
                const py::object& indent) {
                 int width = indent.is_none() ? -1 : indent.cast<int>();
                 return bridge::toJson(value).dump(
                     width, ' ', false, json::error_handler_t::replace);
             },
             py::arg("value"), py::arg("indent") = py::none())
        .def("parse", [](JsonBinding&, const std::string& text) {
            json parsed = json::parse(text, nullptr, false);
            if (parsed.is_discarded()) {
                throw py::value_error("invalid JSON text");
            }
            return bridge::fromJson(parsed);
        });

    py::class_<MathBinding>(m, "Math")
        .def_property_readonly("PI", [](MathBinding&) { return std::numbers::pi; })
        .def_property_readonly("E", [](MathBinding&) { return std::numbers::e; })
        .def("floor", [](MathBinding&, double x) { return std::floor(x); })
        .def("ceil", [](MathBinding&, double x) { return std::ceil(x); })
        .def("round", [](MathBinding&, double x) { return std::floor(x + 0.5); })
        .def("abs", [](MathBinding&, double x) { return std::fabs(x); })
        .def("sqrt", [](MathBinding&, double x) { return std::sqrt(x); })
        .def("pow", [](MathBinding&, double x, double y) { return std::pow(x, y); })
        .def("log", [](MathBinding&, double x) { return std::log(x); })
        .def("exp", [](MathBinding&, double x) { return std::exp(x); })
        .def("random", [](MathBinding&) { return mathRandom(); })
        .def("min", [](MathBinding&, const py::args& args) {
            auto values = numbers(args);
            return values.empty() ? std::numeric_limits<double>::infinity()
                                  : *std::min_element(values.begin(), values.end());
        })
        .def("max", [](MathBinding&, const py::args& args) {
            auto values = numbers(args);
            return values.empty() ? -std::numeric_limits<double>::infinity()
                                  : *std::max_element(values.begin(), values.end());
        });

    py::class_<DateBinding>(m, "Date")
        .def("now", [](DateBinding&) {
            return utils::toEpochMillis(std::chrono::system_clock::now());
        })
        .def("toISOString",
             [](DateBinding&, const py::object& millis) {
                 auto at = millis.is_none()
                               ? std::chrono::system_clock::now()
                               : utils::fromEpochMillis(millis.cast<int64_t>());
                 return utils::toIsoString(at);
             },
             py::arg("millis") = py::none());
}

py::object resourceLimitExceededType() {
    return py::module_::import(kBindingModule).attr("ResourceLimitExceeded");
}

py::dict buildGlobals(const RunBindings& bindings, const json& testData) {
    py::module_ module = py::module_::import(kBindingModule);
    py::module_ hostBuiltins = py::module_::import("builtins");

    auto console = std::make_shared<ScriptConsole>(bindings.context);
    py::object consoleObject = py::cast(console);

    py::dict builtins;
    for (const char* name : kAllowedBuiltins) {
        builtins[name] = hostBuiltins.attr(name);
    }
    builtins["print"] = consoleObject.attr("log");

    std::weak_ptr<ResourceMonitor> monitor = bindings.monitor;
    py::cpp_function usage([monitor]() {
        py::dict snapshot;
        if (auto m = monitor.lock()) {
            auto current = m->usage();
            snapshot["memoryUsage"] = current.memoryUsage;
            snapshot["apiCallCount"] = current.apiCallCount;
            snapshot["executionTime"] = current.executionTimeMs;
        }
        return snapshot;
    });

    py::dict globals;
    globals["__builtins__"] = builtins;
    globals["__name__"] = "codepage";
    globals["console"] = consoleObject;
    globals["api"] = py::cast(bindings.api);
    globals["JSON"] = module.attr("Json")();
    globals["Math"] = module.attr("Math")();
    globals["Date"] = module.attr("Date")();
    globals["getResourceUsage"] = usage;
    globals["testData"] = bridge::fromJson(testData);
    return globals;
}

}  // namespace codepage::sandbox
