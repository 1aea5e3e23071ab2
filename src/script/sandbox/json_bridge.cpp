/*
 * json_bridge.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "json_bridge.hpp"

#include <cmath>

namespace codepage::sandbox::bridge {

namespace {

constexpr int kMaxDepth = 100;

json convert(py::handle value, bool lenient, int depth) {
    if (depth > kMaxDepth) {
        throw py::value_error("structure is nested too deeply");
    }
    if (value.is_none()) {
        return nullptr;
    }
    if (py::isinstance<py::bool_>(value)) {
        return value.cast<bool>();
    }
    if (py::isinstance<py::int_>(value)) {
        try {
            return value.cast<int64_t>();
        } catch (const py::cast_error&) {
            return value.cast<double>();
        }
    }
    if (py::isinstance<py::float_>(value)) {
        double d = value.cast<double>();
        return std::isfinite(d) ? json(d) : json(nullptr);
    }
    if (py::isinstance<py::str>(value)) {
        return value.cast<std::string>();
    }
    if (py::isinstance<py::dict>(value)) {
        json obj = json::object();
        for (auto item : py::reinterpret_borrow<py::dict>(value)) {
            std::string key = py::isinstance<py::str>(item.first)
                                  ? item.first.cast<std::string>()
                                  : py::str(item.first).cast<std::string>();
            obj[key] = convert(item.second, lenient, depth + 1);
        }
        return obj;
    }
    if (py::isinstance<py::list>(value) || py::isinstance<py::tuple>(value)) {
        json arr = json::array();
        for (auto item : value) {
            arr.push_back(convert(item, lenient, depth + 1));
        }
        return arr;
    }
    if (lenient) {
        return py::str(value).cast<std::string>();
    }
    throw py::type_error("value is not JSON serializable: " +
                         py::str(py::type::of(value).attr("__name__"))
                             .cast<std::string>());
}

}  // namespace

json toJson(py::handle value, bool lenient) {
    return convert(value, lenient, 0);
}

py::object fromJson(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return py::none();
        case json::value_t::boolean:
            return py::bool_(value.get<bool>());
        case json::value_t::number_integer:
            return py::int_(value.get<int64_t>());
        case json::value_t::number_unsigned:
            return py::int_(value.get<uint64_t>());
        case json::value_t::number_float:
            return py::float_(value.get<double>());
        case json::value_t::string:
            return py::str(value.get_ref<const std::string&>());
        case json::value_t::array: {
            py::list list;
            for (const auto& item : value) {
                list.append(fromJson(item));
            }
            return list;
        }
        case json::value_t::object: {
            py::dict dict;
            for (const auto& [key, item] : value.items()) {
                dict[py::str(key)] = fromJson(item);
            }
            return dict;
        }
        default:
            return py::none();
    }
}

std::string describe(py::handle value) {
    if (py::isinstance<py::dict>(value) || py::isinstance<py::list>(value) ||
        py::isinstance<py::tuple>(value)) {
        return toJson(value, true).dump(-1, ' ', false,
                                        json::error_handler_t::replace);
    }
    return py::str(value).cast<std::string>();
}

}  // namespace codepage::sandbox::bridge
