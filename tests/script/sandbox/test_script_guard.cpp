/*
 * test_script_guard.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_script_guard.cpp
 * @brief Static rejection of scripts before they reach the interpreter
 */

#include <gtest/gtest.h>

#include <pybind11/embed.h>

#include "script/sandbox/script_guard.hpp"

namespace py = pybind11;
using namespace codepage::sandbox;

class ScriptGuardTest : public ::testing::Test {
protected:
    std::expected<void, ExecutionError> check(std::string_view source) {
        py::gil_scoped_acquire gil;
        return ScriptGuard::check(source);
    }

    void expectViolation(std::string_view source) {
        auto result = check(source);
        ASSERT_FALSE(result.has_value()) << source;
        EXPECT_EQ(result.error().kind, error_kind::kSecurityViolation)
            << source;
    }
};

TEST_F(ScriptGuardTest, AcceptsOrdinaryScript) {
    auto result = check(R"(
class Quote:
    def total(self, items):
        return sum(item["price"] for item in items)

vehicles = api.query({"tableId": "vehicles"})["data"]
try:
    total = Quote().total(vehicles)
except KeyError as e:
    console.error("missing price", e)
assert total > 0, f"total was {total}"
)");
    EXPECT_TRUE(result.has_value());
}

TEST_F(ScriptGuardTest, RejectsImports) {
    expectViolation("import os");
    expectViolation("from subprocess import run");
}

TEST_F(ScriptGuardTest, RejectsDunderNames) {
    expectViolation("__import__('os')");
    expectViolation("x = __builtins__");
}

TEST_F(ScriptGuardTest, RejectsIntrospectionAttributes) {
    expectViolation("x = ().__class__");
    expectViolation("x = obj._private");
    expectViolation("x = gen.gi_frame");
    expectViolation("x = '{0.x}'.format(obj)");
}

TEST_F(ScriptGuardTest, RejectsBareExcept) {
    expectViolation("try:\n    x = 1\nexcept:\n    pass\n");
}

TEST_F(ScriptGuardTest, RejectsJumpsOutOfFinally) {
    expectViolation(R"(
while True:
    try:
        while True:
            pass
    finally:
        continue
)");
    expectViolation("for i in range(3):\n    try:\n        x = i\n"
                    "    finally:\n        break\n");
    expectViolation("def f():\n    try:\n        return 1\n"
                    "    finally:\n        return 2\n");
}

TEST_F(ScriptGuardTest, AcceptsFinallyWithoutJumps) {
    auto result = check(R"(
done = False
try:
    x = 1
finally:
    done = True
    if x > 0:
        raise ValueError("after cleanup")
)");
    EXPECT_TRUE(result.has_value());
}

TEST_F(ScriptGuardTest, RejectsExceptionSwallowingSpecialMethods) {
    expectViolation(R"(
class Quiet:
    def __enter__(self):
        return self
    def __exit__(self, *args):
        return True
)");
    expectViolation("class C:\n    def __del__(self):\n        pass\n");
}

TEST_F(ScriptGuardTest, ViolationCarriesLocation) {
    auto result = check("x = 1\ny = 2\nimport os\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().lineNumber, 3);
    EXPECT_EQ(result.error().columnNumber, 1);
}

TEST_F(ScriptGuardTest, SyntaxErrorIsReported) {
    auto result = check("x = (1,\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kSyntaxError);
    EXPECT_TRUE(result.error().lineNumber.has_value());
}

TEST_F(ScriptGuardTest, RejectsOversizedSource) {
    std::string source(ScriptGuard::kMaxSourceBytes + 1, '#');
    auto result = check(source);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, error_kind::kSecurityViolation);
}

TEST(ScriptGuardAttributeTest, BlockedAttributes) {
    EXPECT_TRUE(ScriptGuard::isBlockedAttribute("__globals__"));
    EXPECT_TRUE(ScriptGuard::isBlockedAttribute("_x"));
    EXPECT_TRUE(ScriptGuard::isBlockedAttribute("f_back"));
    EXPECT_TRUE(ScriptGuard::isBlockedAttribute("mro"));
    EXPECT_FALSE(ScriptGuard::isBlockedAttribute("append"));
    EXPECT_FALSE(ScriptGuard::isBlockedAttribute("items"));
}

TEST(ScriptGuardAttributeTest, BlockedFunctionNames) {
    EXPECT_TRUE(ScriptGuard::isBlockedFunctionName("__exit__"));
    EXPECT_TRUE(ScriptGuard::isBlockedFunctionName("__getattr__"));
    EXPECT_FALSE(ScriptGuard::isBlockedFunctionName("__init__"));
    EXPECT_FALSE(ScriptGuard::isBlockedFunctionName("__repr__"));
    EXPECT_FALSE(ScriptGuard::isBlockedFunctionName("total"));
    EXPECT_FALSE(ScriptGuard::isBlockedFunctionName("_helper"));
}
