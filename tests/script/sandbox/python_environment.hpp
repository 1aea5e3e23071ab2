/*
 * python_environment.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_TESTS_PYTHON_ENVIRONMENT_HPP
#define CODEPAGE_TESTS_PYTHON_ENVIRONMENT_HPP

#include <gtest/gtest.h>

#include <memory>

#include "script/sandbox/python_runtime.hpp"

namespace codepage::test {

/**
 * @brief Owns the embedded interpreter for a whole test executable
 */
class PythonEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        runtime_ = std::make_unique<sandbox::PythonRuntime>();
    }
    void TearDown() override { runtime_.reset(); }

private:
    std::unique_ptr<sandbox::PythonRuntime> runtime_;
};

}  // namespace codepage::test

#endif  // CODEPAGE_TESTS_PYTHON_ENVIRONMENT_HPP
