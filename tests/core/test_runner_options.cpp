/*
 * test_runner_options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/runner_options.hpp"

using namespace codepage::core;

namespace {

auto parse(std::vector<std::string> args) -> RunnerOptions {
    args.insert(args.begin(), "codepage-runner");
    return parseRunnerOptions(args);
}

}  // namespace

TEST(RunnerOptionsTest, ParsesEveryOption) {
    auto options = parse({"--script", "login.py", "--data", "users.json",
                          "--config", "codepage.yaml", "--project", "shop",
                          "--version", "v2", "--timeout", "1500", "--report"});
    EXPECT_EQ(options.script, "login.py");
    ASSERT_TRUE(options.data.has_value());
    EXPECT_EQ(*options.data, "users.json");
    ASSERT_TRUE(options.config.has_value());
    EXPECT_EQ(*options.config, "codepage.yaml");
    EXPECT_EQ(options.projectId, "shop");
    EXPECT_EQ(options.versionId, "v2");
    ASSERT_TRUE(options.timeoutMs.has_value());
    EXPECT_EQ(*options.timeoutMs, 1500u);
    EXPECT_TRUE(options.report);
}

TEST(RunnerOptionsTest, OptionalArgumentsKeepDefaults) {
    auto options = parse({"--script", "login.py"});
    EXPECT_EQ(options.script, "login.py");
    EXPECT_FALSE(options.data.has_value());
    EXPECT_FALSE(options.config.has_value());
    EXPECT_EQ(options.projectId, "local");
    EXPECT_EQ(options.versionId, "current");
    EXPECT_FALSE(options.timeoutMs.has_value());
    EXPECT_FALSE(options.report);
}

TEST(RunnerOptionsTest, MissingScriptIsUsageError) {
    EXPECT_THROW(parse({"--project", "shop"}), UsageError);
}

TEST(RunnerOptionsTest, NonPositiveTimeoutIsUsageError) {
    EXPECT_THROW(parse({"--script", "a.py", "--timeout", "0"}), UsageError);
}
