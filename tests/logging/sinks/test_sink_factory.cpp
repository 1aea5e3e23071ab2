/*
 * test_sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Tests for SinkFactory

**************************************************/

#include <gtest/gtest.h>

#include "logging/sinks/sink_factory.hpp"

#include <spdlog/sinks/sink.h>

#include <filesystem>

using namespace codepage::logging;
namespace fs = std::filesystem;

class SinkFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "codepage_sink_factory_test";
        fs::remove_all(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

TEST_F(SinkFactoryTest, CreatesConsoleSink) {
    SinkConfig config;
    config.type = "console";
    config.level = spdlog::level::warn;
    auto sink = SinkFactory::createSink(config);
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::warn);
}

TEST_F(SinkFactoryTest, CreatesFileSinkAndDirectory) {
    SinkConfig config;
    config.name = "file";
    config.type = "file";
    config.file_path = (dir_ / "nested" / "codepage.log").string();

    auto sink = SinkFactory::createSink(config);
    ASSERT_NE(sink, nullptr);
    EXPECT_TRUE(fs::exists(dir_ / "nested"));
}

TEST_F(SinkFactoryTest, CreatesRotatingFileSink) {
    auto sink = SinkFactory::createRotatingFileSink(
        (dir_ / "rotating.log").string(), 1024 * 1024, 3);
    ASSERT_NE(sink, nullptr);
}

TEST_F(SinkFactoryTest, UnknownTypeGivesNull) {
    SinkConfig config;
    config.type = "syslog-over-carrier-pigeon";
    EXPECT_EQ(SinkFactory::createSink(config), nullptr);
}
