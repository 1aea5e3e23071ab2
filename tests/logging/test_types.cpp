/*
 * test_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "logging/types.hpp"

using namespace codepage::logging;

TEST(LoggingTypesTest, LevelStringRoundTrip) {
    EXPECT_EQ(levelFromString("debug"), spdlog::level::debug);
    EXPECT_EQ(levelFromString("warning"), spdlog::level::warn);
    EXPECT_EQ(levelFromString("fatal"), spdlog::level::critical);
    EXPECT_EQ(levelToString(spdlog::level::err), "error");
}

TEST(LoggingTypesTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(levelFromString("loud"), spdlog::level::info);
}

TEST(LoggingTypesTest, SinkConfigFromJson) {
    auto sink = SinkConfig::fromJson({{"name", "file"},
                                      {"type", "rotating_file"},
                                      {"level", "warn"},
                                      {"file_path", "logs/a.log"},
                                      {"max_files", 2}});
    EXPECT_EQ(sink.type, "rotating_file");
    EXPECT_EQ(sink.level, spdlog::level::warn);
    EXPECT_EQ(sink.max_files, 2u);
    EXPECT_EQ(sink.max_file_size, 10u * 1024 * 1024);

    auto j = sink.toJson();
    EXPECT_EQ(j["file_path"], "logs/a.log");
    EXPECT_EQ(j["max_files"], 2);
}

TEST(LoggingTypesTest, LoggingConfigFromJson) {
    auto config = LoggingConfig::fromJson(
        {{"default_level", "debug"},
         {"ring_buffer_size", 50},
         {"sinks", {{{"name", "console"}, {"type", "console"}}}}});
    EXPECT_EQ(config.default_level, spdlog::level::debug);
    EXPECT_EQ(config.ring_buffer_size, 50u);
    ASSERT_EQ(config.sinks.size(), 1u);
    EXPECT_EQ(config.sinks[0].type, "console");
}

TEST(LoggingTypesTest, LogEntryToJson) {
    LogEntry entry;
    entry.level = spdlog::level::err;
    entry.logger_name = "storage";
    entry.message = "write failed";
    auto j = entry.toJson();
    EXPECT_EQ(j["level"], "error");
    EXPECT_EQ(j["logger"], "storage");
    EXPECT_TRUE(j.contains("timestamp"));
}
