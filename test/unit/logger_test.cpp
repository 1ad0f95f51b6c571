// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "logger.hpp"
#include "version.hpp"

#include <rapidjson/document.h>

#include <stdexcept>

namespace telegen {
namespace {

// Parse the JSON context that follows the message
rapidjson::Document context_of(const std::string& rendered, const std::string& message) {
    EXPECT_EQ(rendered.rfind(message + " ", 0), 0u) << rendered;
    rapidjson::Document doc;
    doc.Parse(rendered.substr(message.size() + 1).c_str());
    EXPECT_FALSE(doc.HasParseError()) << rendered;
    return doc;
}

TEST(LogEntryTest, MessageOnlyHasNoContext) {
    EXPECT_EQ(LogEntry("Starting").render(), "Starting");
}

TEST(LogEntryTest, RendersComponentAndOperation) {
    auto doc = context_of(LogEntry("Loaded").component("source").operation("load").render(),
                          "Loaded");

    ASSERT_TRUE(doc.IsObject());
    EXPECT_STREQ(doc["component"].GetString(), "source");
    EXPECT_STREQ(doc["operation"].GetString(), "load");
    EXPECT_FALSE(doc.HasMember("topic"));
}

TEST(LogEntryTest, RendersTopicContext) {
    auto doc = context_of(LogEntry("Topic sanitized")
                              .component("catalog")
                              .topic({.topic = "a/#",
                                      .sanitized = "a/_",
                                      .violation = "excluded_character"})
                              .render(),
                          "Topic sanitized");

    ASSERT_TRUE(doc.HasMember("topic"));
    const auto& topic = doc["topic"];
    EXPECT_STREQ(topic["name"].GetString(), "a/#");
    EXPECT_STREQ(topic["sanitized"].GetString(), "a/_");
    EXPECT_STREQ(topic["violation"].GetString(), "excluded_character");
}

TEST(LogEntryTest, RendersRecordContextWithoutUnsetFields) {
    auto doc = context_of(
        LogEntry("Skipped").record({.row = 7, .node_id = "ns=2;s=x"}).render(), "Skipped");

    const auto& record = doc["record"];
    EXPECT_EQ(record["row"].GetUint64(), 7u);
    EXPECT_STREQ(record["node_id"].GetString(), "ns=2;s=x");
    EXPECT_FALSE(record.HasMember("custom_name"));
}

TEST(LogEntryTest, RendersErrorContext) {
    auto doc = context_of(
        LogEntry("Failed").error({.type = "io_error", .message = "disk \"full\""}).render(),
        "Failed");

    EXPECT_STREQ(doc["error"]["type"].GetString(), "io_error");
    EXPECT_STREQ(doc["error"]["message"].GetString(), "disk \"full\"");
}

//
// Level parsing
//

TEST(LoggerTest, ParsesLevels) {
    EXPECT_EQ(Logger::parse_level("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parse_level("info"), spdlog::level::info);
    EXPECT_EQ(Logger::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parse_level("warning"), spdlog::level::warn);
    EXPECT_EQ(Logger::parse_level("error"), spdlog::level::err);
}

TEST(LoggerTest, RejectsUnknownLevel) {
    EXPECT_THROW(Logger::parse_level("verbose"), std::runtime_error);
    EXPECT_THROW(Logger::parse_level("INFO"), std::runtime_error);
    EXPECT_THROW(Logger::parse_level(""), std::runtime_error);
}

TEST(LoggerTest, InitInstallsDefaultLogger) {
    Logger::init("debug");
    EXPECT_EQ(spdlog::default_logger()->name(), SERVICE_NAME);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);

    // Reinitializing replaces the logger instead of failing on the duplicate name
    Logger::init("error");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);
}

TEST(LoggerTest, InitRejectsUnknownLevel) {
    EXPECT_THROW(Logger::init("loud"), std::runtime_error);
}

} // namespace
} // namespace telegen
