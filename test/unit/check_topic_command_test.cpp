// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "check_topic_command.hpp"

#include <sstream>

namespace telegen {
namespace {

using ::testing::HasSubstr;

TEST(CheckTopicCommandTest, ValidTopic) {
    std::ostringstream out;

    EXPECT_EQ(run_check_topic_command("$SYS/broker/load", out), 0);
    EXPECT_EQ(out.str(), "topic: $SYS/broker/load\n"
                         "valid: true\n"
                         "violation: none\n"
                         "sanitized: $SYS/broker/load\n"
                         "sanitized_valid: true\n"
                         "sanitized_violation: none\n");
}

TEST(CheckTopicCommandTest, SanitizableTopic) {
    std::ostringstream out;

    EXPECT_EQ(run_check_topic_command("telegraf/opcua/Temp#1", out), 1);
    EXPECT_THAT(out.str(), HasSubstr("valid: false\n"));
    EXPECT_THAT(out.str(), HasSubstr("violation: excluded_character\n"));
    EXPECT_THAT(out.str(), HasSubstr("sanitized: telegraf/opcua/Temp_1\n"));
    EXPECT_THAT(out.str(), HasSubstr("sanitized_valid: true\n"));
}

TEST(CheckTopicCommandTest, IllegalDollarPrefix) {
    std::ostringstream out;

    EXPECT_EQ(run_check_topic_command("$custom", out), 1);
    EXPECT_THAT(out.str(), HasSubstr("violation: illegal_dollar_prefix\n"));
    EXPECT_THAT(out.str(), HasSubstr("sanitized: _custom\n"));
}

TEST(CheckTopicCommandTest, TopicThatStaysInvalid) {
    std::ostringstream out;

    EXPECT_EQ(run_check_topic_command(std::string(300, 'a'), out), 1);
    EXPECT_THAT(out.str(), HasSubstr("violation: too_long\n"));
    EXPECT_THAT(out.str(), HasSubstr("sanitized_valid: false\n"));
    EXPECT_THAT(out.str(), HasSubstr("sanitized_violation: too_long\n"));
}

} // namespace
} // namespace telegen
