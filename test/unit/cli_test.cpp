// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <vector>

namespace telegen {
namespace {

/**
 * @brief Helper to convert string vector to argc/argv format.
 */
class ArgvHelper {
public:
    ArgvHelper(const std::vector<std::string>& args) : args_(args) {
        argv_.reserve(args_.size());
        for (auto& arg : args_) {
            argv_.push_back(arg.data());
        }
    }

    int argc() const { return static_cast<int>(argv_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> args_;
    std::vector<char*> argv_;
};

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content = "{}") {
        path_ = std::filesystem::temp_directory_path() /
                ("telegen_cli_test_" + std::to_string(counter_++) + ".json");
        std::ofstream ofs(path_);
        ofs << content;
    }

    ~TempFile() { std::filesystem::remove(path_); }

    std::string path_str() const { return path_.string(); }

private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

//
// Generate mode tests
//

TEST(CliTest, GenerateModeWithConfigAndSchema) {
    TempFile config_file;
    TempFile schema_file;
    ArgvHelper helper(
        {"telegen", "--config", config_file.path_str(), "--schema", schema_file.path_str()});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::Generate);
    EXPECT_EQ(config.config_path.string(), config_file.path_str());
    EXPECT_EQ(config.schema_path.string(), schema_file.path_str());
    EXPECT_TRUE(config.topic.empty());
}

TEST(CliTest, GenerateModeWithShortOptions) {
    TempFile config_file;
    TempFile schema_file;
    ArgvHelper helper({"telegen", "-c", config_file.path_str(), "-s", schema_file.path_str()});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::Generate);
    EXPECT_EQ(config.config_path.string(), config_file.path_str());
    EXPECT_EQ(config.schema_path.string(), schema_file.path_str());
}

TEST(CliTest, GenerateModeWithoutConfigExits) {
    TempFile schema_file;
    ArgvHelper helper({"telegen", "--schema", schema_file.path_str()});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1),
                "--config is required");
}

TEST(CliTest, GenerateModeWithoutSchemaExits) {
    TempFile config_file;
    ArgvHelper helper({"telegen", "--config", config_file.path_str()});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1),
                "--schema is required");
}

TEST(CliTest, GenerateModeWithoutArgsExits) {
    ArgvHelper helper({"telegen"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(1), "");
}

TEST(CliTest, GenerateModeWithNonExistentConfigExits) {
    TempFile schema_file;
    ArgvHelper helper(
        {"telegen", "--config", "/nonexistent/config.json", "--schema", schema_file.path_str()});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(105), "");
}

//
// check-topic subcommand tests
//

TEST(CliTest, CheckTopicSubcommand) {
    ArgvHelper helper({"telegen", "check-topic", "telegraf/opcua/Temp#1"});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::CheckTopic);
    EXPECT_EQ(config.topic, "telegraf/opcua/Temp#1");
}

TEST(CliTest, CheckTopicAcceptsReservedPrefix) {
    ArgvHelper helper({"telegen", "check-topic", "$SYS/broker/load"});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.topic, "$SYS/broker/load");
}

TEST(CliTest, CheckTopicAcceptsEmptyTopic) {
    ArgvHelper helper({"telegen", "check-topic", ""});
    auto config = parse_cli_args(helper.argc(), helper.argv());

    EXPECT_EQ(config.mode, CliConfig::Mode::CheckTopic);
    EXPECT_TRUE(config.topic.empty());
}

TEST(CliTest, CheckTopicDoesNotRequireConfigOrSchema) {
    ArgvHelper helper({"telegen", "check-topic", "a/b"});
    // Should not exit, config/schema are not required for check-topic mode
    auto config = parse_cli_args(helper.argc(), helper.argv());
    EXPECT_EQ(config.mode, CliConfig::Mode::CheckTopic);
    EXPECT_TRUE(config.config_path.empty());
    EXPECT_TRUE(config.schema_path.empty());
}

TEST(CliTest, CheckTopicWithoutTopicExits) {
    ArgvHelper helper({"telegen", "check-topic"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(106), "");
}

//
// General CLI tests
//

TEST(CliTest, HelpFlag) {
    ArgvHelper helper({"telegen", "--help"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(0), "");
}

TEST(CliTest, CheckTopicHelpFlag) {
    ArgvHelper helper({"telegen", "check-topic", "--help"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(0), "");
}

TEST(CliTest, VersionFlag) {
    ArgvHelper helper({"telegen", "--version"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(0), "");
}

TEST(CliTest, InvalidOption) {
    ArgvHelper helper({"telegen", "--invalid-option"});
    EXPECT_EXIT(parse_cli_args(helper.argc(), helper.argv()), ::testing::ExitedWithCode(109), "");
}

} // namespace
} // namespace telegen
