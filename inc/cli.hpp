// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

namespace telegen {

/**
 * @brief Command-line interface configuration for bootstrap.
 *
 * Contains only bootstrap options needed before config file loading.
 * Generator configuration comes from JSON config file (see config_loader.hpp).
 */
struct CliConfig {
    enum class Mode {
        Generate,  ///< Generate the Telegraf configuration
        CheckTopic ///< Validate and sanitize a single topic
    };

    Mode mode = Mode::Generate;

    /// Path to JSON config file (required in Generate mode)
    std::filesystem::path config_path;

    /// Path to JSON schema file (required in Generate mode)
    std::filesystem::path schema_path;

    /// Topic to inspect (CheckTopic mode)
    std::string topic;
};

/**
 * @brief Parse command-line arguments and configure application.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return CliConfig Parsed configuration
 *
 * @note Exits the process on --help, --version, parse errors, or missing
 *       config/schema options in Generate mode.
 */
CliConfig parse_cli_args(int argc, char* argv[]);

} // namespace telegen
