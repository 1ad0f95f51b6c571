// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include "version.hpp"
#include <CLI/CLI.hpp>
#include <iostream>

namespace telegen {

CliConfig parse_cli_args(int argc, char* argv[]) {
    CliConfig config;

    CLI::App app{"Telegraf OPC UA config generator v" + std::string(SERVICE_VERSION) + " (" +
                 GIT_COMMIT + ")"};
    app.set_version_flag("--version", std::string(SERVICE_NAME) + " " + SERVICE_VERSION);

    // Bootstrap options for Generate mode
    app.add_option("-c,--config", config.config_path, "Path to JSON configuration file")
        ->check(CLI::ExistingFile);

    app.add_option("-s,--schema", config.schema_path, "Path to JSON schema for configuration")
        ->check(CLI::ExistingFile);

    // Topic check subcommand (no config needed)
    auto check_cmd =
        app.add_subcommand("check-topic", "Validate an MQTT topic and show its sanitized form");
    check_cmd->add_option("topic", config.topic, "Topic name to check")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Determine mode
    if (check_cmd->parsed()) {
        config.mode = CliConfig::Mode::CheckTopic;
    } else {
        config.mode = CliConfig::Mode::Generate;
        // Require config and schema files in Generate mode
        if (config.config_path.empty()) {
            std::cerr << "Error: --config is required in generate mode\n";
            std::exit(1);
        }
        if (config.schema_path.empty()) {
            std::cerr << "Error: --schema is required in generate mode\n";
            std::exit(1);
        }
    }

    return config;
}

} // namespace telegen
