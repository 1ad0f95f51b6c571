// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <cstdlib>
#include <exception>
#include <iostream>

#include "check_topic_command.hpp"
#include "cli.hpp"
#include "config_loader.hpp"
#include "generator.hpp"
#include "logger.hpp"
#include "node_source.hpp"
#include "version.hpp"

int main(int argc, char* argv[]) {
    // Parse command-line arguments (bootstrap only)
    auto cli_config = telegen::parse_cli_args(argc, argv);

    // Handle check-topic subcommand (skip config loading)
    if (cli_config.mode == telegen::CliConfig::Mode::CheckTopic) {
        return telegen::run_check_topic_command(cli_config.topic, std::cout);
    }

    // Load and validate generator configuration from JSON file
    telegen::ServiceConfig config;
    try {
        config = telegen::load_config(cli_config.config_path, cli_config.schema_path);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    telegen::Logger::init(config.log_level);

    LOG_INFO("{} {} ({}) starting", telegen::SERVICE_NAME, telegen::SERVICE_VERSION,
             telegen::GIT_COMMIT);
    LOG_INFO("Log level: {}", config.log_level);
    LOG_INFO("CSV file: {}", config.csv_path.string());
    LOG_INFO("Output file: {}", config.output_path.string());
    LOG_INFO("MQTT broker: {}", config.telegraf.mqtt.broker);
    LOG_INFO("OPC UA endpoint: {}", config.telegraf.opcua_endpoint);
    LOG_INFO("InfluxDB URL: {}", config.telegraf.influxdb.url);
    LOG_INFO("MQTT topic prefix: {}", config.topic_prefix);

    int exit_code = 0;
    try {
        telegen::ConfigGenerator generator(telegen::create_csv_node_source(config.csv_path),
                                           config.telegraf, config.topic_prefix,
                                           config.output_path);
        generator.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Generation failed: {}", e.what());
        exit_code = 1;
    }

    telegen::Logger::shutdown();
    return exit_code;
}
