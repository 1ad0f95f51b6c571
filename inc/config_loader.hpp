// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "telegraf_config.hpp"

#include <filesystem>
#include <string>

namespace telegen {

/**
 * @brief Generator configuration loaded from JSON config file.
 *
 * Values can be overridden by environment variables with TELEGEN_ prefix.
 */
struct ServiceConfig {
    std::filesystem::path csv_path;
    std::filesystem::path output_path;
    std::string topic_prefix;
    std::string log_level;
    TelegrafSettings telegraf;
};

/// JSON Pointer paths (RFC6901) for extracting ServiceConfig values
namespace json {
constexpr char CSV_PATH[] = "/input/csv_path";
constexpr char OUTPUT_PATH[] = "/output/config_path";
constexpr char MQTT_BROKER[] = "/endpoints/mqtt_broker";
constexpr char OPCUA_ENDPOINT[] = "/endpoints/opcua";
constexpr char INFLUXDB_URL[] = "/endpoints/influxdb";
constexpr char INFLUXDB_TOKEN[] = "/influxdb/token";
constexpr char INFLUXDB_ORGANIZATION[] = "/influxdb/organization";
constexpr char INFLUXDB_BUCKET[] = "/influxdb/bucket";
constexpr char MQTT_TOPIC_PREFIX[] = "/mqtt/topic_prefix";
constexpr char MQTT_QOS[] = "/mqtt/qos";
constexpr char MQTT_RETAIN[] = "/mqtt/retain";
constexpr char MQTT_DATA_FORMAT[] = "/mqtt/data_format";
constexpr char AGENT_INTERVAL[] = "/agent/interval";
constexpr char AGENT_FLUSH_INTERVAL[] = "/agent/flush_interval";
constexpr char LOG_LEVEL[] = "/observability/logging/level";
} // namespace json

/// Default output file name (relative to the config file directory)
constexpr char DEFAULT_OUTPUT_PATH[] = "telegraf.conf";

/**
 * @brief Load and validate generator configuration from JSON file.
 *
 * Configuration layering (priority: high to low):
 * 1. Environment variables (TELEGEN_CSV_PATH, TELEGEN_OUTPUT_PATH, TELEGEN_MQTT_BROKER,
 *    TELEGEN_OPCUA_ENDPOINT, TELEGEN_INFLUXDB_URL, TELEGEN_LOG_LEVEL)
 * 2. JSON configuration file
 * 3. Built-in defaults
 *
 * Relative paths from the file are resolved against the config file's directory;
 * paths from the environment are used as given.
 *
 * @param config_path Path to the JSON configuration file
 * @param schema_path Path to the JSON schema file
 * @return ServiceConfig Validated configuration
 *
 * @throws std::runtime_error if config file not found, invalid JSON, schema validation
 *         fails, or the topic prefix is not a legal MQTT topic
 */
ServiceConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path);

} // namespace telegen
