// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "node_catalog.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace telegen {

/**
 * @brief [agent] section settings.
 */
struct AgentSettings {
    std::string interval = "10s";
    std::string flush_interval = "10s";
};

/**
 * @brief [[outputs.influxdb_v2]] settings.
 *
 * Token and organization default to environment references that Telegraf
 * expands at startup.
 */
struct InfluxDbSettings {
    std::string url = "http://64.226.126.250:8086";
    std::string token = "$DOCKER_INFLUXDB_INIT_ADMIN_TOKEN";
    std::string organization = "$DOCKER_INFLUXDB_INIT_ORG";
    std::string bucket = "OPC UA";
};

/**
 * @brief Settings shared by every per-node [[outputs.mqtt]] stanza.
 */
struct MqttOutputSettings {
    std::string broker = "tcp://mosquitto:1883";
    int qos = 0;
    bool retain = false;
    std::string data_format = "json";
};

/**
 * @brief Everything besides the node list that goes into the generated file.
 */
struct TelegrafSettings {
    AgentSettings agent;
    std::string opcua_endpoint = "opc.tcp://100.94.111.58:4841";
    InfluxDbSettings influxdb;
    MqttOutputSettings mqtt;
};

/**
 * @brief Quote a value as a TOML basic string, escaping '"', '\' and control characters.
 */
std::string toml_basic_string(std::string_view value);

/**
 * @brief Render the complete Telegraf configuration.
 *
 * Layout: agent settings, the OPC UA input with one nodes entry per record,
 * the InfluxDB v2 output, then one MQTT output per record filtered on the
 * node's id tag. Records are emitted in the given order.
 */
std::string render_telegraf_config(const TelegrafSettings& settings,
                                   const std::vector<NodeRecord>& nodes);

/**
 * @brief Write rendered configuration to disk, replacing any existing file.
 *
 * @throws std::runtime_error if the file cannot be opened or written
 */
void write_telegraf_config(const std::filesystem::path& output_path, const std::string& content);

} // namespace telegen
