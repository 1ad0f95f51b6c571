// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "telegraf_config.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace telegen {

namespace {

constexpr char SECTION_RULE[] =
    "###############################################################################\n";

void write_section_banner(std::ostringstream& out, std::string_view title) {
    out << SECTION_RULE << std::format("#{:^77}#\n", title) << SECTION_RULE;
}

void write_agent(std::ostringstream& out, const AgentSettings& agent) {
    out << "# Telegraf Configuration for OPC UA Monitoring\n"
        << "# Generated from CSV file\n\n";
    write_section_banner(out, "AGENT SETTINGS");
    out << "[agent]\n"
        << "  interval = " << toml_basic_string(agent.interval) << "\n"
        << "  round_interval = true\n"
        << "  metric_batch_size = 1000\n"
        << "  metric_buffer_limit = 10000\n"
        << "  collection_jitter = \"0s\"\n"
        << "  flush_interval = " << toml_basic_string(agent.flush_interval) << "\n"
        << "  flush_jitter = \"0s\"\n"
        << "  precision = \"\"\n"
        << "  hostname = \"\"\n"
        << "  omit_hostname = true\n";
}

void write_opcua_input(std::ostringstream& out, const std::string& endpoint,
                       const std::vector<NodeRecord>& nodes) {
    out << "\n";
    write_section_banner(out, "INPUT PLUGINS");
    out << "\n# Read data from an OPC UA server\n"
        << "[[inputs.opcua]]\n"
        << "  ## OPC UA Server Endpoint URL.\n"
        << "  endpoint = " << toml_basic_string(endpoint) << "\n\n"
        << "  ## Security policy: \"None\", \"Basic128Rsa15\", \"Basic256\", "
           "\"Basic256Sha256\".\n"
        << "  security_policy = \"None\"\n"
        << "  ## Security mode: \"None\", \"Sign\", \"SignAndEncrypt\".\n"
        << "  security_mode = \"None\"\n\n"
        << "  ## Path to certificate file (Required if SecurityMode != \"None\").\n"
        << "  certificate = \"\"\n"
        << "  ## Path to private key file (Required if SecurityMode != \"None\").\n"
        << "  private_key = \"\"\n\n"
        << "  ## Authentication method: \"Anonymous\", \"UserName\", \"Certificate\".\n"
        << "  auth_method = \"Anonymous\"\n"
        << "  # username = \"\" # Required if AuthMethod=\"UserName\"\n"
        << "  # password = \"\" # Required if AuthMethod=\"UserName\"\n\n"
        << "  ## Connection timeout for establishing the OPC UA connection.\n"
        << "  connect_timeout = \"10s\"\n"
        << "  ## Request timeout for individual OPC UA read requests.\n"
        << "  request_timeout = \"5s\"\n\n"
        << "  ## Node Configuration: Define the OPC UA nodes to read data from.\n";

    for (const auto& node : nodes) {
        out << "  [[inputs.opcua.nodes]]\n"
            << "    name = " << toml_basic_string(node.custom_name) << "\n"
            << "    namespace = " << toml_basic_string(node.node_id.namespace_index) << "\n"
            << "    identifier_type = "
            << toml_basic_string(std::string(1, node.node_id.identifier_type)) << "\n"
            << "    identifier = '''" << node.node_id.identifier << "'''\n";
    }
}

void write_influxdb_output(std::ostringstream& out, const InfluxDbSettings& influxdb) {
    out << "\n";
    write_section_banner(out, "OUTPUT PLUGINS");
    out << "\n# --- InfluxDB v2 Output ---\n"
        << "[[outputs.influxdb_v2]]\n"
        << "  urls = [" << toml_basic_string(influxdb.url) << "]\n"
        << "  token = " << toml_basic_string(influxdb.token) << "\n"
        << "  organization = " << toml_basic_string(influxdb.organization) << "\n"
        << "  bucket = " << toml_basic_string(influxdb.bucket) << "\n";
}

void write_mqtt_outputs(std::ostringstream& out, const MqttOutputSettings& mqtt,
                        const std::vector<NodeRecord>& nodes) {
    out << "\n# --- MQTT Outputs: One per Node (Filtering on 'id' tag) ---\n";

    for (const auto& node : nodes) {
        out << "# MQTT Output for Node: " << node.node_id.identifier << "\n"
            << "[[outputs.mqtt]]\n"
            << "  servers = [" << toml_basic_string(mqtt.broker) << "]\n"
            << "  topic = " << toml_basic_string(node.mqtt_topic) << "\n"
            << "  tagpass = { id = [" << toml_basic_string(node.node_id.to_string()) << "] }\n"
            << "  qos = " << mqtt.qos << "\n"
            << "  retain = " << (mqtt.retain ? "true" : "false") << "\n"
            << "  data_format = " << toml_basic_string(mqtt.data_format) << "\n";
    }
}

} // namespace

std::string toml_basic_string(std::string_view value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('"');

    for (char c : value) {
        switch (c) {
            case '"':
                quoted += "\\\"";
                break;
            case '\\':
                quoted += "\\\\";
                break;
            case '\b':
                quoted += "\\b";
                break;
            case '\t':
                quoted += "\\t";
                break;
            case '\n':
                quoted += "\\n";
                break;
            case '\f':
                quoted += "\\f";
                break;
            case '\r':
                quoted += "\\r";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
                    quoted += std::format("\\u{:04X}", static_cast<unsigned char>(c));
                } else {
                    quoted.push_back(c);
                }
                break;
        }
    }

    quoted.push_back('"');
    return quoted;
}

std::string render_telegraf_config(const TelegrafSettings& settings,
                                   const std::vector<NodeRecord>& nodes) {
    std::ostringstream out;
    write_agent(out, settings.agent);
    write_opcua_input(out, settings.opcua_endpoint, nodes);
    write_influxdb_output(out, settings.influxdb);
    write_mqtt_outputs(out, settings.mqtt, nodes);
    return out.str();
}

void write_telegraf_config(const std::filesystem::path& output_path, const std::string& content) {
    std::ofstream ofs(output_path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open output file: " + output_path.string());
    }

    ofs << content;
    ofs.flush();
    if (!ofs) {
        throw std::runtime_error("Failed to write output file: " + output_path.string());
    }
}

} // namespace telegen
