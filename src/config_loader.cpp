// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "config_loader.hpp"

#include "env_vars.hpp"
#include "json_utils.hpp"
#include "topic_utils.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/pointer.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

namespace telegen {

namespace {

using detail::get_value;
using detail::require_value;

/**
 * @brief Load and parse JSON schema from file.
 */
rapidjson::SchemaDocument load_schema(const std::filesystem::path& schema_path) {
    std::ifstream ifs(schema_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open schema file: " + schema_path.string());
    }

    rapidjson::IStreamWrapper isw(ifs);
    rapidjson::Document schema_doc;
    schema_doc.ParseStream(isw);

    if (schema_doc.HasParseError()) {
        throw std::runtime_error("Failed to parse JSON schema: " + schema_path.string() +
                                 " at offset " + std::to_string(schema_doc.GetErrorOffset()));
    }

    return rapidjson::SchemaDocument(schema_doc);
}

/**
 * @brief Validate JSON document against schema.
 */
void validate_against_schema(const rapidjson::Document& doc,
                             const rapidjson::SchemaDocument& schema,
                             const std::filesystem::path& config_path) {
    rapidjson::SchemaValidator validator(schema);
    if (!doc.Accept(validator)) {
        rapidjson::StringBuffer sb;
        validator.GetInvalidSchemaPointer().StringifyUriFragment(sb);
        throw std::runtime_error("Config validation failed for " + config_path.string() +
                                 " at: " + sb.GetString() +
                                 ", keyword: " + validator.GetInvalidSchemaKeyword());
    }
}

/**
 * @brief Get optional environment variable value.
 */
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/**
 * @brief Parse and validate log level from string.
 * @throws std::runtime_error if invalid log level
 */
std::string parse_log_level(const std::string& level, const std::string& source) {
    if (level == "trace" || level == "debug" || level == "info" || level == "warn" ||
        level == "warning" || level == "error") {
        return level;
    }
    throw std::runtime_error("Invalid " + source + ": " + level +
                             " (must be trace|debug|info|warn|error)");
}

/**
 * @brief Reject empty path overrides.
 * @throws std::runtime_error if the value is empty
 */
std::filesystem::path parse_path(const std::string& value, const std::string& source) {
    if (value.empty()) {
        throw std::runtime_error(source + " cannot be empty");
    }
    return std::filesystem::path(value);
}

std::filesystem::path resolve_relative(const std::filesystem::path& path,
                                       const std::filesystem::path& base_dir) {
    if (path.is_absolute()) {
        return path;
    }
    return base_dir / path;
}

} // namespace

ServiceConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path) {
    // Load and parse config file
    std::ifstream config_ifs(config_path);
    if (!config_ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + config_path.string());
    }

    rapidjson::IStreamWrapper config_isw(config_ifs);
    rapidjson::Document config_doc;
    config_doc.ParseStream(config_isw);

    if (config_doc.HasParseError()) {
        throw std::runtime_error("Failed to parse config JSON: " + config_path.string() +
                                 " at offset " + std::to_string(config_doc.GetErrorOffset()));
    }

    // Load schema and validate
    auto schema = load_schema(schema_path);
    validate_against_schema(config_doc, schema, config_path);

    const auto config_dir = config_path.parent_path();

    // Extract values from JSON with defaults using JSON Pointers (RFC6901)
    ServiceConfig config;
    TelegrafSettings& telegraf = config.telegraf;

    config.csv_path = resolve_relative(
        parse_path(require_value<std::string>(config_doc, json::CSV_PATH, "config"), "csv_path"),
        config_dir);
    config.output_path = resolve_relative(
        parse_path(get_value<std::string>(config_doc, json::OUTPUT_PATH)
                       .value_or(DEFAULT_OUTPUT_PATH),
                   "output config_path"),
        config_dir);

    telegraf.mqtt.broker =
        get_value<std::string>(config_doc, json::MQTT_BROKER).value_or(telegraf.mqtt.broker);
    telegraf.opcua_endpoint =
        get_value<std::string>(config_doc, json::OPCUA_ENDPOINT).value_or(telegraf.opcua_endpoint);
    telegraf.influxdb.url =
        get_value<std::string>(config_doc, json::INFLUXDB_URL).value_or(telegraf.influxdb.url);
    telegraf.influxdb.token =
        get_value<std::string>(config_doc, json::INFLUXDB_TOKEN).value_or(telegraf.influxdb.token);
    telegraf.influxdb.organization =
        get_value<std::string>(config_doc, json::INFLUXDB_ORGANIZATION)
            .value_or(telegraf.influxdb.organization);
    telegraf.influxdb.bucket = get_value<std::string>(config_doc, json::INFLUXDB_BUCKET)
                                   .value_or(telegraf.influxdb.bucket);
    telegraf.mqtt.qos = get_value<int>(config_doc, json::MQTT_QOS).value_or(telegraf.mqtt.qos);
    telegraf.mqtt.retain =
        get_value<bool>(config_doc, json::MQTT_RETAIN).value_or(telegraf.mqtt.retain);
    telegraf.mqtt.data_format = get_value<std::string>(config_doc, json::MQTT_DATA_FORMAT)
                                    .value_or(telegraf.mqtt.data_format);
    telegraf.agent.interval =
        get_value<std::string>(config_doc, json::AGENT_INTERVAL).value_or(telegraf.agent.interval);
    telegraf.agent.flush_interval = get_value<std::string>(config_doc, json::AGENT_FLUSH_INTERVAL)
                                        .value_or(telegraf.agent.flush_interval);

    config.topic_prefix =
        get_value<std::string>(config_doc, json::MQTT_TOPIC_PREFIX).value_or(DEFAULT_TOPIC_PREFIX);
    config.log_level = get_value<std::string>(config_doc, json::LOG_LEVEL).value_or("info");

    // Apply environment variable overrides
    if (auto env_log_level = get_env(telegen::env::LOG_LEVEL); env_log_level.has_value()) {
        config.log_level = parse_log_level(env_log_level.value(), telegen::env::LOG_LEVEL);
    }

    if (auto env_csv = get_env(telegen::env::CSV_PATH); env_csv.has_value()) {
        config.csv_path = parse_path(env_csv.value(), telegen::env::CSV_PATH);
    }

    if (auto env_output = get_env(telegen::env::OUTPUT_PATH); env_output.has_value()) {
        config.output_path = parse_path(env_output.value(), telegen::env::OUTPUT_PATH);
    }

    if (auto env_broker = get_env(telegen::env::MQTT_BROKER); env_broker.has_value()) {
        telegraf.mqtt.broker = env_broker.value();
    }

    if (auto env_opcua = get_env(telegen::env::OPCUA_ENDPOINT); env_opcua.has_value()) {
        telegraf.opcua_endpoint = env_opcua.value();
    }

    if (auto env_influx = get_env(telegen::env::INFLUXDB_URL); env_influx.has_value()) {
        telegraf.influxdb.url = env_influx.value();
    }

    // Every node topic starts with the prefix, so it must be legal on its own
    if (config.topic_prefix.empty()) {
        throw std::runtime_error("Invalid mqtt.topic_prefix: must not be empty");
    }
    if (auto violation = checkTopicName(config.topic_prefix); violation != TopicViolation::None) {
        throw std::runtime_error("Invalid mqtt.topic_prefix '" + config.topic_prefix +
                                 "': " + std::string(toString(violation)));
    }

    return config;
}

} // namespace telegen
