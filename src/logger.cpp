// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "logger.hpp"

#include "version.hpp"

#include <stdexcept>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/sinks/stderr_color_sinks.h>

namespace telegen {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, const char* key, const std::string& value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_optional(JsonWriter& writer, const char* key, const std::optional<std::string>& value) {
    if (value.has_value()) {
        write_string(writer, key, *value);
    }
}

} // namespace

std::string LogEntry::render() const {
    if (!component_ && !operation_ && !topic_ && !record_ && !error_) {
        return message_;
    }

    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();

    write_optional(writer, "component", component_);
    write_optional(writer, "operation", operation_);

    if (topic_) {
        writer.Key("topic");
        writer.StartObject();
        write_string(writer, "name", topic_->topic);
        write_optional(writer, "sanitized", topic_->sanitized);
        write_optional(writer, "violation", topic_->violation);
        writer.EndObject();
    }

    if (record_) {
        writer.Key("record");
        writer.StartObject();
        if (record_->row) {
            writer.Key("row");
            writer.Uint64(*record_->row);
        }
        write_optional(writer, "node_id", record_->node_id);
        write_optional(writer, "custom_name", record_->custom_name);
        writer.EndObject();
    }

    if (error_) {
        writer.Key("error");
        writer.StartObject();
        write_string(writer, "type", error_->type);
        write_string(writer, "message", error_->message);
        writer.EndObject();
    }

    writer.EndObject();
    return message_ + " " + buffer.GetString();
}

spdlog::level::level_enum Logger::parse_level(std::string_view level) {
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn" || level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "error") {
        return spdlog::level::err;
    }
    throw std::runtime_error("Invalid log level: " + std::string(level) +
                             " (must be trace|debug|info|warn|error)");
}

void Logger::init(const std::string& level) {
    auto spd_level = parse_level(level);

    spdlog::drop(SERVICE_NAME);
    auto logger = spdlog::stderr_color_mt(SERVICE_NAME);
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%-5l%$ [%n] %v");
    logger->set_level(spd_level);
    spdlog::set_default_logger(std::move(logger));
}

void Logger::shutdown() {
    spdlog::shutdown();
}

} // namespace telegen
