// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Environment variable names for runtime configuration overrides.
//
// These constants provide a single source of truth for environment variable
// names used to override configuration file values at runtime.
// -----------------------------------------------------------------------------

namespace telegen::env {

/// Environment variable for overriding log level (trace/debug/info/warn/error)
constexpr const char* LOG_LEVEL = "TELEGEN_LOG_LEVEL";

/// Environment variable for overriding the input CSV path
constexpr const char* CSV_PATH = "TELEGEN_CSV_PATH";

/// Environment variable for overriding the generated config path
constexpr const char* OUTPUT_PATH = "TELEGEN_OUTPUT_PATH";

/// Environment variable for overriding the MQTT broker URL written to outputs
constexpr const char* MQTT_BROKER = "TELEGEN_MQTT_BROKER";

/// Environment variable for overriding the OPC UA server endpoint
constexpr const char* OPCUA_ENDPOINT = "TELEGEN_OPCUA_ENDPOINT";

/// Environment variable for overriding the InfluxDB URL
constexpr const char* INFLUXDB_URL = "TELEGEN_INFLUXDB_URL";

} // namespace telegen::env
