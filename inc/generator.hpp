// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "node_catalog.hpp"
#include "node_source.hpp"
#include "telegraf_config.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace telegen {

/**
 * @brief Outcome of a completed generation run.
 */
struct GenerationReport {
    GenerationStats stats;
    std::filesystem::path output_path;
    std::chrono::duration<double> elapsed{0.0};
};

/**
 * @brief Turns a node source into a Telegraf configuration file.
 *
 * Single pass: load rows, assign legal topics, render, write. Per-record
 * problems are logged and skipped; source and output failures are fatal.
 */
class ConfigGenerator {
public:
    ConfigGenerator(std::unique_ptr<INodeSource> source, TelegrafSettings settings,
                    std::string topic_prefix, std::filesystem::path output_path);

    /**
     * @brief Run the generation and write the output file.
     *
     * The run summary is logged whether or not the run succeeds.
     *
     * @return Report with counters and elapsed time
     * @throws std::runtime_error if the source cannot be read or the output cannot be written
     */
    GenerationReport run();

private:
    void log_summary(const GenerationReport& report) const;

    std::unique_ptr<INodeSource> source_;
    TelegrafSettings settings_;
    std::string topic_prefix_;
    std::filesystem::path output_path_;
};

} // namespace telegen
