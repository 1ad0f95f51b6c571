// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "generator.hpp"

#include "logger.hpp"

#include <stdexcept>

namespace telegen {

ConfigGenerator::ConfigGenerator(std::unique_ptr<INodeSource> source, TelegrafSettings settings,
                                 std::string topic_prefix, std::filesystem::path output_path)
    : source_(std::move(source)), settings_(std::move(settings)),
      topic_prefix_(std::move(topic_prefix)), output_path_(std::move(output_path)) {
    if (!source_) {
        throw std::invalid_argument("ConfigGenerator requires a node source");
    }
    if (output_path_.empty()) {
        throw std::invalid_argument("Output file path cannot be empty");
    }
}

GenerationReport ConfigGenerator::run() {
    const auto start = std::chrono::steady_clock::now();

    GenerationReport report;
    report.output_path = output_path_;

    try {
        LOG_INFO("Reading nodes from {}", source_->describe());
        auto rows = source_->load();

        auto catalog = build_node_catalog(rows, topic_prefix_);
        report.stats = catalog.stats;
        LOG_INFO("Successfully processed {} nodes from CSV", catalog.stats.nodes_processed);
        LOG_INFO("Sanitized {} MQTT topics with restricted characters",
                 catalog.stats.topics_sanitized);

        auto content = render_telegraf_config(settings_, catalog.nodes);

        LOG_INFO("Writing Telegraf configuration to {}", output_path_.string());
        write_telegraf_config(output_path_, content);
        LOG_INFO("Configuration successfully written to {}", output_path_.string());
    } catch (const std::exception& e) {
        LOG_ERROR_ENTRY(LogEntry("Configuration generation failed")
                            .component("generator")
                            .error({.type = "generation_error", .message = e.what()}));
        report.elapsed = std::chrono::steady_clock::now() - start;
        log_summary(report);
        throw;
    }

    report.elapsed = std::chrono::steady_clock::now() - start;
    log_summary(report);
    return report;
}

void ConfigGenerator::log_summary(const GenerationReport& report) const {
    LOG_INFO("Process finished. Total time: {:.2f} seconds", report.elapsed.count());
    LOG_INFO("--- Generation Summary ---");
    LOG_INFO("Rows read: {}", report.stats.rows_read);
    LOG_INFO("Total nodes processed: {}", report.stats.nodes_processed);
    LOG_INFO("MQTT topics sanitized: {}", report.stats.topics_sanitized);
    LOG_INFO("Records skipped: {}", report.stats.records_skipped);
    LOG_INFO("Configuration file: {}", report.output_path.string());
    LOG_INFO("--------------------------");
}

} // namespace telegen
