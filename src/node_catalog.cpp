// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "node_catalog.hpp"

#include "logger.hpp"

namespace telegen {

namespace {

constexpr char COMPONENT[] = "catalog";

RecordContext record_context(const NodeRow& row) {
    return RecordContext{.row = row.row, .node_id = row.node_id, .custom_name = row.custom_name};
}

} // namespace

std::string build_candidate_topic(std::string_view prefix, std::string_view identifier) {
    std::string topic(prefix);
    topic += '/';
    topic += identifier;
    return topic;
}

TopicAssignment assign_topic(std::string_view candidate, const TopicRules& rules) {
    TopicAssignment assignment;
    assignment.original = checkTopicName(candidate, rules);

    if (assignment.original == TopicViolation::None) {
        assignment.topic = std::string(candidate);
        return assignment;
    }

    assignment.topic = sanitizeTopicName(candidate, rules);
    assignment.remaining = checkTopicName(assignment.topic, rules);
    return assignment;
}

NodeCatalog build_node_catalog(const std::vector<NodeRow>& rows, std::string_view topic_prefix,
                               const TopicRules& rules) {
    NodeCatalog catalog;
    catalog.nodes.reserve(rows.size());

    for (const auto& row : rows) {
        ++catalog.stats.rows_read;

        if (!row.has_required_columns()) {
            LOG_WARN_ENTRY(LogEntry("Row missing required columns, skipping")
                               .component(COMPONENT)
                               .record(record_context(row))
                               .error({.type = "missing_column",
                                       .message = std::string("required columns: ") +
                                                  csv_columns::NODE_ID + ", " +
                                                  csv_columns::CUSTOM_NAME}));
            ++catalog.stats.records_skipped;
            continue;
        }

        NodeId node_id;
        try {
            node_id = parse_node_id(*row.node_id);
        } catch (const InvalidNodeIdError& e) {
            LOG_WARN_ENTRY(LogEntry("Skipping invalid NodeId format")
                               .component(COMPONENT)
                               .record(record_context(row))
                               .error({.type = "invalid_node_id", .message = e.reason()}));
            ++catalog.stats.records_skipped;
            continue;
        }

        auto candidate = build_candidate_topic(topic_prefix, node_id.identifier);
        auto assignment = assign_topic(candidate, rules);

        if (assignment.sanitized()) {
            ++catalog.stats.topics_sanitized;
            LOG_WARN_ENTRY(LogEntry("MQTT topic contains restricted characters, using sanitized "
                                    "topic")
                               .component(COMPONENT)
                               .operation("sanitize")
                               .topic({.topic = candidate,
                                       .sanitized = assignment.topic,
                                       .violation = std::string(toString(assignment.original))})
                               .record(record_context(row)));
        }

        if (!assignment.usable()) {
            LOG_WARN_ENTRY(LogEntry("MQTT topic exceeds protocol limits, skipping")
                               .component(COMPONENT)
                               .topic({.topic = assignment.topic,
                                       .sanitized = std::nullopt,
                                       .violation = std::string(toString(assignment.remaining))})
                               .record(record_context(row)));
            ++catalog.stats.records_skipped;
            continue;
        }

        LOG_DEBUG("Accepted node {} -> {}", *row.node_id, assignment.topic);

        catalog.nodes.push_back(NodeRecord{.node_id = std::move(node_id),
                                           .custom_name = *row.custom_name,
                                           .mqtt_topic = std::move(assignment.topic)});
        ++catalog.stats.nodes_processed;
    }

    return catalog;
}

} // namespace telegen
