// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "node_id.hpp"
#include "node_source.hpp"
#include "topic_utils.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace telegen {

/**
 * @brief Accepted node with its final (legal) MQTT topic.
 */
struct NodeRecord {
    NodeId node_id;
    std::string custom_name;
    std::string mqtt_topic;
};

/**
 * @brief Counters for one generation run.
 *
 * rows_read == nodes_processed + records_skipped.
 */
struct GenerationStats {
    std::size_t rows_read = 0;
    std::size_t nodes_processed = 0;
    std::size_t topics_sanitized = 0; ///< Includes sanitized topics later skipped as too long/deep
    std::size_t records_skipped = 0;
};

/**
 * @brief Nodes accepted from the input, in input order, plus run counters.
 */
struct NodeCatalog {
    std::vector<NodeRecord> nodes;
    GenerationStats stats;
};

/**
 * @brief Result of validating and, if needed, sanitizing one candidate topic.
 */
struct TopicAssignment {
    std::string topic;                               ///< Candidate or sanitized topic
    TopicViolation original = TopicViolation::None;  ///< Violation of the candidate
    TopicViolation remaining = TopicViolation::None; ///< Violation left after sanitizing

    /// Character or prefix rewrite happened (length/depth are never rewritten)
    [[nodiscard]] bool sanitized() const {
        return original == TopicViolation::ExcludedCharacter ||
               original == TopicViolation::IllegalDollarPrefix;
    }
    [[nodiscard]] bool usable() const { return remaining == TopicViolation::None; }
};

/// Default namespace under which node topics are published
constexpr char DEFAULT_TOPIC_PREFIX[] = "telegraf/opcua";

/**
 * @brief Build "<prefix>/<identifier>".
 */
std::string build_candidate_topic(std::string_view prefix, std::string_view identifier);

/**
 * @brief Validate a candidate topic and sanitize it when invalid.
 *
 * The sanitized topic is re-checked: sanitizing does not fix length or
 * level-count violations, which are reported in TopicAssignment::remaining.
 */
TopicAssignment assign_topic(std::string_view candidate,
                             const TopicRules& rules = DEFAULT_TOPIC_RULES);

/**
 * @brief Turn raw rows into node records with legal topics.
 *
 * Rows missing a required column, rows with a malformed NodeId, and rows whose
 * topic is still illegal after sanitizing are skipped with a warning.
 *
 * @param rows Rows in input order
 * @param topic_prefix Prefix for every node topic
 */
NodeCatalog build_node_catalog(const std::vector<NodeRow>& rows, std::string_view topic_prefix,
                               const TopicRules& rules = DEFAULT_TOPIC_RULES);

} // namespace telegen
