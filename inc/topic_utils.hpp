// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace telegen {

/**
 * @brief Rule tables shared by topic validation and sanitization.
 *
 * The replacement character must not be one of the excluded characters,
 * otherwise sanitization would not be idempotent.
 */
struct TopicRules {
    std::string_view excluded_chars;
    std::span<const std::string_view> reserved_prefixes;
    std::size_t max_bytes;
    std::size_t max_levels;
    char replacement;
};

/// '+' and '#' are MQTT wildcards, '*' and '>' are SMF wildcards, '$' is broker-reserved
inline constexpr std::string_view EXCLUDED_TOPIC_CHARS = "+#*>$";

/// Prefixes for which a leading '$' is permitted
inline constexpr std::array<std::string_view, 3> RESERVED_TOPIC_PREFIXES = {"$SYS/", "$share/",
                                                                            "$noexport/"};

constexpr std::size_t MAX_TOPIC_BYTES = 250;
constexpr std::size_t MAX_TOPIC_LEVELS = 128;

inline constexpr TopicRules DEFAULT_TOPIC_RULES{
    .excluded_chars = EXCLUDED_TOPIC_CHARS,
    .reserved_prefixes = RESERVED_TOPIC_PREFIXES,
    .max_bytes = MAX_TOPIC_BYTES,
    .max_levels = MAX_TOPIC_LEVELS,
    .replacement = '_',
};

/**
 * @brief First rule a topic name violates, in evaluation order.
 */
enum class TopicViolation {
    None,                ///< Topic is legal
    ExcludedCharacter,   ///< Contains a wildcard or reserved character
    IllegalDollarPrefix, ///< Starts with '$' outside a reserved prefix
    TooLong,             ///< Encoded length exceeds max_bytes
    TooDeep              ///< More than max_levels '/'-separated levels
};

/**
 * @brief Short machine-readable name for a violation (e.g. "excluded_character").
 */
std::string_view toString(TopicViolation violation);

/**
 * @brief Check whether a topic starts with one of the reserved '$' prefixes.
 */
bool hasReservedPrefix(std::string_view topic, const TopicRules& rules = DEFAULT_TOPIC_RULES);

/**
 * @brief Find the first rule a topic name breaks.
 *
 * Rules are evaluated in order: excluded characters, leading '$', byte length,
 * level count. A '$' in the first position is judged by the leading-dollar rule
 * only, so reserved prefixes such as "$SYS/" are accepted.
 *
 * Total over all strings: never throws, any byte sequence is a valid input.
 *
 * @param topic Candidate topic name (UTF-8, may be empty)
 * @param rules Rule tables to apply
 * @return TopicViolation::None if the topic is legal
 */
TopicViolation checkTopicName(std::string_view topic,
                              const TopicRules& rules = DEFAULT_TOPIC_RULES);

/**
 * @brief Validate a full MQTT topic name for publishing.
 *
 * @return true iff checkTopicName() reports no violation
 */
bool isValidTopicName(std::string_view topic, const TopicRules& rules = DEFAULT_TOPIC_RULES);

/**
 * @brief Rewrite a topic name so it satisfies the character and prefix rules.
 *
 * Every excluded character is replaced with rules.replacement, except a leading
 * '$' that introduces a reserved prefix. If the result still starts with '$'
 * outside a reserved prefix, that first character is replaced as well.
 *
 * Deterministic and idempotent.
 *
 * @note Length and level-count violations are left untouched; callers must
 *       re-check the result with isValidTopicName().
 */
std::string sanitizeTopicName(std::string_view topic,
                              const TopicRules& rules = DEFAULT_TOPIC_RULES);

} // namespace telegen
