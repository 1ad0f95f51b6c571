// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "topic_utils.hpp"

#include <algorithm>

namespace telegen {

namespace {

bool isExcluded(char c, const TopicRules& rules) {
    return rules.excluded_chars.find(c) != std::string_view::npos;
}

} // namespace

std::string_view toString(TopicViolation violation) {
    switch (violation) {
        case TopicViolation::None:
            return "none";
        case TopicViolation::ExcludedCharacter:
            return "excluded_character";
        case TopicViolation::IllegalDollarPrefix:
            return "illegal_dollar_prefix";
        case TopicViolation::TooLong:
            return "too_long";
        case TopicViolation::TooDeep:
            return "too_deep";
    }
    return "unknown";
}

bool hasReservedPrefix(std::string_view topic, const TopicRules& rules) {
    return std::any_of(rules.reserved_prefixes.begin(), rules.reserved_prefixes.end(),
                       [topic](std::string_view prefix) { return topic.starts_with(prefix); });
}

TopicViolation checkTopicName(std::string_view topic, const TopicRules& rules) {
    // Leading '$' is left to the prefix rule below
    for (std::size_t i = 0; i < topic.size(); ++i) {
        if (i == 0 && topic[i] == '$') {
            continue;
        }
        if (isExcluded(topic[i], rules)) {
            return TopicViolation::ExcludedCharacter;
        }
    }

    if (topic.starts_with('$') && !hasReservedPrefix(topic, rules)) {
        return TopicViolation::IllegalDollarPrefix;
    }

    // std::string_view is a byte view, so size() is the UTF-8 encoded length
    if (topic.size() > rules.max_bytes) {
        return TopicViolation::TooLong;
    }

    auto levels = static_cast<std::size_t>(std::count(topic.begin(), topic.end(), '/')) + 1;
    if (levels > rules.max_levels) {
        return TopicViolation::TooDeep;
    }

    return TopicViolation::None;
}

bool isValidTopicName(std::string_view topic, const TopicRules& rules) {
    return checkTopicName(topic, rules) == TopicViolation::None;
}

std::string sanitizeTopicName(std::string_view topic, const TopicRules& rules) {
    std::string sanitized(topic);
    const bool keep_leading_dollar = hasReservedPrefix(topic, rules);

    for (std::size_t i = 0; i < sanitized.size(); ++i) {
        if (i == 0 && keep_leading_dollar) {
            continue;
        }
        if (isExcluded(sanitized[i], rules)) {
            sanitized[i] = rules.replacement;
        }
    }

    if (sanitized.starts_with('$') && !hasReservedPrefix(sanitized, rules)) {
        sanitized[0] = rules.replacement;
    }

    return sanitized;
}

} // namespace telegen
