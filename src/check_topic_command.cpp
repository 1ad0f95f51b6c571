// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "check_topic_command.hpp"

#include "topic_utils.hpp"

namespace telegen {

int run_check_topic_command(std::string_view topic, std::ostream& out) {
    const auto violation = checkTopicName(topic);
    const auto sanitized = sanitizeTopicName(topic);
    const auto sanitized_violation = checkTopicName(sanitized);

    out << "topic: " << topic << "\n"
        << "valid: " << (violation == TopicViolation::None ? "true" : "false") << "\n"
        << "violation: " << toString(violation) << "\n"
        << "sanitized: " << sanitized << "\n"
        << "sanitized_valid: " << (sanitized_violation == TopicViolation::None ? "true" : "false")
        << "\n"
        << "sanitized_violation: " << toString(sanitized_violation) << "\n";

    return violation == TopicViolation::None ? 0 : 1;
}

} // namespace telegen
