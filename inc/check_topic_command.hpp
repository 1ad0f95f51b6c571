// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string_view>

namespace telegen {

/**
 * @brief Report validity and sanitized form of a single topic.
 *
 * Output (one "key: value" per line): topic, valid, violation, sanitized,
 * sanitized_valid, sanitized_violation.
 *
 * @param topic Topic to check
 * @param out Stream receiving the report
 * @return Process exit code: 0 if the topic is valid, 1 otherwise
 */
int run_check_topic_command(std::string_view topic, std::ostream& out);

} // namespace telegen
