// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace telegen {

/**
 * @brief Exception thrown when an OPC UA NodeId string cannot be parsed.
 */
class InvalidNodeIdError : public std::runtime_error {
public:
    InvalidNodeIdError(const std::string& node_id, const std::string& reason)
        : std::runtime_error("Invalid NodeId '" + node_id + "': " + reason), node_id_(node_id),
          reason_(reason) {}

    [[nodiscard]] const std::string& node_id() const { return node_id_; }
    [[nodiscard]] const std::string& reason() const { return reason_; }

private:
    std::string node_id_;
    std::string reason_;
};

/**
 * @brief OPC UA NodeId split into the parts Telegraf's opcua input expects.
 *
 * Written back as "ns=<namespace_index>;<identifier_type>=<identifier>".
 */
struct NodeId {
    std::string namespace_index; ///< Namespace index, kept as text ("2")
    char identifier_type = 's';  ///< s (string), i (numeric), g (GUID), b (opaque)
    std::string identifier;      ///< Identifier within the namespace

    [[nodiscard]] std::string to_string() const;

    bool operator==(const NodeId&) const = default;
};

/**
 * @brief Parse "ns=<n>;<t>=<identifier>".
 *
 * The string must split on ';' into exactly two parts. Only the leading "ns="
 * and "<t>=" markers are stripped; the identifier is kept verbatim otherwise.
 *
 * @throws InvalidNodeIdError on any format violation
 */
NodeId parse_node_id(std::string_view text);

} // namespace telegen
