// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "node_id.hpp"

#include <algorithm>

namespace telegen {

namespace {

constexpr std::string_view NAMESPACE_MARKER = "ns=";
constexpr std::string_view IDENTIFIER_TYPES = "sigb";

// Identifiers are emitted inside a TOML ''' literal string
constexpr std::string_view LITERAL_DELIMITER = "'''";

} // namespace

std::string NodeId::to_string() const {
    return std::string(NAMESPACE_MARKER) + namespace_index + ";" + identifier_type + "=" +
           identifier;
}

NodeId parse_node_id(std::string_view text) {
    const std::string node_id(text);

    if (std::count(text.begin(), text.end(), ';') != 1) {
        throw InvalidNodeIdError(node_id, "expected exactly two ';'-separated parts");
    }

    auto separator = text.find(';');
    std::string_view ns_part = text.substr(0, separator);
    std::string_view id_part = text.substr(separator + 1);

    if (!ns_part.starts_with(NAMESPACE_MARKER)) {
        throw InvalidNodeIdError(node_id, "namespace part must start with 'ns='");
    }
    ns_part.remove_prefix(NAMESPACE_MARKER.size());
    if (ns_part.empty()) {
        throw InvalidNodeIdError(node_id, "empty namespace index");
    }

    if (id_part.size() < 2 || id_part[1] != '=' ||
        IDENTIFIER_TYPES.find(id_part[0]) == std::string_view::npos) {
        throw InvalidNodeIdError(node_id, "identifier part must start with s=, i=, g= or b=");
    }

    NodeId result;
    result.namespace_index = std::string(ns_part);
    result.identifier_type = id_part[0];
    result.identifier = std::string(id_part.substr(2));

    if (result.identifier.empty()) {
        throw InvalidNodeIdError(node_id, "empty identifier");
    }
    if (result.identifier.find(LITERAL_DELIMITER) != std::string::npos) {
        throw InvalidNodeIdError(node_id, "identifier must not contain '''");
    }
    if (result.identifier.find_first_of("\r\n") != std::string::npos) {
        throw InvalidNodeIdError(node_id, "identifier must not contain line breaks");
    }

    return result;
}

} // namespace telegen
