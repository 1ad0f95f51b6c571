// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace telegen {

/**
 * @brief One data row of the node list, addressed by column name.
 *
 * A field is nullopt when the row is too short to reach its column
 * (or the header lacks the column altogether).
 */
struct NodeRow {
    std::size_t row = 0;                    ///< 1-based data row number (header excluded)
    std::optional<std::string> node_id;     ///< "NodeId" column
    std::optional<std::string> custom_name; ///< "CustomName" column

    [[nodiscard]] bool has_required_columns() const {
        return node_id.has_value() && custom_name.has_value();
    }
};

/// Column names in the node list header
namespace csv_columns {
constexpr char NODE_ID[] = "NodeId";
constexpr char CUSTOM_NAME[] = "CustomName";
} // namespace csv_columns

/**
 * @brief Split CSV text into records of fields (RFC 4180).
 *
 * Handles quoted fields with embedded commas, line breaks and doubled quotes,
 * LF and CRLF line endings, and a leading UTF-8 BOM. Blank lines are dropped.
 *
 * @throws std::runtime_error on an unterminated quoted field
 */
std::vector<std::vector<std::string>> parse_csv(std::istream& input);

/**
 * @brief Read node rows from CSV text whose first record is the header.
 *
 * @throws std::runtime_error on malformed CSV
 */
std::vector<NodeRow> read_node_rows(std::istream& input);

/**
 * @brief Abstract source of node descriptor rows.
 */
class INodeSource {
public:
    virtual ~INodeSource() = default;

    /**
     * @brief Load all rows from the source.
     *
     * @throws std::runtime_error if the source cannot be read
     */
    virtual std::vector<NodeRow> load() = 0;

    /**
     * @brief Human-readable description for logs (e.g. the file path).
     */
    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * @brief Create a source that reads a CSV file.
 *
 * The file is opened on load(), not here.
 */
std::unique_ptr<INodeSource> create_csv_node_source(const std::filesystem::path& csv_path);

} // namespace telegen
