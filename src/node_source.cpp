// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "node_source.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace telegen {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

bool is_blank(const std::vector<std::string>& record) {
    return record.size() == 1 && record.front().empty();
}

std::optional<std::size_t> find_column(const std::vector<std::string>& header,
                                       std::string_view name) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<std::string> field_at(const std::vector<std::string>& record,
                                    std::optional<std::size_t> index) {
    if (!index.has_value() || *index >= record.size()) {
        return std::nullopt;
    }
    return record[*index];
}

/**
 * @brief Node source backed by a CSV file on disk.
 */
class CsvNodeSource : public INodeSource {
public:
    explicit CsvNodeSource(std::filesystem::path csv_path) : csv_path_(std::move(csv_path)) {}

    std::vector<NodeRow> load() override {
        if (!std::filesystem::exists(csv_path_)) {
            throw std::runtime_error("CSV file not found: " + csv_path_.string());
        }

        std::ifstream ifs(csv_path_, std::ios::binary);
        if (!ifs.is_open()) {
            throw std::runtime_error("Failed to open CSV file: " + csv_path_.string());
        }

        try {
            return read_node_rows(ifs);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("Failed to parse CSV file " + csv_path_.string() + ": " +
                                     e.what());
        }
    }

    [[nodiscard]] std::string describe() const override { return csv_path_.string(); }

private:
    std::filesystem::path csv_path_;
};

} // namespace

std::vector<std::vector<std::string>> parse_csv(std::istream& input) {
    std::string text{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    std::string_view view(text);
    if (view.starts_with(UTF8_BOM)) {
        view.remove_prefix(UTF8_BOM.size());
    }

    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool record_started = false;

    auto end_record = [&]() {
        record.push_back(std::move(field));
        field.clear();
        if (!is_blank(record)) {
            records.push_back(std::move(record));
        }
        record.clear();
        record_started = false;
    };

    for (std::size_t i = 0; i < view.size(); ++i) {
        char c = view[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < view.size() && view[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                record_started = true;
                break;
            case ',':
                record.push_back(std::move(field));
                field.clear();
                record_started = true;
                break;
            case '\r':
                // CRLF ends the record at the '\n'; a lone CR is kept as data
                if (i + 1 < view.size() && view[i + 1] == '\n') {
                    break;
                }
                field.push_back(c);
                record_started = true;
                break;
            case '\n':
                end_record();
                break;
            default:
                field.push_back(c);
                record_started = true;
                break;
        }
    }

    if (in_quotes) {
        throw std::runtime_error("unterminated quoted field in record " +
                                 std::to_string(records.size() + 1));
    }

    if (record_started || !record.empty()) {
        end_record();
    }

    return records;
}

std::vector<NodeRow> read_node_rows(std::istream& input) {
    auto records = parse_csv(input);
    if (records.empty()) {
        return {};
    }

    const auto& header = records.front();
    auto node_id_col = find_column(header, csv_columns::NODE_ID);
    auto custom_name_col = find_column(header, csv_columns::CUSTOM_NAME);

    std::vector<NodeRow> rows;
    rows.reserve(records.size() - 1);
    for (std::size_t i = 1; i < records.size(); ++i) {
        NodeRow row;
        row.row = i;
        row.node_id = field_at(records[i], node_id_col);
        row.custom_name = field_at(records[i], custom_name_col);
        rows.push_back(std::move(row));
    }

    return rows;
}

std::unique_ptr<INodeSource> create_csv_node_source(const std::filesystem::path& csv_path) {
    return std::make_unique<CsvNodeSource>(csv_path);
}

} // namespace telegen
