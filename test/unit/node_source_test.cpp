// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "node_source.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

namespace telegen {
namespace {

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& suffix = ".csv") {
        path_ = std::filesystem::temp_directory_path() /
                ("telegen_source_test_" + std::to_string(counter_++) + suffix);
        std::ofstream ofs(path_, std::ios::binary);
        ofs << content;
    }

    ~TempFile() { std::filesystem::remove(path_); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

std::vector<std::vector<std::string>> parse(const std::string& text) {
    std::istringstream in(text);
    return parse_csv(in);
}

std::vector<NodeRow> rows(const std::string& text) {
    std::istringstream in(text);
    return read_node_rows(in);
}

using Records = std::vector<std::vector<std::string>>;

//
// CSV tokenizing
//

TEST(CsvParseTest, SplitsSimpleRecords) {
    EXPECT_EQ(parse("a,b\nc,d\n"), (Records{{"a", "b"}, {"c", "d"}}));
}

TEST(CsvParseTest, LastRecordWithoutNewline) {
    EXPECT_EQ(parse("a,b\nc,d"), (Records{{"a", "b"}, {"c", "d"}}));
}

TEST(CsvParseTest, CrlfLineEndings) {
    EXPECT_EQ(parse("a,b\r\nc,d\r\n"), (Records{{"a", "b"}, {"c", "d"}}));
}

TEST(CsvParseTest, QuotedFields) {
    EXPECT_EQ(parse("\"a,1\",\"say \"\"hi\"\"\"\n"), (Records{{"a,1", "say \"hi\""}}));
}

TEST(CsvParseTest, QuotedLineBreak) {
    EXPECT_EQ(parse("\"line1\nline2\",x\n"), (Records{{"line1\nline2", "x"}}));
}

TEST(CsvParseTest, EmptyFields) {
    EXPECT_EQ(parse(",\na,,b\n"), (Records{{"", ""}, {"a", "", "b"}}));
}

TEST(CsvParseTest, SkipsBlankLines) {
    EXPECT_EQ(parse("a\n\n\r\nb\n"), (Records{{"a"}, {"b"}}));
}

TEST(CsvParseTest, SkipsUtf8Bom) {
    EXPECT_EQ(parse("\xEF\xBB\xBFNodeId,CustomName\n"), (Records{{"NodeId", "CustomName"}}));
}

TEST(CsvParseTest, EmptyInput) {
    EXPECT_TRUE(parse("").empty());
}

TEST(CsvParseTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(parse("a,\"open\n"), std::runtime_error);
}

//
// Node rows
//

TEST(NodeRowsTest, MapsColumnsByName) {
    auto result = rows("CustomName,Extra,NodeId\nBoiler,x,ns=2;s=Boiler\n");

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].row, 1u);
    EXPECT_EQ(result[0].node_id, "ns=2;s=Boiler");
    EXPECT_EQ(result[0].custom_name, "Boiler");
    EXPECT_TRUE(result[0].has_required_columns());
}

TEST(NodeRowsTest, NumbersDataRowsFromOne) {
    auto result = rows("NodeId,CustomName\nns=1;s=a,A\nns=1;s=b,B\n");

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].row, 1u);
    EXPECT_EQ(result[1].row, 2u);
    EXPECT_EQ(result[1].custom_name, "B");
}

TEST(NodeRowsTest, ShortRowLacksColumns) {
    auto result = rows("NodeId,CustomName\nns=1;s=a\n");

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].node_id, "ns=1;s=a");
    EXPECT_FALSE(result[0].custom_name.has_value());
    EXPECT_FALSE(result[0].has_required_columns());
}

TEST(NodeRowsTest, HeaderWithoutRequiredColumn) {
    auto result = rows("NodeId,Name\nns=1;s=a,A\n");

    ASSERT_EQ(result.size(), 1u);
    EXPECT_FALSE(result[0].has_required_columns());
}

TEST(NodeRowsTest, EmptyFieldStillCountsAsPresent) {
    auto result = rows("NodeId,CustomName\nns=1;s=a,\n");

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].custom_name, "");
    EXPECT_TRUE(result[0].has_required_columns());
}

TEST(NodeRowsTest, HeaderOnly) {
    EXPECT_TRUE(rows("NodeId,CustomName\n").empty());
}

//
// File-backed source
//

TEST(CsvNodeSourceTest, LoadsFile) {
    TempFile csv("NodeId,CustomName\r\nns=2;s=Temp#1,Temperature\r\n");
    auto source = create_csv_node_source(csv.path());

    auto result = source->load();
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].node_id, "ns=2;s=Temp#1");
    EXPECT_EQ(source->describe(), csv.path().string());
}

TEST(CsvNodeSourceTest, MissingFileThrows) {
    auto source = create_csv_node_source("/nonexistent/nodes.csv");
    EXPECT_THROW(source->load(), std::runtime_error);
}

TEST(CsvNodeSourceTest, MalformedFileThrows) {
    TempFile csv("NodeId,CustomName\n\"ns=2;s=a,A\n");
    auto source = create_csv_node_source(csv.path());
    EXPECT_THROW(source->load(), std::runtime_error);
}

} // namespace
} // namespace telegen
