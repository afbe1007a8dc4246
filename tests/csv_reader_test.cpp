// SPDX-License-Identifier: MIT

// tests/csv_reader_test.cpp
#include <gtest/gtest.h>
#include "sheetload/csv_reader.hpp"

#include <sstream>

namespace sheetload {
namespace {

std::unique_ptr<CsvReader> open_text(const std::string& text, char delim = ',') {
    auto reader = CsvReader::from_stream(std::make_unique<std::istringstream>(text), delim);
    EXPECT_TRUE(reader.has_value()) << (reader ? "" : reader.error().message);
    return reader ? std::move(*reader) : nullptr;
}

std::vector<SourceRow> read_all(ISourceReader& reader) {
    std::vector<SourceRow> rows;
    while (true) {
        auto row = reader.next();
        EXPECT_TRUE(row.has_value());
        if (!row || !*row) break;
        rows.push_back(std::move(**row));
    }
    return rows;
}

std::string cell_text(const SourceRow& row, std::size_t col) {
    return to_display(row.get(col));
}

TEST(CsvReaderTest, HeaderAndRows) {
    auto reader = open_text("Name,Amount,Date\nAlice,12.5,2024-02-13\nBob,7,2024-02-14\n");
    ASSERT_NE(reader, nullptr);
    EXPECT_EQ(reader->header(), (std::vector<std::string>{"Name", "Amount", "Date"}));

    auto rows = read_all(*reader);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].index(), 1u);
    EXPECT_EQ(cell_text(rows[0], 0), "Alice");
    EXPECT_EQ(cell_text(rows[0], 1), "12.5");
    EXPECT_EQ(rows[1].index(), 2u);
}

TEST(CsvReaderTest, CellsStayText) {
    auto reader = open_text("n\n42\n");
    ASSERT_NE(reader, nullptr);
    auto rows = read_all(*reader);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<std::string>(rows[0].get(0)));
}

TEST(CsvReaderTest, QuotedFields) {
    auto reader = open_text("a,b\n\"x, y\",\"say \"\"hi\"\"\"\n\"multi\nline\",z\n");
    ASSERT_NE(reader, nullptr);
    auto rows = read_all(*reader);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(cell_text(rows[0], 0), "x, y");
    EXPECT_EQ(cell_text(rows[0], 1), "say \"hi\"");
    EXPECT_EQ(cell_text(rows[1], 0), "multi\nline");
    EXPECT_EQ(rows[1].index(), 2u);
}

TEST(CsvReaderTest, CrLfLineEndings) {
    auto reader = open_text("a,b\r\n1,2\r\n3,4\r\n");
    ASSERT_NE(reader, nullptr);
    auto rows = read_all(*reader);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(cell_text(rows[1], 1), "4");
}

TEST(CsvReaderTest, SkipsBom) {
    auto reader = open_text("\xEF\xBB\xBFName\nAlice\n");
    ASSERT_NE(reader, nullptr);
    EXPECT_EQ(reader->header()[0], "Name");
}

TEST(CsvReaderTest, EmptyCellsAreNullAndRowsAreAligned) {
    auto reader = open_text("a,b,c\n1,,3\n4\n5,6,7,8\n");
    ASSERT_NE(reader, nullptr);
    auto rows = read_all(*reader);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_TRUE(is_null(rows[0].get(1)));
    ASSERT_EQ(rows[1].cells().size(), 3u);
    EXPECT_TRUE(is_null(rows[1].get(2)));
    EXPECT_EQ(rows[2].cells().size(), 3u);  // Extra cell dropped
}

TEST(CsvReaderTest, BlankRowsSkippedButCounted) {
    auto reader = open_text("a,b\n1,2\n\n,\n3,4\n");
    ASSERT_NE(reader, nullptr);
    auto rows = read_all(*reader);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].index(), 1u);
    EXPECT_EQ(rows[1].index(), 4u);
}

TEST(CsvReaderTest, LeadingBlankLinesBeforeHeader) {
    auto reader = open_text("\n\nName\nAlice\n");
    ASSERT_NE(reader, nullptr);
    EXPECT_EQ(reader->header()[0], "Name");
    auto rows = read_all(*reader);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].index(), 1u);
}

TEST(CsvReaderTest, TabDelimiter) {
    auto reader = open_text("a\tb\n1\t2\n", '\t');
    ASSERT_NE(reader, nullptr);
    EXPECT_EQ(reader->header().size(), 2u);
}

TEST(CsvReaderTest, HeaderOnlyIsEmptySource) {
    auto reader = CsvReader::from_stream(std::make_unique<std::istringstream>("a,b\n"));
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, ErrorCode::EmptySource);
}

TEST(CsvReaderTest, EmptyInputIsEmptySource) {
    auto reader = CsvReader::from_stream(std::make_unique<std::istringstream>(""));
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, ErrorCode::EmptySource);
}

TEST(CsvReaderTest, UnterminatedQuoteIsCorrupt) {
    auto reader = open_text("a\n1\n\"open\n");
    ASSERT_NE(reader, nullptr);
    ASSERT_TRUE(reader->next().has_value());
    auto row = reader->next();
    ASSERT_FALSE(row.has_value());
    EXPECT_EQ(row.error().code, ErrorCode::CorruptFile);
}

TEST(CsvReaderTest, DuplicateAndEmptyHeaderNames) {
    auto reader = open_text("id,,id\n1,2,3\n");
    ASSERT_NE(reader, nullptr);
    EXPECT_EQ(reader->header(), (std::vector<std::string>{"id", "Unnamed: 1", "id.1"}));
}

TEST(CsvReaderTest, MissingFileIsIoError) {
    auto reader = CsvReader::open("/nonexistent/sheetload/input.csv");
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, ErrorCode::IoError);
}

}  // namespace
}  // namespace sheetload
