// SPDX-License-Identifier: MIT

// tests/xlsx_reader_test.cpp
#include <gtest/gtest.h>
#include "sheetload/xlsx_reader.hpp"
#include "support/test_support.hpp"
#include "support/xlsx_fixture.hpp"

namespace sheetload {
namespace {

using testing::SheetSpec;
using testing::TempDir;
using testing::WorkbookSpec;
using testing::write_workbook;
using namespace std::chrono;

// Orders sheet: header in row 1, blank row 3, date-styled cells in column C
WorkbookSpec orders_workbook() {
    WorkbookSpec spec;
    spec.shared_strings = {"Name", "Amount", "Date", "Alice", "Bob", ""};
    spec.styles = testing::date_styles_xml();
    spec.sheets.push_back(SheetSpec{
        "Orders",
        "<row r=\"1\"><c r=\"A1\" t=\"s\"><v>0</v></c><c r=\"B1\" t=\"s\"><v>1</v></c>"
        "<c r=\"C1\" t=\"s\"><v>2</v></c></row>"
        "<row r=\"2\"><c r=\"A2\" t=\"s\"><v>3</v></c><c r=\"B2\"><v>12.5</v></c>"
        "<c r=\"C2\" s=\"1\"><v>45335</v></c></row>"
        "<row r=\"3\"><c r=\"A3\" t=\"s\"><v>5</v></c></row>"
        "<row r=\"4\"><c r=\"A4\" t=\"s\"><v>4</v></c><c r=\"C4\" s=\"2\"><v>45335.5</v></c></row>",
        "A1:C4",
    });
    spec.sheets.push_back(SheetSpec{
        "Notes",
        "<row r=\"2\"><c r=\"B2\" t=\"inlineStr\"><is><t>Memo</t></is></c></row>"
        "<row r=\"3\"><c r=\"B3\" t=\"b\"><v>1</v></c></row>",
        "",
    });
    return spec;
}

TEST(XlsxReaderTest, ListsSheetNamesInOrder) {
    TempDir dir;
    auto path = dir.path("orders.xlsx");
    write_workbook(path, orders_workbook());

    auto names = XlsxReader::sheet_names(path);
    ASSERT_TRUE(names.has_value()) << names.error().message;
    EXPECT_EQ(*names, (std::vector<std::string>{"Orders", "Notes"}));
}

TEST(XlsxReaderTest, ReadsFirstSheetByDefault) {
    TempDir dir;
    auto path = dir.path("orders.xlsx");
    write_workbook(path, orders_workbook());

    auto reader = XlsxReader::open(path);
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    EXPECT_EQ((*reader)->header(), (std::vector<std::string>{"Name", "Amount", "Date"}));
    EXPECT_EQ((*reader)->total_rows_hint(), std::optional<std::size_t>{3});

    auto first = (*reader)->next();
    ASSERT_TRUE(first.has_value() && first->has_value());
    const SourceRow& r1 = **first;
    EXPECT_EQ(r1.index(), 1u);
    EXPECT_EQ(r1.get(0), CellValue{std::string("Alice")});
    EXPECT_EQ(r1.get(1), CellValue{12.5});
    EXPECT_EQ(r1.get(2), CellValue{Timestamp{sys_days{year{2024} / 2 / 13}}});

    // Row 3 only holds an empty string and is skipped; row 4 keeps its index
    auto second = (*reader)->next();
    ASSERT_TRUE(second.has_value() && second->has_value());
    const SourceRow& r2 = **second;
    EXPECT_EQ(r2.index(), 3u);
    EXPECT_EQ(r2.get(0), CellValue{std::string("Bob")});
    EXPECT_TRUE(is_null(r2.get(1)));
    EXPECT_EQ(r2.get(2), CellValue{Timestamp{sys_days{year{2024} / 2 / 13}} + hours{12}});

    auto end = (*reader)->next();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(end->has_value());
}

TEST(XlsxReaderTest, SelectsSheetByName) {
    TempDir dir;
    auto path = dir.path("orders.xlsx");
    write_workbook(path, orders_workbook());

    auto reader = XlsxReader::open(path, "Notes");
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    // Header sits in row 2 column B; column A becomes an unnamed field
    EXPECT_EQ((*reader)->header(), (std::vector<std::string>{"Unnamed: 0", "Memo"}));
    auto row = (*reader)->next();
    ASSERT_TRUE(row.has_value() && row->has_value());
    EXPECT_EQ((*row)->index(), 1u);
    EXPECT_EQ((*row)->get(1), CellValue{true});
    EXPECT_FALSE((*reader)->total_rows_hint().has_value());
}

TEST(XlsxReaderTest, UnknownSheetIsSheetNotFound) {
    TempDir dir;
    auto path = dir.path("orders.xlsx");
    write_workbook(path, orders_workbook());

    auto reader = XlsxReader::open(path, "Q3");
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, ErrorCode::SheetNotFound);
}

TEST(XlsxReaderTest, StoredEntriesAndDate1904) {
    TempDir dir;
    auto path = dir.path("stored.xlsx");
    WorkbookSpec spec;
    spec.deflate = false;
    spec.date1904 = true;
    spec.styles = testing::date_styles_xml();
    spec.sheets.push_back(SheetSpec{
        "S",
        "<row r=\"1\"><c r=\"A1\" t=\"str\"><v>When</v></c></row>"
        "<row r=\"2\"><c r=\"A2\" s=\"1\"><v>0</v></c></row>",
        "",
    });
    write_workbook(path, spec);

    auto reader = XlsxReader::open(path);
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    auto row = (*reader)->next();
    ASSERT_TRUE(row.has_value() && row->has_value());
    EXPECT_EQ((*row)->get(0), CellValue{Timestamp{sys_days{year{1904} / 1 / 1}}});
}

TEST(XlsxReaderTest, ErrorCellsAreNull) {
    TempDir dir;
    auto path = dir.path("errors.xlsx");
    WorkbookSpec spec;
    spec.sheets.push_back(SheetSpec{
        "S",
        "<row r=\"1\"><c r=\"A1\" t=\"str\"><v>a</v></c><c r=\"B1\" t=\"str\"><v>b</v></c></row>"
        "<row r=\"2\"><c r=\"A2\" t=\"e\"><v>#DIV/0!</v></c><c r=\"B2\"><v>3</v></c></row>",
        "",
    });
    write_workbook(path, spec);

    auto reader = XlsxReader::open(path);
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    auto row = (*reader)->next();
    ASSERT_TRUE(row.has_value() && row->has_value());
    EXPECT_TRUE(is_null((*row)->get(0)));
    EXPECT_EQ((*row)->get(1), CellValue{3.0});
}

TEST(XlsxReaderTest, HeaderOnlySheetIsEmptySource) {
    TempDir dir;
    auto path = dir.path("empty.xlsx");
    WorkbookSpec spec;
    spec.sheets.push_back(SheetSpec{
        "S", "<row r=\"1\"><c r=\"A1\" t=\"str\"><v>a</v></c></row>", ""});
    write_workbook(path, spec);

    auto reader = XlsxReader::open(path);
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, ErrorCode::EmptySource);
}

TEST(XlsxReaderTest, MalformedSheetXmlIsCorrupt) {
    TempDir dir;
    auto path = dir.path("broken.xlsx");
    WorkbookSpec spec;
    spec.sheets.push_back(SheetSpec{"S", "<row r=\"1\"><c r=\"A1\"><v>1</v></row>", ""});
    write_workbook(path, spec);

    auto reader = XlsxReader::open(path);
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, ErrorCode::CorruptFile);
}

TEST(XlsxReaderTest, MissingWorkbookPartIsCorrupt) {
    TempDir dir;
    auto path = dir.path("notabook.xlsx");
    testing::write_zip(path, {{"hello.txt", "hi"}});

    auto reader = XlsxReader::open(path);
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, ErrorCode::CorruptFile);
}

TEST(DateFormatTest, BuiltInAndCustomCodes) {
    EXPECT_TRUE(is_date_format(14, ""));
    EXPECT_TRUE(is_date_format(22, ""));
    EXPECT_FALSE(is_date_format(2, ""));
    EXPECT_TRUE(is_date_format(164, "dd/mm/yyyy"));
    EXPECT_TRUE(is_date_format(165, "[$-409]h:mm AM/PM"));
    EXPECT_FALSE(is_date_format(166, "#,##0.00"));
    EXPECT_FALSE(is_date_format(167, "0.00\" days\""));
    EXPECT_FALSE(is_date_format(168, "[Red]0.00"));
}

TEST(ZipArchiveTest, ReadsStoredAndDeflatedEntries) {
    TempDir dir;
    auto path = dir.path("a.zip");
    std::string big(200000, 'x');
    testing::write_zip(path, {{"plain.txt", "hello", false}, {"big.txt", big, true}});

    auto archive = ZipArchive::open(path);
    ASSERT_TRUE(archive.has_value()) << archive.error().message;
    EXPECT_EQ(archive->entries().size(), 2u);
    EXPECT_EQ(*archive->read_entry("plain.txt"), "hello");
    EXPECT_EQ(*archive->read_entry("big.txt"), big);
    EXPECT_EQ(archive->find("missing"), nullptr);
}

TEST(ZipArchiveTest, CrcMismatchIsCorrupt) {
    TempDir dir;
    auto path = dir.path("a.zip");
    testing::write_zip(path, {{"plain.txt", "hello world", false},
                              {"packed.txt", std::string(5000, 'y'), true}});
    std::string bytes = testing::read_file(path);
    // Flip a stored data byte (local header is 30 bytes plus the name)
    bytes[30 + 9] ^= 0x20;
    // Break the recorded CRC of the deflated entry in the central directory
    const auto second = bytes.find("PK\x01\x02", bytes.find("PK\x01\x02") + 4);
    ASSERT_NE(second, std::string::npos);
    bytes[second + 16] ^= 0x01;
    dir.write("a.zip", bytes);

    auto archive = ZipArchive::open(path);
    ASSERT_TRUE(archive.has_value()) << archive.error().message;
    auto plain = archive->read_entry("plain.txt");
    ASSERT_FALSE(plain.has_value());
    EXPECT_EQ(plain.error().code, ErrorCode::CorruptFile);
    auto packed = archive->read_entry("packed.txt");
    ASSERT_FALSE(packed.has_value());
    EXPECT_EQ(packed.error().code, ErrorCode::CorruptFile);
}

TEST(ZipArchiveTest, OversizedDeclaredSizeIsOnlyAHint) {
    TempDir dir;
    auto path = dir.path("a.zip");
    testing::write_zip(path, {{"plain.txt", "hello", false}});
    std::string bytes = testing::read_file(path);
    // Claim a 4 GiB uncompressed size in the central directory
    const auto central = bytes.find("PK\x01\x02");
    ASSERT_NE(central, std::string::npos);
    for (int i = 0; i < 4; ++i) bytes[central + 24 + i] = '\xff';
    dir.write("a.zip", bytes);

    auto archive = ZipArchive::open(path);
    ASSERT_TRUE(archive.has_value()) << archive.error().message;
    auto plain = archive->read_entry("plain.txt");
    ASSERT_TRUE(plain.has_value()) << plain.error().message;
    EXPECT_EQ(*plain, "hello");
}

TEST(ZipArchiveTest, NotAZipIsCorrupt) {
    TempDir dir;
    auto path = dir.write("fake.zip", std::string(100, 'z'));
    auto archive = ZipArchive::open(path);
    ASSERT_FALSE(archive.has_value());
    EXPECT_EQ(archive.error().code, ErrorCode::CorruptFile);
}

}  // namespace
}  // namespace sheetload
