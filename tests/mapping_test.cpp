// SPDX-License-Identifier: MIT

// tests/mapping_test.cpp
#include <gtest/gtest.h>
#include "sheetload/mapping.hpp"

namespace sheetload {
namespace {

using namespace std::chrono;

// Orders(Id PK integer default, CustomerName text NOT NULL, Total numeric,
//        CreatedOn date, Status text NOT NULL DEFAULT)
TableSchema orders_schema() {
    return *TableSchema::create(TableIdentifier{"", "Orders"}, {
        {.name = "Id", .kind = DataKind::Integer, .sql_type = "integer", .nullable = false,
         .has_default = true, .primary_key = true, .ordinal = 1},
        {.name = "CustomerName", .kind = DataKind::Text, .sql_type = "text",
         .nullable = false, .ordinal = 2},
        {.name = "Total", .kind = DataKind::Decimal, .sql_type = "numeric", .ordinal = 3},
        {.name = "CreatedOn", .kind = DataKind::Date, .sql_type = "date", .ordinal = 4},
        {.name = "Status", .kind = DataKind::Text, .sql_type = "text", .nullable = false,
         .has_default = true, .ordinal = 5},
    });
}

const std::vector<std::string> kHeader{"OrderId", "Name", "Amount", "Date"};

FieldMapping map(std::string target, std::string field, bool key = false) {
    return FieldMapping{std::move(target), SourceField{std::move(field)}, std::nullopt, key};
}

SourceRow make_row(std::vector<CellValue> cells, std::size_t index = 1) {
    RowShaper shaper(kHeader);
    return *shaper.shape(std::move(cells), index);
}

CellValue text(const char* s) {
    return CellValue{std::string(s)};
}

TEST(CompileTest, InsertBindsInOrdinalOrder) {
    auto m = compile(orders_schema(), kHeader, {
        map("Total", "Amount"),
        map("CustomerName", "Name"),
    }, ImportMode::Insert);
    ASSERT_TRUE(m.has_value()) << m.error().message;
    EXPECT_EQ(m->columns(), (std::vector<std::string>{"CustomerName", "Total"}));
    EXPECT_FALSE(m->key_index().has_value());
    EXPECT_EQ(m->mode(), ImportMode::Insert);
}

TEST(CompileTest, EmptyMappingRejected) {
    auto m = compile(orders_schema(), kHeader, {}, ImportMode::Insert);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::EmptyMapping);
}

TEST(CompileTest, UnknownTargetColumn) {
    auto m = compile(orders_schema(), kHeader, {map("Nope", "Name")}, ImportMode::Insert);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::UnknownTargetColumn);
}

TEST(CompileTest, UnknownSourceField) {
    auto m = compile(orders_schema(), kHeader, {map("CustomerName", "Customer")},
                     ImportMode::Insert);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::UnknownSourceField);
}

TEST(CompileTest, DuplicateTarget) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name"),
        map("CustomerName", "Amount"),
    }, ImportMode::Insert);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::DuplicateTargetColumn);
}

TEST(CompileTest, RequiredColumnUnmapped) {
    auto m = compile(orders_schema(), kHeader, {map("Total", "Amount")}, ImportMode::Insert);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::RequiredColumnUnmapped);
    EXPECT_NE(m.error().message.find("CustomerName"), std::string::npos);
}

TEST(CompileTest, SkippedRequiredColumnCountsAsUnmapped) {
    auto m = compile(orders_schema(), kHeader, {
        FieldMapping{"CustomerName", Skip{}},
        map("Total", "Amount"),
    }, ImportMode::Insert);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::RequiredColumnUnmapped);
}

TEST(CompileTest, UpdateNeedsKey) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name"),
    }, ImportMode::Update);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::MissingKeyMapping);
}

TEST(CompileTest, UpdateKeyMustBePrimaryKey) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name", true),
        map("Total", "Amount"),
    }, ImportMode::Update);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::InvalidKeyColumn);
}

TEST(CompileTest, UpdateRejectsSeveralKeys) {
    auto m = compile(orders_schema(), kHeader, {
        map("Id", "OrderId", true),
        map("CustomerName", "Name", true),
    }, ImportMode::Update);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::InvalidKeyColumn);
}

TEST(CompileTest, UpdateRejectsPartOfCompositeKey) {
    auto sales = *TableSchema::create(TableIdentifier{"", "sales"}, {
        {.name = "region", .kind = DataKind::Text, .sql_type = "text", .nullable = false,
         .primary_key = true, .ordinal = 1},
        {.name = "id", .kind = DataKind::Integer, .sql_type = "integer", .nullable = false,
         .primary_key = true, .ordinal = 2},
        {.name = "total", .kind = DataKind::Decimal, .sql_type = "numeric", .ordinal = 3},
    });
    const std::vector<std::string> header{"region", "id", "total"};

    auto m = compile(sales, header, {
        FieldMapping{"id", SourceField{"id"}, std::nullopt, true},
        FieldMapping{"total", SourceField{"total"}},
        FieldMapping{"region", SourceField{"region"}},
    }, ImportMode::Update);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::InvalidKeyColumn);

    // Inserts into the same table are unaffected
    auto insert = compile(sales, header, {
        FieldMapping{"id", SourceField{"id"}},
        FieldMapping{"region", SourceField{"region"}},
    }, ImportMode::Insert);
    EXPECT_TRUE(insert.has_value());
}

TEST(CompileTest, UpdateRejectsSkippedKey) {
    auto m = compile(orders_schema(), kHeader, {
        FieldMapping{"Id", Skip{}, std::nullopt, true},
        map("CustomerName", "Name"),
    }, ImportMode::Update);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::MissingKeyMapping);
}

TEST(CompileTest, UpdateWithOnlyKeyIsEmpty) {
    auto schema = *TableSchema::create(TableIdentifier{"", "T"}, {
        {.name = "Id", .kind = DataKind::Integer, .nullable = false, .primary_key = true,
         .ordinal = 1},
        {.name = "Note", .ordinal = 2},
    });
    auto m = compile(schema, kHeader, {map("Id", "OrderId", true)}, ImportMode::Update);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::EmptyMapping);
}

TEST(CompileTest, UpdateKeyIndex) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name"),
        map("Id", "OrderId", true),
    }, ImportMode::Update);
    ASSERT_TRUE(m.has_value()) << m.error().message;
    EXPECT_EQ(m->columns(), (std::vector<std::string>{"Id", "CustomerName"}));
    EXPECT_EQ(m->key_index(), std::optional<std::size_t>{0});
}

TEST(CompileTest, ConstantThatDoesNotCoerceFails) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name"),
        FieldMapping{"Total", Constant{text("lots")}},
    }, ImportMode::Insert);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ErrorCode::TypeCoercionFailed);
}

TEST(ApplyTest, CoercesEachColumn) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name"),
        FieldMapping{"Total", SourceField{"Amount"}, CoercionRule{.thousands_separator = ','}},
        FieldMapping{"CreatedOn", SourceField{"Date"}, CoercionRule{.date_format = "DD/MM/YYYY"}},
        FieldMapping{"Status", Constant{text("imported")}},
    }, ImportMode::Insert);
    ASSERT_TRUE(m.has_value()) << m.error().message;

    auto out = m->apply(make_row({text("1"), text("Alice"), text("1,234.50"), text("13/02/2024")}, 4));
    ASSERT_TRUE(out.has_value()) << out.error().detail;
    EXPECT_EQ(out->row_index, 4u);
    ASSERT_EQ(out->values.size(), 4u);
    EXPECT_EQ(out->values[0], SqlValue{std::string("Alice")});
    EXPECT_EQ(out->values[1], SqlValue{Decimal{"1234.50"}});
    EXPECT_EQ(out->values[2], SqlValue{Date{year{2024} / February / 13}});
    EXPECT_EQ(out->values[3], SqlValue{std::string("imported")});
}

TEST(ApplyTest, CoercionFailureNamesColumnAndValue) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name"),
        map("Total", "Amount"),
    }, ImportMode::Insert);
    ASSERT_TRUE(m.has_value());

    auto out = m->apply(make_row({text("1"), text("Bob"), text("12abc"), CellValue{}}));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().reason, ErrorCode::TypeCoercionFailed);
    EXPECT_EQ(out.error().column, "Total");
    EXPECT_EQ(out.error().value, "12abc");
}

TEST(ApplyTest, NullInRequiredColumnRejected) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name"),
        map("Total", "Amount"),
    }, ImportMode::Insert);
    ASSERT_TRUE(m.has_value());

    auto out = m->apply(make_row({text("1"), CellValue{}, text("3"), CellValue{}}));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().reason, ErrorCode::RequiredValueMissing);
    EXPECT_EQ(out.error().column, "CustomerName");
}

TEST(ApplyTest, NullWithDefaultBecomesDefaultOnInsert) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name"),
        map("Status", "Date"),
    }, ImportMode::Insert);
    ASSERT_TRUE(m.has_value());

    auto out = m->apply(make_row({text("1"), text("Ann"), CellValue{}, CellValue{}}));
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(std::holds_alternative<DefaultValue>(out->values[1]));
}

TEST(ApplyTest, NullInNullableColumnStaysNull) {
    auto m = compile(orders_schema(), kHeader, {
        map("CustomerName", "Name"),
        map("Total", "Amount"),
    }, ImportMode::Insert);
    ASSERT_TRUE(m.has_value());

    auto out = m->apply(make_row({text("1"), text("Ann"), CellValue{}, CellValue{}}));
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(is_null(out->values[1]));
}

TEST(ApplyTest, NullKeyPassesThroughForExecutor) {
    auto m = compile(orders_schema(), kHeader, {
        map("Id", "OrderId", true),
        map("CustomerName", "Name"),
        map("Total", "Amount"),
    }, ImportMode::Update);
    ASSERT_TRUE(m.has_value()) << m.error().message;

    auto out = m->apply(make_row({CellValue{}, text("Ann"), text("5"), CellValue{}}));
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(is_null(out->values[*m->key_index()]));
}

TEST(ApplyTest, UpdateNullInRequiredColumnRejectedEvenWithDefault) {
    auto m = compile(orders_schema(), kHeader, {
        map("Id", "OrderId", true),
        map("CustomerName", "Name"),
        map("Status", "Date"),
    }, ImportMode::Update);
    ASSERT_TRUE(m.has_value());

    auto out = m->apply(make_row({text("7"), text("Ann"), CellValue{}, CellValue{}}));
    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().reason, ErrorCode::RequiredValueMissing);
    EXPECT_EQ(out.error().column, "Status");
}

TEST(ImportModeTest, Names) {
    EXPECT_EQ(to_string(ImportMode::Insert), "insert");
    EXPECT_EQ(to_string(ImportMode::Update), "update");
}

}  // namespace
}  // namespace sheetload
