// SPDX-License-Identifier: MIT

// tests/sql_builder_test.cpp
#include <gtest/gtest.h>
#include "sheetload/sql_builder.hpp"

using namespace sheetload;

namespace {

StatementBuilder orders_builder() {
    return StatementBuilder(TableIdentifier{"sales", "orders"}, {"id", "Customer Name", "total"});
}

}  // namespace

TEST(QuoteIdentifierTest, DoublesEmbeddedQuotes) {
    EXPECT_EQ(quote_identifier("plain"), "\"plain\"");
    EXPECT_EQ(quote_identifier("we\"ird"), "\"we\"\"ird\"");
}

TEST(StatementBuilderTest, SingleInsert) {
    auto builder = orders_builder();
    std::vector<SqlValue> row{int64_t{1}, std::string("Alice"), Decimal{"12.50"}};
    auto stmt = builder.insert(row);

    EXPECT_EQ(stmt.sql,
              "INSERT INTO \"sales\".\"orders\" (\"id\", \"Customer Name\", \"total\") "
              "VALUES ($1, $2, $3)");
    ASSERT_EQ(stmt.params.size(), 3u);
    EXPECT_EQ(stmt.params[1], SqlValue{std::string("Alice")});
}

TEST(StatementBuilderTest, DefaultUsesKeywordWithoutPlaceholder) {
    auto builder = orders_builder();
    std::vector<SqlValue> row{int64_t{1}, DefaultValue{}, Decimal{"1"}};
    auto stmt = builder.insert(row);

    EXPECT_NE(stmt.sql.find("VALUES ($1, DEFAULT, $2)"), std::string::npos);
    EXPECT_EQ(stmt.params.size(), 2u);
}

TEST(StatementBuilderTest, MultiRowInsertNumbersAcrossRows) {
    auto builder = orders_builder();
    std::vector<std::vector<SqlValue>> rows{
        {int64_t{1}, std::string("a"), Decimal{"1"}},
        {int64_t{2}, std::string("b"), Decimal{"2"}},
    };
    auto stmt = builder.insert_many(rows);

    EXPECT_NE(stmt.sql.find("VALUES ($1, $2, $3), ($4, $5, $6)"), std::string::npos);
    EXPECT_EQ(stmt.params.size(), 6u);
}

TEST(StatementBuilderTest, RowsPerStatementRespectsParameterCap) {
    auto builder = orders_builder();
    EXPECT_EQ(builder.rows_per_statement(65535), 21845u);
    EXPECT_EQ(builder.rows_per_statement(7), 2u);
    EXPECT_EQ(builder.rows_per_statement(2), 1u);  // Never zero
}

TEST(StatementBuilderTest, UpdateExcludesKeyFromSet) {
    auto builder = orders_builder();
    std::vector<SqlValue> row{int64_t{7}, std::string("Bob"), Decimal{"3.00"}};
    auto stmt = builder.update(row, 0);

    EXPECT_EQ(stmt.sql,
              "UPDATE \"sales\".\"orders\" SET \"Customer Name\" = $1, \"total\" = $2 "
              "WHERE \"id\" = $3");
    ASSERT_EQ(stmt.params.size(), 3u);
    EXPECT_EQ(stmt.params[2], SqlValue{int64_t{7}});
}

TEST(StatementBuilderTest, UpdateWithKeyInMiddle) {
    StatementBuilder builder(TableIdentifier{"", "t"}, {"a", "code", "b"});
    std::vector<SqlValue> row{std::string("x"), std::string("K1"), SqlValue{}};
    auto stmt = builder.update(row, 1);

    EXPECT_EQ(stmt.sql, "UPDATE \"t\" SET \"a\" = $1, \"b\" = $2 WHERE \"code\" = $3");
    EXPECT_TRUE(is_null(stmt.params[1]));
}
