// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sheetload/schema.hpp"
#include "sheetload/value.hpp"

namespace sheetload {

// Quote a SQL identifier, doubling embedded quotes.
std::string quote_identifier(std::string_view ident);

// A statement with its bind parameters in $n order.
struct Statement {
    std::string sql;
    std::vector<SqlValue> params;
};

// Builds parameterized INSERT and UPDATE statements for one table.
//
// DefaultValue entries are written as the DEFAULT keyword and consume no
// placeholder. Parameters are numbered from $1 within each statement.
class StatementBuilder {
public:
    StatementBuilder(TableIdentifier table, std::vector<std::string> columns)
        : table_(std::move(table)), columns_(std::move(columns)) {}

    // INSERT INTO t (c1, c2) VALUES ($1, $2)
    Statement insert(std::span<const SqlValue> row) const;

    // Multi-row INSERT covering every row of @p rows. Each row holds one
    // value per column.
    Statement insert_many(std::span<const std::vector<SqlValue>> rows) const;

    // Rows per multi-row INSERT so that one statement never exceeds
    // @p max_params placeholders. At least 1.
    std::size_t rows_per_statement(std::size_t max_params) const;

    // UPDATE t SET c1 = $1, c2 = $2 WHERE key = $3. @p row holds one value
    // per column including the key, which is excluded from SET.
    Statement update(std::span<const SqlValue> row, std::size_t key_index) const;

    const std::vector<std::string>& columns() const { return columns_; }

private:
    void append_values(std::string& sql, std::span<const SqlValue> row,
                       std::vector<SqlValue>& params) const;
    std::string column_list() const;

    TableIdentifier table_;
    std::vector<std::string> columns_;
};

}  // namespace sheetload
