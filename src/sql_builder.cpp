// SPDX-License-Identifier: MIT

#include "sheetload/sql_builder.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace sheetload {

std::string quote_identifier(std::string_view ident) {
    std::string result;
    result.reserve(ident.size() + 2);
    result += '"';
    for (char c : ident) {
        if (c == '"') {
            result += '"';  // Double the quote
        }
        result += c;
    }
    result += '"';
    return result;
}

std::string StatementBuilder::column_list() const {
    std::string out;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote_identifier(columns_[i]);
    }
    return out;
}

void StatementBuilder::append_values(std::string& sql, std::span<const SqlValue> row,
                                     std::vector<SqlValue>& params) const {
    sql += '(';
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) sql += ", ";
        if (std::holds_alternative<DefaultValue>(row[i])) {
            sql += "DEFAULT";
        } else {
            params.push_back(row[i]);
            fmt::format_to(std::back_inserter(sql), "${}", params.size());
        }
    }
    sql += ')';
}

Statement StatementBuilder::insert(std::span<const SqlValue> row) const {
    Statement stmt;
    stmt.sql = fmt::format("INSERT INTO {} ({}) VALUES ", table_.quoted(), column_list());
    append_values(stmt.sql, row, stmt.params);
    return stmt;
}

Statement StatementBuilder::insert_many(std::span<const std::vector<SqlValue>> rows) const {
    Statement stmt;
    stmt.sql = fmt::format("INSERT INTO {} ({}) VALUES ", table_.quoted(), column_list());
    stmt.params.reserve(rows.size() * columns_.size());
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (r > 0) stmt.sql += ", ";
        append_values(stmt.sql, rows[r], stmt.params);
    }
    return stmt;
}

std::size_t StatementBuilder::rows_per_statement(std::size_t max_params) const {
    if (columns_.empty()) return 1;
    return std::max<std::size_t>(1, max_params / columns_.size());
}

Statement StatementBuilder::update(std::span<const SqlValue> row,
                                   std::size_t key_index) const {
    Statement stmt;
    stmt.sql = fmt::format("UPDATE {} SET ", table_.quoted());
    bool first = true;
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i == key_index) continue;
        if (!first) stmt.sql += ", ";
        first = false;
        stmt.sql += quote_identifier(columns_[i]);
        if (std::holds_alternative<DefaultValue>(row[i])) {
            stmt.sql += " = DEFAULT";
        } else {
            stmt.params.push_back(row[i]);
            fmt::format_to(std::back_inserter(stmt.sql), " = ${}", stmt.params.size());
        }
    }
    stmt.params.push_back(row[key_index]);
    fmt::format_to(std::back_inserter(stmt.sql), " WHERE {} = ${}",
                   quote_identifier(columns_[key_index]), stmt.params.size());
    return stmt;
}

}  // namespace sheetload
