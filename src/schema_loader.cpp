// SPDX-License-Identifier: MIT

#include "sheetload/schema_loader.hpp"

#include <fmt/format.h>

#include <string>
#include <unordered_set>
#include <vector>

namespace sheetload {

namespace {

// Filter on the schema parameter, or on the connection's current schema
std::string schema_filter(const TableIdentifier& table, std::string_view column) {
    if (table.schema.empty()) {
        return fmt::format("{} = current_schema()", column);
    }
    return fmt::format("{} = $2", column);
}

std::vector<SqlValue> catalog_params(const TableIdentifier& table) {
    std::vector<SqlValue> params{SqlValue{table.name}};
    if (!table.schema.empty()) {
        params.emplace_back(table.schema);
    }
    return params;
}

}  // namespace

asio::awaitable<std::expected<TableSchema, Error>> load_schema(
        IDatabase& db, const TableIdentifier& table) {
    const auto params = catalog_params(table);

    const std::string columns_sql = fmt::format(
        "SELECT column_name, data_type, is_nullable, column_default, ordinal_position, "
        "       is_identity, is_generated "
        "FROM information_schema.columns "
        "WHERE table_name = $1 AND {} "
        "ORDER BY ordinal_position",
        schema_filter(table, "table_schema"));

    const std::string pk_sql = fmt::format(
        "SELECT kcu.column_name "
        "FROM information_schema.table_constraints tc "
        "JOIN information_schema.key_column_usage kcu "
        "  ON tc.constraint_name = kcu.constraint_name "
        " AND tc.table_schema = kcu.table_schema "
        " AND tc.table_name = kcu.table_name "
        "WHERE tc.constraint_type = 'PRIMARY KEY' "
        "  AND tc.table_name = $1 AND {} "
        "ORDER BY kcu.ordinal_position",
        schema_filter(table, "tc.table_schema"));

    QueryResult columns;
    QueryResult pk;
    // The error is stored and reported outside the handler; co_await is not
    // allowed inside a catch block.
    std::string failure;
    try {
        columns = co_await db.query(columns_sql, params);
        if (!columns.empty()) {
            pk = co_await db.query(pk_sql, params);
        }
    } catch (const DatabaseError& e) {
        failure = e.what();
    }
    if (!failure.empty()) {
        co_return std::unexpected(Error{ErrorCode::SchemaNotFound,
            fmt::format("Catalog query for '{}' failed: {}", table.display(), failure)});
    }
    if (columns.empty()) {
        co_return std::unexpected(Error{ErrorCode::SchemaNotFound,
            fmt::format("Table '{}' does not exist", table.display())});
    }

    std::unordered_set<std::string> pk_columns;
    for (const auto& row : pk) {
        pk_columns.emplace(row->get_string(0));
    }

    std::vector<ColumnDescriptor> descriptors;
    descriptors.reserve(columns.size());
    for (const auto& row : columns) {
        ColumnDescriptor col;
        col.name = std::string(row->get_string(0));
        col.sql_type = std::string(row->get_string(1));
        col.kind = kind_from_sql_type(col.sql_type);
        col.nullable = row->get_string(2) == "YES";
        // Identity and generated columns report no column_default but are
        // filled in by the database
        const bool identity = !row->is_null(5) && row->get_string(5) == "YES";
        const bool generated = !row->is_null(6) && row->get_string(6) == "ALWAYS";
        col.has_default = !row->is_null(3) || identity || generated;
        col.ordinal = static_cast<int>(row->get_int64(4));
        col.primary_key = pk_columns.contains(col.name);
        descriptors.push_back(std::move(col));
    }

    co_return TableSchema::create(table, std::move(descriptors));
}

}  // namespace sheetload
