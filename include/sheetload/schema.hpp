// SPDX-License-Identifier: MIT

// include/sheetload/schema.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sheetload/error.hpp"

namespace sheetload {

/// Logical kind of a target column, derived from its catalog type.
enum class DataKind {
    Text,
    Integer,
    Decimal,
    Date,
    Timestamp,
    Boolean,
    Binary,
};

/// Return a lowercase name for a data kind ("decimal", "date", ...).
std::string_view to_string(DataKind kind);

/// Normalize a catalog type name and map it to a data kind.
///
/// Handles PostgreSQL spellings ("character varying", "timestamp with time
/// zone"), DuckDB spellings ("VARCHAR", "DECIMAL(18,3)") and length/precision
/// modifiers. Unrecognised types map to DataKind::Text.
DataKind kind_from_sql_type(std::string_view sql_type);

/// One column of a target table as reported by the catalog.
struct ColumnDescriptor {
    std::string name;
    DataKind kind = DataKind::Text;
    std::string sql_type;     ///< Declared type as the catalog reports it
    bool nullable = true;
    bool has_default = false;
    bool primary_key = false;
    int ordinal = 0;          ///< 1-based ordinal position
};

/// Optionally schema-qualified table name.
struct TableIdentifier {
    std::string schema;       ///< Empty means the connection's current schema
    std::string name;

    /// Split "schema.table" at the first dot; a bare name leaves schema empty.
    static TableIdentifier parse(std::string_view text);

    /// Quoted form for SQL text, e.g. "sales"."orders".
    std::string quoted() const;

    /// Unquoted form for messages, e.g. sales.orders.
    std::string display() const;
};

/// Normalized description of a target table.
///
/// Columns keep catalog ordinal order and are unique by name. The primary
/// key is the column set of the table's single PRIMARY KEY constraint.
class TableSchema {
public:
    /// Validate and build a schema.
    /// @return SchemaNotFound when @p columns is empty or names repeat.
    static std::expected<TableSchema, Error> create(
        TableIdentifier table, std::vector<ColumnDescriptor> columns);

    const TableIdentifier& table() const { return table_; }
    const std::vector<ColumnDescriptor>& columns() const { return columns_; }
    std::size_t size() const { return columns_.size(); }

    /// Look up a column by exact name.
    const ColumnDescriptor* find(std::string_view name) const;

    /// Columns flagged as primary key, in ordinal order.
    std::vector<const ColumnDescriptor*> primary_key() const;

    bool has_primary_key() const;

private:
    TableSchema(TableIdentifier table, std::vector<ColumnDescriptor> columns)
        : table_(std::move(table)), columns_(std::move(columns)) {}

    TableIdentifier table_;
    std::vector<ColumnDescriptor> columns_;
};

}  // namespace sheetload
