// SPDX-License-Identifier: MIT

#include "sheetload/schema.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "sheetload/sql_builder.hpp"

namespace sheetload {

namespace {

// Lowercase and drop length/precision modifiers: "DECIMAL(18,3)" -> "decimal".
std::string normalize_type(std::string_view t) {
    std::string out;
    out.reserve(t.size());
    int depth = 0;
    for (char c : t) {
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (depth > 0) --depth;
        } else if (depth == 0) {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    // Collapse whitespace left behind by stripped modifiers
    std::string collapsed;
    bool space = false;
    for (char c : out) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = !collapsed.empty();
            continue;
        }
        if (space) collapsed += ' ';
        space = false;
        collapsed += c;
    }
    // Array types stay text
    if (collapsed.ends_with("[]")) return "array";
    return collapsed;
}

}  // namespace

std::string_view to_string(DataKind kind) {
    switch (kind) {
        case DataKind::Text: return "text";
        case DataKind::Integer: return "integer";
        case DataKind::Decimal: return "decimal";
        case DataKind::Date: return "date";
        case DataKind::Timestamp: return "timestamp";
        case DataKind::Boolean: return "boolean";
        case DataKind::Binary: return "binary";
    }
    return "text";
}

DataKind kind_from_sql_type(std::string_view sql_type) {
    const std::string t = normalize_type(sql_type);

    // Integer types
    if (t == "smallint" || t == "integer" || t == "int" || t == "bigint" ||
        t == "int2" || t == "int4" || t == "int8" || t == "tinyint" ||
        t == "hugeint" || t == "utinyint" || t == "usmallint" ||
        t == "uinteger" || t == "ubigint" || t == "serial" ||
        t == "bigserial" || t == "smallserial") {
        return DataKind::Integer;
    }
    // Exact and approximate numerics
    if (t == "numeric" || t == "decimal" || t == "real" || t == "float" ||
        t == "float4" || t == "float8" || t == "double" ||
        t == "double precision" || t == "money" || t == "smallmoney") {
        return DataKind::Decimal;
    }
    if (t == "date") {
        return DataKind::Date;
    }
    // Timestamps (information_schema returns verbose forms)
    if (t == "timestamp" || t == "timestamptz" ||
        t == "timestamp without time zone" || t == "timestamp with time zone" ||
        t == "datetime" || t == "datetime2" || t == "smalldatetime" ||
        t == "datetimeoffset" || t == "timestamp_s" || t == "timestamp_ms" ||
        t == "timestamp_ns") {
        return DataKind::Timestamp;
    }
    if (t == "boolean" || t == "bool" || t == "bit") {
        return DataKind::Boolean;
    }
    if (t == "bytea" || t == "blob" || t == "binary" || t == "varbinary" ||
        t == "bytes") {
        return DataKind::Binary;
    }
    return DataKind::Text;
}

TableIdentifier TableIdentifier::parse(std::string_view text) {
    auto dot = text.find('.');
    if (dot == std::string_view::npos) {
        return TableIdentifier{"", std::string(text)};
    }
    return TableIdentifier{std::string(text.substr(0, dot)),
                           std::string(text.substr(dot + 1))};
}

std::string TableIdentifier::quoted() const {
    if (schema.empty()) return quote_identifier(name);
    return quote_identifier(schema) + "." + quote_identifier(name);
}

std::string TableIdentifier::display() const {
    if (schema.empty()) return name;
    return schema + "." + name;
}

std::expected<TableSchema, Error> TableSchema::create(
        TableIdentifier table, std::vector<ColumnDescriptor> columns) {
    if (columns.empty()) {
        return std::unexpected(Error{ErrorCode::SchemaNotFound,
            "Table '" + table.display() + "' has no visible columns"});
    }
    std::unordered_set<std::string> seen;
    for (const auto& col : columns) {
        if (!seen.insert(col.name).second) {
            return std::unexpected(Error{ErrorCode::SchemaNotFound,
                "Table '" + table.display() + "' reports column '" +
                col.name + "' more than once"});
        }
    }
    std::stable_sort(columns.begin(), columns.end(),
                     [](const ColumnDescriptor& a, const ColumnDescriptor& b) {
                         return a.ordinal < b.ordinal;
                     });
    return TableSchema(std::move(table), std::move(columns));
}

const ColumnDescriptor* TableSchema::find(std::string_view name) const {
    for (const auto& col : columns_) {
        if (col.name == name) return &col;
    }
    return nullptr;
}

std::vector<const ColumnDescriptor*> TableSchema::primary_key() const {
    std::vector<const ColumnDescriptor*> pk;
    for (const auto& col : columns_) {
        if (col.primary_key) pk.push_back(&col);
    }
    return pk;
}

bool TableSchema::has_primary_key() const {
    return std::any_of(columns_.begin(), columns_.end(),
                       [](const ColumnDescriptor& c) { return c.primary_key; });
}

}  // namespace sheetload
