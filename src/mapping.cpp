// SPDX-License-Identifier: MIT

#include "sheetload/mapping.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <unordered_map>

namespace sheetload {

std::string_view to_string(ImportMode mode) {
    switch (mode) {
        case ImportMode::Insert: return "insert";
        case ImportMode::Update: return "update";
    }
    return "insert";
}

std::expected<CompiledMapping, Error> CompiledMapping::compile(
        const TableSchema& schema,
        const std::vector<std::string>& header,
        const std::vector<FieldMapping>& mappings,
        ImportMode mode) {
    const std::string table = schema.table().display();
    if (mappings.empty()) {
        return std::unexpected(Error{ErrorCode::EmptyMapping, "No columns selected"});
    }

    std::unordered_map<std::string, const FieldMapping*> by_target;
    std::vector<const FieldMapping*> keys;
    for (const auto& m : mappings) {
        const ColumnDescriptor* col = schema.find(m.target);
        if (!col) {
            return std::unexpected(Error{ErrorCode::UnknownTargetColumn,
                fmt::format("Column '{}' does not exist in '{}'", m.target, table)});
        }
        if (!by_target.emplace(m.target, &m).second) {
            return std::unexpected(Error{ErrorCode::DuplicateTargetColumn,
                fmt::format("Column '{}' is mapped more than once", m.target)});
        }
        if (const auto* field = std::get_if<SourceField>(&m.source)) {
            if (std::find(header.begin(), header.end(), field->name) == header.end()) {
                return std::unexpected(Error{ErrorCode::UnknownSourceField,
                    fmt::format("Source has no field '{}' (mapped to '{}')",
                                field->name, m.target)});
            }
        }
        if (m.key) keys.push_back(&m);
    }

    if (mode == ImportMode::Update) {
        if (keys.empty()) {
            return std::unexpected(Error{ErrorCode::MissingKeyMapping,
                "Update requires one mapping flagged as key"});
        }
        if (keys.size() > 1) {
            return std::unexpected(Error{ErrorCode::InvalidKeyColumn,
                fmt::format("{} mappings are flagged as key; exactly one is allowed", keys.size())});
        }
        const FieldMapping& key = *keys.front();
        if (!schema.find(key.target)->primary_key) {
            return std::unexpected(Error{ErrorCode::InvalidKeyColumn,
                fmt::format("Key column '{}' is not part of the primary key of '{}'",
                            key.target, table)});
        }
        if (schema.primary_key().size() != 1) {
            return std::unexpected(Error{ErrorCode::InvalidKeyColumn,
                fmt::format("Primary key of '{}' has {} columns; '{}' alone does not identify a row",
                            table, schema.primary_key().size(), key.target)});
        }
        if (std::holds_alternative<Skip>(key.source)) {
            return std::unexpected(Error{ErrorCode::MissingKeyMapping,
                fmt::format("Key column '{}' is skipped", key.target)});
        }
    }

    for (const auto& col : schema.columns()) {
        if (col.nullable || col.has_default) continue;
        auto it = by_target.find(col.name);
        if (it == by_target.end() || std::holds_alternative<Skip>(it->second->source)) {
            return std::unexpected(Error{ErrorCode::RequiredColumnUnmapped,
                fmt::format("Column '{}' is NOT NULL without a default and has no mapping",
                            col.name)});
        }
    }

    CompiledMapping compiled;
    compiled.table_ = schema.table();
    compiled.mode_ = mode;
    for (const auto& col : schema.columns()) {
        auto it = by_target.find(col.name);
        if (it == by_target.end()) continue;
        const FieldMapping& m = *it->second;
        if (std::holds_alternative<Skip>(m.source)) continue;

        Binding b;
        b.column = col;
        b.rule = m.coercion.value_or(CoercionRule{});
        b.key = mode == ImportMode::Update && m.key;
        if (const auto* field = std::get_if<SourceField>(&m.source)) {
            b.source_index = static_cast<std::size_t>(
                std::find(header.begin(), header.end(), field->name) - header.begin());
        } else {
            b.constant_raw = std::get<Constant>(m.source).value;
            auto v = coerce(b.constant_raw, col.kind, b.rule);
            if (!v) {
                return std::unexpected(Error{ErrorCode::TypeCoercionFailed,
                    fmt::format("Constant for column '{}': {}", col.name, v.error())});
            }
            b.constant = std::move(*v);
        }
        if (b.key) compiled.key_index_ = compiled.bindings_.size();
        compiled.columns_.push_back(col.name);
        compiled.bindings_.push_back(std::move(b));
    }

    const std::size_t writable = compiled.bindings_.size() - (compiled.key_index_ ? 1 : 0);
    if (writable == 0) {
        return std::unexpected(Error{ErrorCode::EmptyMapping,
            mode == ImportMode::Update ? "No columns selected besides the key"
                                       : "No columns selected"});
    }
    return compiled;
}

std::expected<MappedRow, RowRejection> CompiledMapping::apply(const SourceRow& row) const {
    MappedRow out;
    out.row_index = row.index();
    out.values.reserve(bindings_.size());

    for (const auto& b : bindings_) {
        SqlValue value;
        if (b.source_index) {
            const CellValue& cell = row.get(*b.source_index);
            auto coerced = coerce(cell, b.column.kind, b.rule);
            if (!coerced) {
                return std::unexpected(RowRejection{ErrorCode::TypeCoercionFailed,
                    b.column.name, to_display(cell), coerced.error()});
            }
            value = std::move(*coerced);
        } else {
            value = b.constant;
        }

        if (is_null(value) && !b.key && !b.column.nullable) {
            if (mode_ == ImportMode::Insert && b.column.has_default) {
                value = DefaultValue{};
            } else {
                return std::unexpected(RowRejection{ErrorCode::RequiredValueMissing,
                    b.column.name, "NULL",
                    fmt::format("Column '{}' does not accept NULL", b.column.name)});
            }
        }
        out.values.push_back(std::move(value));
    }
    return out;
}

}  // namespace sheetload
