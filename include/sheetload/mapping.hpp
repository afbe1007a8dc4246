// SPDX-License-Identifier: MIT

// include/sheetload/mapping.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sheetload/coercion.hpp"
#include "sheetload/error.hpp"
#include "sheetload/schema.hpp"
#include "sheetload/source_reader.hpp"
#include "sheetload/value.hpp"

namespace sheetload {

enum class ImportMode {
    Insert,
    Update,
};

std::string_view to_string(ImportMode mode);

/// Take the value from a named source field.
struct SourceField {
    std::string name;
};

/// Use the same value for every row.
struct Constant {
    CellValue value;
};

/// Leave the column out of the statement.
struct Skip {};

using MappingSource = std::variant<SourceField, Constant, Skip>;

/// User-declared correspondence for one target column.
struct FieldMapping {
    std::string target;
    MappingSource source;
    std::optional<CoercionRule> coercion;  ///< Defaults apply when unset
    bool key = false;                      ///< Match column for update mode
};

/// Why a row was rejected before reaching the database.
struct RowRejection {
    ErrorCode reason;        ///< TypeCoercionFailed or RequiredValueMissing
    std::string column;      ///< Target column that failed
    std::string value;       ///< Offending source value, rendered
    std::string detail;
};

/// Projected values of one source row, in CompiledMapping::columns() order.
struct MappedRow {
    std::size_t row_index = 0;
    std::vector<SqlValue> values;
};

/// Validated, immutable projection from source rows to target columns.
///
/// Bound columns follow the table's ordinal order. Skipped columns are not
/// part of the projection.
class CompiledMapping {
public:
    /// Validate @p mappings against @p schema and @p header.
    ///
    /// @return UnknownTargetColumn, UnknownSourceField, MissingKeyMapping,
    ///         InvalidKeyColumn, RequiredColumnUnmapped, DuplicateTargetColumn,
    ///         EmptyMapping, or TypeCoercionFailed for a constant that does not
    ///         convert to its column's kind.
    static std::expected<CompiledMapping, Error> compile(
        const TableSchema& schema,
        const std::vector<std::string>& header,
        const std::vector<FieldMapping>& mappings,
        ImportMode mode);

    /// Project one row. A null key value in update mode is passed through;
    /// the executor rejects it.
    std::expected<MappedRow, RowRejection> apply(const SourceRow& row) const;

    ImportMode mode() const { return mode_; }
    const TableIdentifier& table() const { return table_; }

    /// Target column names in binding order.
    const std::vector<std::string>& columns() const { return columns_; }

    /// Position of the key column within columns(); set in update mode only.
    std::optional<std::size_t> key_index() const { return key_index_; }

private:
    struct Binding {
        ColumnDescriptor column;
        std::optional<std::size_t> source_index;  // Unset for constants
        SqlValue constant;                         // Pre-coerced constant
        CellValue constant_raw;
        CoercionRule rule;
        bool key = false;
    };

    CompiledMapping() = default;

    TableIdentifier table_;
    ImportMode mode_ = ImportMode::Insert;
    std::vector<Binding> bindings_;
    std::vector<std::string> columns_;
    std::optional<std::size_t> key_index_;
};

/// Free-function form of CompiledMapping::compile.
inline std::expected<CompiledMapping, Error> compile(
        const TableSchema& schema,
        const std::vector<std::string>& header,
        const std::vector<FieldMapping>& mappings,
        ImportMode mode) {
    return CompiledMapping::compile(schema, header, mappings, mode);
}

}  // namespace sheetload
