// SPDX-License-Identifier: MIT

// include/sheetload/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace sheetload {

/// Error codes for setup, per-row and fatal failures of an import run.
enum class ErrorCode {
    // Setup
    SchemaNotFound,          ///< Target table missing or catalog unreadable
    UnsupportedFormat,       ///< File is not a recognized spreadsheet container
    CorruptFile,             ///< Container could not be parsed
    EmptySource,             ///< Source has no data rows
    SheetNotFound,           ///< Requested worksheet does not exist

    // Mapping validation
    UnknownTargetColumn,     ///< Mapping names a column absent from the table
    UnknownSourceField,      ///< Mapping names a field absent from the header
    MissingKeyMapping,       ///< Update mode without a key mapping
    InvalidKeyColumn,        ///< Key maps to a non-PK column, or several keys declared
    RequiredColumnUnmapped,  ///< NOT NULL column without default has no mapping
    DuplicateTargetColumn,   ///< Two mappings populate the same column
    EmptyMapping,            ///< Nothing to write

    // Per-row
    TypeCoercionFailed,      ///< Source value could not be converted to the column kind
    RequiredValueMissing,    ///< Null value for a NOT NULL column
    MissingKeyValue,         ///< Update row whose key value is null
    KeyNotFound,             ///< Update matched no row
    KeyNotUnique,            ///< Update matched more than one row
    ConstraintViolation,     ///< Database rejected the row (SQLSTATE class 23)
    DatabaseError,           ///< Any other statement failure

    // Fatal
    ConnectionLost,          ///< Database unreachable during the run

    // Configuration
    InvalidConfig,           ///< Job description malformed
    IoError,                 ///< File could not be opened or written
};

/// Error payload returned from setup steps and recorded for fatal failures.
struct Error {
    ErrorCode code;          ///< Classified error code
    std::string message;     ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "setup", "row").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::SchemaNotFound:
        case ErrorCode::UnsupportedFormat:
        case ErrorCode::CorruptFile:
        case ErrorCode::EmptySource:
        case ErrorCode::SheetNotFound:
            return "setup";
        case ErrorCode::UnknownTargetColumn:
        case ErrorCode::UnknownSourceField:
        case ErrorCode::MissingKeyMapping:
        case ErrorCode::InvalidKeyColumn:
        case ErrorCode::RequiredColumnUnmapped:
        case ErrorCode::DuplicateTargetColumn:
        case ErrorCode::EmptyMapping:
            return "mapping";
        case ErrorCode::TypeCoercionFailed:
        case ErrorCode::RequiredValueMissing:
        case ErrorCode::MissingKeyValue:
        case ErrorCode::KeyNotFound:
        case ErrorCode::KeyNotUnique:
            return "row";
        case ErrorCode::ConstraintViolation:
        case ErrorCode::DatabaseError:
        case ErrorCode::ConnectionLost:
            return "database";
        case ErrorCode::InvalidConfig:
        case ErrorCode::IoError:
            return "config";
    }
    return "unknown";
}

/// Return the enumerator name, used in logs and CLI output.
constexpr std::string_view error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SchemaNotFound: return "SchemaNotFound";
        case ErrorCode::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorCode::CorruptFile: return "CorruptFile";
        case ErrorCode::EmptySource: return "EmptySource";
        case ErrorCode::SheetNotFound: return "SheetNotFound";
        case ErrorCode::UnknownTargetColumn: return "UnknownTargetColumn";
        case ErrorCode::UnknownSourceField: return "UnknownSourceField";
        case ErrorCode::MissingKeyMapping: return "MissingKeyMapping";
        case ErrorCode::InvalidKeyColumn: return "InvalidKeyColumn";
        case ErrorCode::RequiredColumnUnmapped: return "RequiredColumnUnmapped";
        case ErrorCode::DuplicateTargetColumn: return "DuplicateTargetColumn";
        case ErrorCode::EmptyMapping: return "EmptyMapping";
        case ErrorCode::TypeCoercionFailed: return "TypeCoercionFailed";
        case ErrorCode::RequiredValueMissing: return "RequiredValueMissing";
        case ErrorCode::MissingKeyValue: return "MissingKeyValue";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::KeyNotUnique: return "KeyNotUnique";
        case ErrorCode::ConstraintViolation: return "ConstraintViolation";
        case ErrorCode::DatabaseError: return "DatabaseError";
        case ErrorCode::ConnectionLost: return "ConnectionLost";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::IoError: return "IoError";
    }
    return "Unknown";
}

}  // namespace sheetload
