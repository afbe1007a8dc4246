// SPDX-License-Identifier: MIT

// include/sheetload/coercion.hpp
#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "sheetload/schema.hpp"
#include "sheetload/value.hpp"

namespace sheetload {

/// Per-column conversion settings for source cells.
struct CoercionRule {
    /// Pattern for text dates and timestamps using YYYY, YY, MM, DD, HH, mm
    /// and ss; other characters must match literally. Unset accepts ISO
    /// "YYYY-MM-DD" and "YYYY-MM-DD HH:mm:ss" (also with a 'T' separator).
    std::optional<std::string> date_format;
    char decimal_separator = '.';
    std::optional<char> thousands_separator;
    bool trim = true;                      ///< Strip surrounding whitespace from text
    std::vector<std::string> true_values;  ///< Extra literals read as TRUE (case-insensitive)
    std::vector<std::string> false_values; ///< Extra literals read as FALSE (case-insensitive)
};

/// Convert a source cell to a value of the target column kind.
///
/// Pure and deterministic. Null stays null (the caller decides whether null
/// is acceptable); after trimming, empty text is null as well.
/// @return A description of the failure when the cell cannot be converted.
std::expected<SqlValue, std::string> coerce(const CellValue& cell, DataKind kind,
                                            const CoercionRule& rule = {});

/// Parse text against a date pattern. Exposed for configuration validation.
std::expected<Timestamp, std::string> parse_datetime(std::string_view text,
                                                     std::string_view pattern);

/// Check that a date pattern only uses known tokens.
bool is_valid_date_format(std::string_view pattern);

}  // namespace sheetload
