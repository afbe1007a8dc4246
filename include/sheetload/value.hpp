// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sheetload {

using Date = std::chrono::year_month_day;
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

// Raw spreadsheet cell: null, text, number, boolean or a date-formatted cell.
using CellValue = std::variant<std::monostate, std::string, double, bool, Timestamp>;

// Canonical decimal text ("-1234.50"), kept as text to avoid binary rounding.
struct Decimal {
    std::string digits;

    bool operator==(const Decimal&) const = default;
};

struct Bytes {
    std::vector<std::byte> data;

    bool operator==(const Bytes&) const = default;
};

// Placeholder that binds as SQL DEFAULT instead of a parameter.
struct DefaultValue {
    bool operator==(const DefaultValue&) const = default;
};

// Value after coercion to the target column kind, ready for binding.
using SqlValue = std::variant<std::monostate, DefaultValue, std::string, int64_t,
                              Decimal, Date, Timestamp, bool, Bytes>;

inline bool is_null(const CellValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

inline bool is_null(const SqlValue& v) {
    return std::holds_alternative<std::monostate>(v);
}

// "2024-02-13"
std::string format_date(Date d);

// "2024-02-13 08:30:00" with ".ffffff" appended only when non-zero
std::string format_timestamp(Timestamp ts);

// Spreadsheet serial date to timestamp. The 1900 system keeps Excel's
// phantom 1900-02-29 (serial 60). Returns nullopt outside 0..9999-12-31.
std::optional<Timestamp> excel_serial_to_timestamp(double serial, bool date1904 = false);

// Human-readable cell rendering used in failure snapshots and logs.
std::string to_display(const CellValue& v);

// Text form accepted by PostgreSQL for a bound parameter, nullopt for NULL.
// Throws std::invalid_argument for DefaultValue, which is never bound.
std::optional<std::string> to_sql_text(const SqlValue& v);

}  // namespace sheetload
