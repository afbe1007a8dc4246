// SPDX-License-Identifier: MIT

#include "sheetload/coercion.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>

namespace sheetload {

namespace {

using namespace std::chrono;

std::string_view trim_view(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Remove thousands separators and normalize the decimal separator to '.'.
std::string normalize_number(std::string_view text, const CoercionRule& rule) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (rule.thousands_separator && c == *rule.thousands_separator) continue;
        if (c == rule.decimal_separator) {
            out += '.';
        } else {
            out += c;
        }
    }
    return out;
}

// [+-]digits[.digits][(e|E)[+-]digits] with at least one mantissa digit
bool is_numeric_literal(std::string_view s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    std::size_t digits = 0;
    while (i < s.size() && is_digit(s[i])) { ++i; ++digits; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && is_digit(s[i])) { ++i; ++digits; }
    }
    if (digits == 0) return false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        std::size_t exp_digits = 0;
        while (i < s.size() && is_digit(s[i])) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return i == s.size();
}

std::string format_double(double d) {
    return fmt::format("{}", d);
}

std::expected<SqlValue, std::string> integer_from_double(double d) {
    if (!std::isfinite(d) || d != std::floor(d)) {
        return std::unexpected(fmt::format("{} is not a whole number", format_double(d)));
    }
    // 2^63 is exactly representable; anything at or beyond it overflows
    if (d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
        return std::unexpected(fmt::format("{} is out of range for an integer", format_double(d)));
    }
    return SqlValue{static_cast<int64_t>(d)};
}

std::expected<SqlValue, std::string> integer_from_text(std::string_view text,
                                                       const CoercionRule& rule) {
    std::string s = normalize_number(text, rule);
    if (!is_numeric_literal(s)) {
        return std::unexpected(fmt::format("'{}' is not a number", text));
    }
    std::string_view digits = s;
    if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);

    // "12.00" is accepted as 12; exponents go through double
    auto dot = digits.find('.');
    if (digits.find_first_of("eE") != std::string_view::npos) {
        return integer_from_double(std::strtod(s.c_str(), nullptr));
    }
    if (dot != std::string_view::npos) {
        auto frac = digits.substr(dot + 1);
        if (frac.find_first_not_of('0') != std::string_view::npos) {
            return std::unexpected(fmt::format("'{}' is not a whole number", text));
        }
        digits = digits.substr(0, dot);
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(fmt::format("'{}' is out of range for an integer", text));
    }
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::unexpected(fmt::format("'{}' is not a number", text));
    }
    return SqlValue{value};
}

std::expected<SqlValue, std::string> decimal_from_text(std::string_view text,
                                                       const CoercionRule& rule) {
    std::string s = normalize_number(text, rule);
    if (!is_numeric_literal(s)) {
        return std::unexpected(fmt::format("'{}' is not a number", text));
    }
    if (s.front() == '+') s.erase(0, 1);
    return SqlValue{Decimal{std::move(s)}};
}

std::expected<bool, std::string> boolean_from_text(std::string_view text,
                                                   const CoercionRule& rule) {
    const std::string l = to_lower(text);
    for (const auto& v : rule.true_values) {
        if (to_lower(v) == l) return true;
    }
    for (const auto& v : rule.false_values) {
        if (to_lower(v) == l) return false;
    }
    static constexpr std::array<std::string_view, 6> kTrue{"true", "t", "yes", "y", "1", "on"};
    static constexpr std::array<std::string_view, 6> kFalse{"false", "f", "no", "n", "0", "off"};
    if (std::find(kTrue.begin(), kTrue.end(), l) != kTrue.end()) return true;
    if (std::find(kFalse.begin(), kFalse.end(), l) != kFalse.end()) return false;
    return std::unexpected(fmt::format("'{}' is not a boolean", text));
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::expected<SqlValue, std::string> binary_from_text(std::string_view text) {
    Bytes out;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        auto hex = text.substr(2);
        if (hex.size() % 2 != 0) {
            return std::unexpected(fmt::format("'{}' has an odd number of hex digits", text));
        }
        out.data.reserve(hex.size() / 2);
        for (std::size_t i = 0; i < hex.size(); i += 2) {
            int hi = hex_value(hex[i]);
            int lo = hex_value(hex[i + 1]);
            if (hi < 0 || lo < 0) {
                return std::unexpected(fmt::format("'{}' is not valid hex", text));
            }
            out.data.push_back(static_cast<std::byte>(hi * 16 + lo));
        }
    } else {
        out.data.reserve(text.size());
        for (char c : text) {
            out.data.push_back(static_cast<std::byte>(c));
        }
    }
    return SqlValue{std::move(out)};
}

std::expected<Timestamp, std::string> datetime_from_text(std::string_view text,
                                                         const CoercionRule& rule) {
    if (rule.date_format) {
        return parse_datetime(text, *rule.date_format);
    }
    static constexpr std::array<std::string_view, 4> kIsoFormats{
        "YYYY-MM-DD", "YYYY-MM-DD HH:mm:ss", "YYYY-MM-DDTHH:mm:ss", "YYYY-MM-DD HH:mm"};
    for (auto pattern : kIsoFormats) {
        if (auto ts = parse_datetime(text, pattern)) {
            return ts;
        }
    }
    return std::unexpected(fmt::format("'{}' is not an ISO date", text));
}

std::expected<Timestamp, std::string> serial_to_timestamp(double serial) {
    auto ts = excel_serial_to_timestamp(serial);
    if (!ts) {
        return std::unexpected(fmt::format("{} is not a valid spreadsheet date", format_double(serial)));
    }
    return *ts;
}

std::expected<Timestamp, std::string> cell_to_timestamp(const CellValue& cell,
                                                        const CoercionRule& rule) {
    if (const auto* ts = std::get_if<Timestamp>(&cell)) {
        return *ts;
    }
    if (const auto* d = std::get_if<double>(&cell)) {
        return serial_to_timestamp(*d);
    }
    if (const auto* s = std::get_if<std::string>(&cell)) {
        return datetime_from_text(*s, rule);
    }
    return std::unexpected(fmt::format("{} is not a date", to_display(cell)));
}

struct Token {
    std::string_view name;
    std::size_t min_digits;
    std::size_t max_digits;
};

constexpr std::array<Token, 7> kTokens{{
    {"YYYY", 4, 4},
    {"YY", 2, 2},
    {"MM", 1, 2},
    {"DD", 1, 2},
    {"HH", 1, 2},
    {"mm", 1, 2},
    {"ss", 1, 2},
}};

const Token* match_token(std::string_view pattern) {
    for (const auto& t : kTokens) {
        if (pattern.starts_with(t.name)) return &t;
    }
    return nullptr;
}

}  // namespace

bool is_valid_date_format(std::string_view pattern) {
    bool year = false;
    bool month = false;
    bool day = false;
    while (!pattern.empty()) {
        if (const Token* t = match_token(pattern)) {
            year = year || t->name == "YYYY" || t->name == "YY";
            month = month || t->name == "MM";
            day = day || t->name == "DD";
            pattern.remove_prefix(t->name.size());
        } else {
            pattern.remove_prefix(1);
        }
    }
    return year && month && day;
}

std::expected<Timestamp, std::string> parse_datetime(std::string_view text,
                                                     std::string_view pattern) {
    const std::string_view original = text;
    const std::string_view original_pattern = pattern;
    auto mismatch = [&]() {
        return std::unexpected(fmt::format("'{}' does not match date format '{}'",
                                           original, original_pattern));
    };

    int y = 1970;
    unsigned mo = 1;
    unsigned d = 1;
    int h = 0;
    int mi = 0;
    int s = 0;
    int64_t micros = 0;
    bool last_was_seconds = false;

    while (!pattern.empty()) {
        last_was_seconds = false;
        const Token* t = match_token(pattern);
        if (!t) {
            if (text.empty() || text.front() != pattern.front()) return mismatch();
            text.remove_prefix(1);
            pattern.remove_prefix(1);
            continue;
        }
        std::size_t n = 0;
        while (n < t->max_digits && n < text.size() && is_digit(text[n])) ++n;
        if (n < t->min_digits) return mismatch();
        int value = 0;
        std::from_chars(text.data(), text.data() + n, value);
        text.remove_prefix(n);
        pattern.remove_prefix(t->name.size());

        if (t->name == "YYYY") {
            y = value;
        } else if (t->name == "YY") {
            y = value < 69 ? 2000 + value : 1900 + value;
        } else if (t->name == "MM") {
            mo = static_cast<unsigned>(value);
        } else if (t->name == "DD") {
            d = static_cast<unsigned>(value);
        } else if (t->name == "HH") {
            h = value;
        } else if (t->name == "mm") {
            mi = value;
        } else {
            s = value;
            last_was_seconds = true;
        }
    }

    // Fractional seconds after a trailing ss
    if (last_was_seconds && !text.empty() && text.front() == '.') {
        text.remove_prefix(1);
        std::size_t n = 0;
        int64_t scale = 100000;
        while (n < text.size() && is_digit(text[n])) {
            if (scale > 0) {
                micros += (text[n] - '0') * scale;
                scale /= 10;
            }
            ++n;
        }
        if (n == 0) return mismatch();
        text.remove_prefix(n);
    }
    if (!text.empty()) return mismatch();

    const year_month_day ymd{year{y}, month{mo}, day{d}};
    if (!ymd.ok()) {
        return std::unexpected(fmt::format("'{}' is not a valid calendar date", original));
    }
    if (h > 23 || mi > 59 || s > 59) {
        return std::unexpected(fmt::format("'{}' is not a valid time of day", original));
    }
    return Timestamp{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{s} + microseconds{micros};
}

std::expected<SqlValue, std::string> coerce(const CellValue& cell, DataKind kind,
                                            const CoercionRule& rule) {
    if (is_null(cell)) {
        return SqlValue{};
    }

    // Text cells: trim, and treat blank as null
    CellValue value = cell;
    if (auto* s = std::get_if<std::string>(&value)) {
        if (rule.trim) {
            *s = std::string(trim_view(*s));
        }
        if (trim_view(*s).empty()) {
            return SqlValue{};
        }
    }
    const auto* text = std::get_if<std::string>(&value);

    switch (kind) {
        case DataKind::Text:
            if (text) return SqlValue{*text};
            return SqlValue{to_display(value)};

        case DataKind::Integer:
            if (text) return integer_from_text(*text, rule);
            if (const auto* d = std::get_if<double>(&value)) return integer_from_double(*d);
            if (const auto* b = std::get_if<bool>(&value)) return SqlValue{int64_t{*b ? 1 : 0}};
            break;

        case DataKind::Decimal:
            if (text) return decimal_from_text(*text, rule);
            if (const auto* d = std::get_if<double>(&value)) {
                if (!std::isfinite(*d)) break;
                return SqlValue{Decimal{format_double(*d)}};
            }
            break;

        case DataKind::Date: {
            auto ts = cell_to_timestamp(value, rule);
            if (!ts) return std::unexpected(ts.error());
            return SqlValue{Date{std::chrono::floor<days>(*ts)}};
        }

        case DataKind::Timestamp: {
            auto ts = cell_to_timestamp(value, rule);
            if (!ts) return std::unexpected(ts.error());
            return SqlValue{*ts};
        }

        case DataKind::Boolean:
            if (const auto* b = std::get_if<bool>(&value)) return SqlValue{*b};
            if (text) {
                auto b = boolean_from_text(*text, rule);
                if (!b) return std::unexpected(b.error());
                return SqlValue{*b};
            }
            if (const auto* d = std::get_if<double>(&value)) {
                if (*d == 1.0) return SqlValue{true};
                if (*d == 0.0) return SqlValue{false};
            }
            break;

        case DataKind::Binary:
            if (text) return binary_from_text(*text);
            break;
    }
    return std::unexpected(fmt::format("{} cannot be converted to {}",
                                       to_display(value), to_string(kind)));
}

}  // namespace sheetload
