// SPDX-License-Identifier: MIT

#include "sheetload/value.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace sheetload {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string format_number(double d) {
    return fmt::format("{}", d);
}

}  // namespace

std::string format_date(Date d) {
    return fmt::format("{:04}-{:02}-{:02}",
                       static_cast<int>(d.year()),
                       static_cast<unsigned>(d.month()),
                       static_cast<unsigned>(d.day()));
}

std::string format_timestamp(Timestamp ts) {
    auto day = std::chrono::floor<std::chrono::days>(ts);
    std::chrono::hh_mm_ss tod{ts - day};
    auto out = fmt::format("{} {:02}:{:02}:{:02}",
                           format_date(Date{day}),
                           tod.hours().count(),
                           tod.minutes().count(),
                           tod.seconds().count());
    if (tod.subseconds().count() != 0) {
        out += fmt::format(".{:06}", tod.subseconds().count());
    }
    return out;
}

std::optional<Timestamp> excel_serial_to_timestamp(double serial, bool date1904) {
    using namespace std::chrono;
    if (!std::isfinite(serial) || serial < 0 || serial >= 2958466) {
        return std::nullopt;  // Past 9999-12-31
    }
    double whole = std::floor(serial);
    auto day = static_cast<int>(whole);
    sys_days epoch;
    if (date1904) {
        epoch = sys_days{year{1904} / January / 1};
    } else if (day < 60) {
        // Serials below the phantom 1900-02-29 count from 1899-12-31
        epoch = sys_days{year{1899} / December / 31};
    } else {
        epoch = sys_days{year{1899} / December / 30};
    }
    auto micros = static_cast<int64_t>(std::llround((serial - whole) * 86400.0 * 1e6));
    return Timestamp{epoch + days{day}} + microseconds{micros};
}

std::string to_display(const CellValue& v) {
    return std::visit(Overloaded{
        [](std::monostate) -> std::string { return "NULL"; },
        [](const std::string& s) { return s; },
        [](double d) { return format_number(d); },
        [](bool b) -> std::string { return b ? "TRUE" : "FALSE"; },
        [](Timestamp ts) { return format_timestamp(ts); },
    }, v);
}

std::optional<std::string> to_sql_text(const SqlValue& v) {
    return std::visit(Overloaded{
        [](std::monostate) -> std::optional<std::string> { return std::nullopt; },
        [](DefaultValue) -> std::optional<std::string> {
            throw std::invalid_argument("DEFAULT cannot be bound as a parameter");
        },
        [](const std::string& s) -> std::optional<std::string> { return s; },
        [](int64_t i) -> std::optional<std::string> { return std::to_string(i); },
        [](const Decimal& d) -> std::optional<std::string> { return d.digits; },
        [](Date d) -> std::optional<std::string> { return format_date(d); },
        [](Timestamp ts) -> std::optional<std::string> { return format_timestamp(ts); },
        [](bool b) -> std::optional<std::string> {
            return std::string(b ? "true" : "false");
        },
        [](const Bytes& b) -> std::optional<std::string> {
            // bytea hex input format
            std::string out = "\\x";
            out.reserve(2 + b.data.size() * 2);
            for (std::byte c : b.data) {
                out += fmt::format("{:02x}", static_cast<unsigned>(c));
            }
            return out;
        },
    }, v);
}

}  // namespace sheetload
