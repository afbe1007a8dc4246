// SPDX-License-Identifier: MIT

#include "sheetload/xlsx_reader.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <deque>
#include <unordered_map>

#include "sheetload/xml_parser.hpp"

namespace sheetload {

namespace {

constexpr std::size_t kStreamChunk = 64 * 1024;

int parse_int(std::string_view s, int fallback = 0) {
    int v = fallback;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc()) return fallback;
    return v;
}

// "BC12" -> column 54 (0-based), row 12. Row is 0 when absent.
std::pair<std::size_t, std::size_t> parse_cell_ref(std::string_view ref) {
    std::size_t col = 0;
    std::size_t i = 0;
    for (; i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i])); ++i) {
        col = col * 26 + static_cast<std::size_t>(
            std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
    }
    std::size_t row = 0;
    std::from_chars(ref.data() + i, ref.data() + ref.size(), row);
    return {col == 0 ? 0 : col - 1, row};
}

// workbook.xml: sheet names, relationship ids and the date system
class WorkbookHandler : public XmlHandler {
public:
    struct Sheet {
        std::string name;
        std::string rel_id;
    };

    void on_start(std::string_view name, const XML_Char** attrs) override {
        if (name == "sheet") {
            const char* sheet_name = find_attr(attrs, "name");
            const char* rel = find_attr(attrs, "id");
            if (sheet_name && rel) {
                sheets.push_back({sheet_name, rel});
            }
        } else if (name == "workbookPr") {
            const char* d = find_attr(attrs, "date1904");
            date1904 = d && (std::string_view(d) == "1" || std::string_view(d) == "true");
        }
    }
    void on_end(std::string_view) override {}

    std::vector<Sheet> sheets;
    bool date1904 = false;
};

// workbook.xml.rels: relationship id -> target part
class RelsHandler : public XmlHandler {
public:
    void on_start(std::string_view name, const XML_Char** attrs) override {
        if (name != "Relationship") return;
        const char* id = find_attr(attrs, "Id");
        const char* target = find_attr(attrs, "Target");
        if (id && target) {
            targets[id] = target;
        }
    }
    void on_end(std::string_view) override {}

    std::unordered_map<std::string, std::string> targets;
};

class SharedStringsHandler : public XmlHandler {
public:
    void on_start(std::string_view name, const XML_Char**) override {
        if (name == "si") {
            in_si_ = true;
            current_.clear();
        } else if (name == "t" && in_si_ && phonetic_depth_ == 0) {
            in_t_ = true;
        } else if (name == "rPh") {
            ++phonetic_depth_;
        }
    }
    void on_end(std::string_view name) override {
        if (name == "si") {
            strings.push_back(std::move(current_));
            current_.clear();
            in_si_ = false;
        } else if (name == "t") {
            in_t_ = false;
        } else if (name == "rPh") {
            --phonetic_depth_;
        }
    }
    void on_text(std::string_view text) override {
        if (in_t_) current_.append(text);
    }

    std::vector<std::string> strings;

private:
    std::string current_;
    bool in_si_ = false;
    bool in_t_ = false;
    int phonetic_depth_ = 0;
};

class StylesHandler : public XmlHandler {
public:
    void on_start(std::string_view name, const XML_Char** attrs) override {
        if (name == "numFmt") {
            const char* id = find_attr(attrs, "numFmtId");
            const char* code = find_attr(attrs, "formatCode");
            if (id && code) custom_formats[parse_int(id, -1)] = code;
        } else if (name == "cellXfs") {
            in_cell_xfs_ = true;
        } else if (name == "xf" && in_cell_xfs_) {
            const char* id = find_attr(attrs, "numFmtId");
            xf_formats.push_back(id ? parse_int(id) : 0);
        }
    }
    void on_end(std::string_view name) override {
        if (name == "cellXfs") in_cell_xfs_ = false;
    }

    std::unordered_map<int, std::string> custom_formats;
    std::vector<int> xf_formats;

private:
    bool in_cell_xfs_ = false;
};

}  // namespace

bool is_date_format(int num_fmt_id, const std::string& format_code) {
    if ((num_fmt_id >= 14 && num_fmt_id <= 22) || (num_fmt_id >= 45 && num_fmt_id <= 47)) {
        return true;
    }
    if (format_code.empty()) {
        return false;
    }
    // Only the first section (positive numbers) decides
    bool in_quotes = false;
    int bracket = 0;
    for (std::size_t i = 0; i < format_code.size(); ++i) {
        char c = format_code[i];
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (in_quotes) {
            continue;
        } else if (c == '\\' || c == '_' || c == '*') {
            ++i;  // Escaped or padding character
        } else if (c == '[') {
            ++bracket;
        } else if (c == ']') {
            if (bracket > 0) --bracket;
        } else if (bracket > 0) {
            continue;
        } else if (c == ';') {
            break;
        } else {
            char l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (l == 'd' || l == 'y' || l == 'h' || l == 's') return true;
            if (l == 'm') {
                // A lone "m" only means minutes or months alongside other tokens
                return format_code.find_first_of("dDyYhHsS") != std::string::npos;
            }
        }
    }
    return false;
}

std::expected<WorkbookInfo, Error> load_workbook(const ZipArchive& archive) {
    auto workbook_xml = archive.read_entry("xl/workbook.xml");
    if (!workbook_xml) {
        return std::unexpected(workbook_xml.error());
    }
    WorkbookHandler workbook;
    if (auto r = XmlParser(workbook).parse(*workbook_xml); !r) {
        return std::unexpected(r.error());
    }

    auto rels_xml = archive.read_entry("xl/_rels/workbook.xml.rels");
    if (!rels_xml) {
        return std::unexpected(rels_xml.error());
    }
    RelsHandler rels;
    if (auto r = XmlParser(rels).parse(*rels_xml); !r) {
        return std::unexpected(r.error());
    }

    WorkbookInfo info;
    info.date1904 = workbook.date1904;
    for (auto& sheet : workbook.sheets) {
        auto it = rels.targets.find(sheet.rel_id);
        if (it == rels.targets.end()) {
            return std::unexpected(Error{ErrorCode::CorruptFile, fmt::format(
                "Sheet '{}' has no relationship '{}'", sheet.name, sheet.rel_id)});
        }
        std::string part = it->second;
        if (!part.empty() && part.front() == '/') {
            part.erase(0, 1);
        } else {
            part = "xl/" + part;
        }
        info.sheets.push_back({std::move(sheet.name), std::move(part)});
    }
    return info;
}

std::expected<std::vector<std::string>, Error> load_shared_strings(const ZipArchive& archive) {
    if (!archive.find("xl/sharedStrings.xml")) {
        return std::vector<std::string>{};
    }
    auto xml = archive.read_entry("xl/sharedStrings.xml");
    if (!xml) {
        return std::unexpected(xml.error());
    }
    SharedStringsHandler handler;
    if (auto r = XmlParser(handler).parse(*xml); !r) {
        return std::unexpected(r.error());
    }
    return std::move(handler.strings);
}

std::expected<std::vector<bool>, Error> load_date_styles(const ZipArchive& archive) {
    if (!archive.find("xl/styles.xml")) {
        return std::vector<bool>{};
    }
    auto xml = archive.read_entry("xl/styles.xml");
    if (!xml) {
        return std::unexpected(xml.error());
    }
    StylesHandler handler;
    if (auto r = XmlParser(handler).parse(*xml); !r) {
        return std::unexpected(r.error());
    }
    std::vector<bool> dates;
    dates.reserve(handler.xf_formats.size());
    for (int id : handler.xf_formats) {
        auto it = handler.custom_formats.find(id);
        dates.push_back(is_date_format(id, it == handler.custom_formats.end()
                                               ? std::string() : it->second));
    }
    return dates;
}

// Incremental worksheet parser producing (row number, cells) pairs
class SheetStream : public XmlHandler {
public:
    struct RawRow {
        std::size_t number;
        std::vector<CellValue> cells;
    };

    SheetStream(std::unique_ptr<ZipEntryReader> entry,
                std::vector<std::string> shared_strings,
                std::vector<bool> date_styles,
                bool date1904)
        : entry_(std::move(entry))
        , shared_strings_(std::move(shared_strings))
        , date_styles_(std::move(date_styles))
        , date1904_(date1904)
        , parser_(*this)
        , buffer_(kStreamChunk) {}

    std::expected<std::optional<RawRow>, Error> next() {
        while (rows_.empty() && !eof_) {
            auto n = entry_->read(buffer_.data(), buffer_.size());
            if (!n) return std::unexpected(n.error());
            eof_ = *n == 0;
            if (auto r = parser_.feed(buffer_.data(), *n, eof_); !r) {
                return std::unexpected(r.error());
            }
            if (error_) return std::unexpected(*error_);
        }
        if (rows_.empty()) return std::nullopt;
        RawRow row = std::move(rows_.front());
        rows_.pop_front();
        return row;
    }

    // Last row number declared by <dimension>, if any
    std::optional<std::size_t> last_row() const { return last_row_; }

    void on_start(std::string_view name, const XML_Char** attrs) override {
        if (name == "row") {
            const char* r = find_attr(attrs, "r");
            row_number_ = r ? static_cast<std::size_t>(parse_int(r)) : row_number_ + 1;
            next_col_ = 0;
            cells_.clear();
        } else if (name == "c") {
            const char* r = find_attr(attrs, "r");
            col_ = r ? parse_cell_ref(r).first : next_col_;
            next_col_ = col_ + 1;
            const char* t = find_attr(attrs, "t");
            type_ = t ? t : "n";
            const char* s = find_attr(attrs, "s");
            style_ = s ? static_cast<std::size_t>(parse_int(s)) : 0;
            text_.clear();
        } else if (name == "v") {
            in_value_ = true;
        } else if (name == "is") {
            in_inline_ = true;
        } else if (name == "t" && in_inline_ && phonetic_depth_ == 0) {
            in_value_ = true;
        } else if (name == "rPh") {
            ++phonetic_depth_;
        } else if (name == "dimension") {
            if (const char* ref = find_attr(attrs, "ref")) {
                std::string_view range(ref);
                auto colon = range.find(':');
                auto last = parse_cell_ref(colon == std::string_view::npos
                                               ? range : range.substr(colon + 1));
                if (last.second > 0) last_row_ = last.second;
            }
        }
    }

    void on_end(std::string_view name) override {
        if (name == "v" || name == "t") {
            in_value_ = false;
        } else if (name == "is") {
            in_inline_ = false;
        } else if (name == "rPh") {
            --phonetic_depth_;
        } else if (name == "c") {
            finish_cell();
        } else if (name == "row") {
            rows_.push_back({row_number_, std::move(cells_)});
            cells_.clear();
        }
    }

    void on_text(std::string_view text) override {
        if (in_value_) text_.append(text);
    }

private:
    void finish_cell() {
        CellValue value = decode_cell();
        if (is_null(value)) return;
        if (cells_.size() <= col_) cells_.resize(col_ + 1);
        cells_[col_] = std::move(value);
    }

    CellValue decode_cell() {
        if (type_ == "s") {
            auto idx = static_cast<std::size_t>(parse_int(text_, -1));
            if (text_.empty() || idx >= shared_strings_.size()) {
                error_ = Error{ErrorCode::CorruptFile, fmt::format(
                    "Row {}: shared string index '{}' out of range", row_number_, text_)};
                return std::monostate{};
            }
            const auto& s = shared_strings_[idx];
            if (s.empty()) return std::monostate{};
            return s;
        }
        if (type_ == "inlineStr" || type_ == "str" || type_ == "d") {
            if (text_.empty()) return std::monostate{};
            return text_;
        }
        if (type_ == "b") {
            return text_ == "1" || text_ == "true";
        }
        if (type_ == "e" || text_.empty()) {
            return std::monostate{};
        }

        double number = 0;
        auto [ptr, ec] = std::from_chars(text_.data(), text_.data() + text_.size(), number);
        if (ec != std::errc()) {
            error_ = Error{ErrorCode::CorruptFile, fmt::format(
                "Row {}: invalid numeric cell '{}'", row_number_, text_)};
            return std::monostate{};
        }
        if (style_ < date_styles_.size() && date_styles_[style_]) {
            if (auto ts = excel_serial_to_timestamp(number, date1904_)) {
                return *ts;
            }
        }
        return number;
    }

    std::unique_ptr<ZipEntryReader> entry_;
    std::vector<std::string> shared_strings_;
    std::vector<bool> date_styles_;
    bool date1904_;
    XmlParser parser_;
    std::vector<char> buffer_;
    std::deque<RawRow> rows_;
    bool eof_ = false;
    std::optional<Error> error_;
    std::optional<std::size_t> last_row_;

    // Current row and cell
    std::size_t row_number_ = 0;
    std::vector<CellValue> cells_;
    std::size_t col_ = 0;
    std::size_t next_col_ = 0;
    std::string type_;
    std::size_t style_ = 0;
    std::string text_;
    bool in_value_ = false;
    bool in_inline_ = false;
    int phonetic_depth_ = 0;
};

XlsxReader::XlsxReader(std::unique_ptr<SheetStream> stream)
    : stream_(std::move(stream)) {}

XlsxReader::~XlsxReader() = default;

std::expected<std::vector<std::string>, Error> XlsxReader::sheet_names(const std::string& path) {
    auto archive = ZipArchive::open(path);
    if (!archive) {
        return std::unexpected(archive.error());
    }
    auto workbook = load_workbook(*archive);
    if (!workbook) {
        return std::unexpected(workbook.error());
    }
    std::vector<std::string> names;
    for (const auto& sheet : workbook->sheets) {
        names.push_back(sheet.name);
    }
    return names;
}

std::expected<std::unique_ptr<XlsxReader>, Error> XlsxReader::open(
        const std::string& path, const std::string& sheet) {
    auto archive = ZipArchive::open(path);
    if (!archive) {
        return std::unexpected(archive.error());
    }
    auto workbook = load_workbook(*archive);
    if (!workbook) {
        return std::unexpected(workbook.error());
    }
    if (workbook->sheets.empty()) {
        return std::unexpected(Error{ErrorCode::CorruptFile, "Workbook has no sheets"});
    }

    const SheetInfo* selected = &workbook->sheets.front();
    if (!sheet.empty()) {
        auto it = std::find_if(workbook->sheets.begin(), workbook->sheets.end(),
                               [&](const SheetInfo& s) { return s.name == sheet; });
        if (it == workbook->sheets.end()) {
            return std::unexpected(Error{ErrorCode::SheetNotFound,
                fmt::format("Workbook has no sheet named '{}'", sheet)});
        }
        selected = &*it;
    }

    const ZipEntry* entry = archive->find(selected->part);
    if (!entry) {
        return std::unexpected(Error{ErrorCode::CorruptFile,
            fmt::format("Sheet part '{}' is missing", selected->part)});
    }

    auto strings = load_shared_strings(*archive);
    if (!strings) return std::unexpected(strings.error());
    auto styles = load_date_styles(*archive);
    if (!styles) return std::unexpected(styles.error());
    auto reader = archive->open_entry(*entry);
    if (!reader) return std::unexpected(reader.error());

    std::unique_ptr<XlsxReader> xlsx(new XlsxReader(std::make_unique<SheetStream>(
        std::move(*reader), std::move(*strings), std::move(*styles), workbook->date1904)));
    if (auto started = xlsx->start(); !started) {
        return std::unexpected(started.error());
    }
    return xlsx;
}

std::expected<void, Error> XlsxReader::start() {
    while (true) {
        auto raw = stream_->next();
        if (!raw) return std::unexpected(raw.error());
        if (!*raw) {
            return std::unexpected(Error{ErrorCode::EmptySource, "Sheet has no header row"});
        }
        if (!RowShaper::is_blank((*raw)->cells)) {
            header_row_ = (*raw)->number;
            shaper_.emplace(normalize_header((*raw)->cells));
            break;
        }
    }

    auto first = read_row();
    if (!first) return std::unexpected(first.error());
    if (!*first) {
        return std::unexpected(Error{ErrorCode::EmptySource, "Sheet has no data rows"});
    }
    pending_ = std::move(*first);
    return {};
}

std::expected<std::optional<SourceRow>, Error> XlsxReader::read_row() {
    while (true) {
        auto raw = stream_->next();
        if (!raw) return std::unexpected(raw.error());
        if (!*raw) return std::nullopt;
        std::size_t index = (*raw)->number > header_row_ ? (*raw)->number - header_row_ : 0;
        if (auto row = shaper_->shape(std::move((*raw)->cells), index)) {
            return row;
        }
    }
}

std::expected<std::optional<SourceRow>, Error> XlsxReader::next() {
    if (pending_) {
        std::optional<SourceRow> row = std::move(pending_);
        pending_.reset();
        return row;
    }
    return read_row();
}

std::optional<std::size_t> XlsxReader::total_rows_hint() const {
    auto last = stream_->last_row();
    if (!last || *last <= header_row_) return std::nullopt;
    return *last - header_row_;
}

}  // namespace sheetload
