// SPDX-License-Identifier: MIT

#include "sheetload/source_reader.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <unordered_map>
#include <unordered_set>

#include "sheetload/csv_reader.hpp"
#include "sheetload/xlsx_reader.hpp"

namespace sheetload {

namespace {

std::string lower_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

enum class Sniffed {
    Zip,
    Ole2,
    Other,
};

std::expected<Sniffed, Error> sniff(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error{ErrorCode::IoError,
            fmt::format("Cannot open '{}'", path)});
    }
    std::array<unsigned char, 8> magic{};
    in.read(reinterpret_cast<char*>(magic.data()), magic.size());
    auto got = static_cast<std::size_t>(in.gcount());
    if (got >= 4 && magic[0] == 'P' && magic[1] == 'K' && magic[2] == 0x03 && magic[3] == 0x04) {
        return Sniffed::Zip;
    }
    if (got >= 8 && magic[0] == 0xD0 && magic[1] == 0xCF && magic[2] == 0x11 &&
        magic[3] == 0xE0 && magic[4] == 0xA1 && magic[5] == 0xB1 &&
        magic[6] == 0x1A && magic[7] == 0xE1) {
        return Sniffed::Ole2;
    }
    return Sniffed::Other;
}

struct Detected {
    SourceFormat format;
    char delimiter = ',';
};

std::expected<Detected, Error> detect(const std::string& path, const SourceOptions& options) {
    auto sniffed = sniff(path);
    if (!sniffed) {
        return std::unexpected(sniffed.error());
    }
    const std::string ext = lower_extension(path);

    if (*sniffed == Sniffed::Ole2) {
        return std::unexpected(Error{ErrorCode::UnsupportedFormat,
            fmt::format("'{}' is a legacy binary workbook; save it as .xlsx", path)});
    }
    if (ext == ".xlsb") {
        return std::unexpected(Error{ErrorCode::UnsupportedFormat,
            fmt::format("'{}' is a binary workbook; save it as .xlsx", path)});
    }
    if (*sniffed == Sniffed::Zip) {
        return Detected{SourceFormat::Xlsx};
    }
    if (ext == ".xlsx" || ext == ".xlsm") {
        return std::unexpected(Error{ErrorCode::CorruptFile,
            fmt::format("'{}' is not a valid workbook archive", path)});
    }
    if (ext == ".csv" || ext == ".txt") {
        return Detected{SourceFormat::Delimited, options.delimiter.value_or(',')};
    }
    if (ext == ".tsv" || ext == ".tab") {
        return Detected{SourceFormat::Delimited, options.delimiter.value_or('\t')};
    }
    return std::unexpected(Error{ErrorCode::UnsupportedFormat,
        fmt::format("'{}' is not a recognized spreadsheet file", path)});
}

}  // namespace

const CellValue* SourceRow::find(std::string_view field) const {
    const auto& names = *header_;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == field) return &cells_[i];
    }
    return nullptr;
}

std::string SourceRow::to_string() const {
    std::string out;
    const auto& names = *header_;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
        out += '=';
        out += to_display(cells_[i]);
    }
    return out;
}

std::vector<std::string> normalize_header(const std::vector<CellValue>& raw) {
    std::vector<std::string> names;
    names.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (is_null(raw[i])) {
            names.push_back(fmt::format("Unnamed: {}", i));
        } else {
            names.push_back(to_display(raw[i]));
        }
    }

    // Second and later occurrences get ".1", ".2", ... skipping taken names
    std::unordered_set<std::string> taken(names.begin(), names.end());
    std::unordered_map<std::string, int> counts;
    std::unordered_set<std::string> seen;
    for (auto& name : names) {
        if (seen.insert(name).second) continue;
        int& n = counts[name];
        std::string candidate;
        do {
            candidate = fmt::format("{}.{}", name, ++n);
        } while (taken.contains(candidate));
        taken.insert(candidate);
        seen.insert(candidate);
        name = std::move(candidate);
    }
    return names;
}

bool RowShaper::is_blank(const std::vector<CellValue>& cells) {
    return std::all_of(cells.begin(), cells.end(),
                       [](const CellValue& c) { return is_null(c); });
}

std::optional<SourceRow> RowShaper::shape(std::vector<CellValue> cells,
                                          std::size_t index) const {
    cells.resize(header_->size());
    if (is_blank(cells)) {
        return std::nullopt;
    }
    return SourceRow(header_, std::move(cells), index);
}

std::expected<std::unique_ptr<ISourceReader>, Error> open_source(
        const std::string& path, const SourceOptions& options) {
    auto detected = detect(path, options);
    if (!detected) {
        return std::unexpected(detected.error());
    }
    if (detected->format == SourceFormat::Xlsx) {
        auto reader = XlsxReader::open(path, options.sheet);
        if (!reader) return std::unexpected(reader.error());
        return std::unique_ptr<ISourceReader>(std::move(*reader));
    }
    auto reader = CsvReader::open(path, detected->delimiter);
    if (!reader) return std::unexpected(reader.error());
    return std::unique_ptr<ISourceReader>(std::move(*reader));
}

std::expected<std::vector<std::string>, Error> list_sheets(const std::string& path) {
    auto detected = detect(path, {});
    if (!detected) {
        return std::unexpected(detected.error());
    }
    if (detected->format == SourceFormat::Xlsx) {
        return XlsxReader::sheet_names(path);
    }
    return std::vector<std::string>{};
}

std::expected<Preview, Error> preview(const std::string& path, std::size_t limit,
                                      const SourceOptions& options) {
    auto reader = open_source(path, options);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    Preview out;
    out.header = (*reader)->header();
    while (out.rows.size() < limit) {
        auto row = (*reader)->next();
        if (!row) return std::unexpected(row.error());
        if (!*row) break;
        out.rows.push_back(std::move(**row));
    }
    return out;
}

}  // namespace sheetload
