// SPDX-License-Identifier: MIT

// include/sheetload/xlsx_reader.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sheetload/source_reader.hpp"
#include "sheetload/zip_archive.hpp"

namespace sheetload {

/// Worksheet listed in the workbook part.
struct SheetInfo {
    std::string name;
    std::string part;    ///< Zip entry of the worksheet, e.g. "xl/worksheets/sheet1.xml"
};

/// Workbook-level metadata needed to read any sheet.
struct WorkbookInfo {
    std::vector<SheetInfo> sheets;
    bool date1904 = false;
};

/// Read workbook.xml and its relationships.
std::expected<WorkbookInfo, Error> load_workbook(const ZipArchive& archive);

/// Shared string table (xl/sharedStrings.xml); empty when the part is absent.
std::expected<std::vector<std::string>, Error> load_shared_strings(const ZipArchive& archive);

/// Per cell-format flag telling whether the style index renders as a date
/// (xl/styles.xml cellXfs); empty when the part is absent.
std::expected<std::vector<bool>, Error> load_date_styles(const ZipArchive& archive);

/// Whether a number format displays a date or time: built-in ids 14-22 and
/// 45-47, or a custom code with date/time tokens outside quotes and brackets.
bool is_date_format(int num_fmt_id, const std::string& format_code);

class SheetStream;

/// Office Open XML workbook reader (.xlsx, .xlsm).
///
/// The worksheet part is inflated and parsed incrementally, so memory use
/// is bounded by the shared string table plus one decompression buffer.
///
/// Cell mapping:
/// - shared, inline and formula strings -> text
/// - numbers -> number, or date-time when the cell style is a date format
/// - booleans -> boolean
/// - error cells and empty strings -> null
class XlsxReader : public ISourceReader {
public:
    /// Open @p sheet (empty selects the first sheet).
    /// @return SheetNotFound, CorruptFile, IoError or EmptySource.
    static std::expected<std::unique_ptr<XlsxReader>, Error> open(
        const std::string& path, const std::string& sheet = "");

    /// Sheet names in workbook order.
    static std::expected<std::vector<std::string>, Error> sheet_names(const std::string& path);

    ~XlsxReader() override;

    const std::vector<std::string>& header() const override { return shaper_->header(); }
    std::expected<std::optional<SourceRow>, Error> next() override;
    std::optional<std::size_t> total_rows_hint() const override;

private:
    explicit XlsxReader(std::unique_ptr<SheetStream> stream);

    std::expected<void, Error> start();
    std::expected<std::optional<SourceRow>, Error> read_row();

    std::unique_ptr<SheetStream> stream_;
    std::size_t header_row_ = 0;     // Worksheet row number of the header
    std::optional<RowShaper> shaper_;
    std::optional<SourceRow> pending_;
};

}  // namespace sheetload
