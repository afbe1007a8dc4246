// SPDX-License-Identifier: MIT

// include/sheetload/source_reader.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sheetload/error.hpp"
#include "sheetload/value.hpp"

namespace sheetload {

/// One data row of a source, with the header it was read against.
///
/// Cells are aligned to the header: short rows are padded with nulls and
/// long rows are truncated. Immutable once produced.
class SourceRow {
public:
    SourceRow() = default;
    SourceRow(std::shared_ptr<const std::vector<std::string>> header,
              std::vector<CellValue> cells, std::size_t index)
        : header_(std::move(header)), cells_(std::move(cells)), index_(index) {}

    /// 1-based data row index within the source (header excluded).
    std::size_t index() const { return index_; }

    const std::vector<std::string>& header() const { return *header_; }
    const std::vector<CellValue>& cells() const { return cells_; }

    /// Cell at a header position.
    const CellValue& get(std::size_t column) const { return cells_[column]; }

    /// Cell by field name, or nullptr when the header has no such field.
    const CellValue* find(std::string_view field) const;

    /// "Name=Alice, Amount=12.5" snapshot for failure records.
    std::string to_string() const;

private:
    std::shared_ptr<const std::vector<std::string>> header_;
    std::vector<CellValue> cells_;
    std::size_t index_ = 0;
};

/// Forward-only, non-restartable row sequence over a tabular file.
class ISourceReader {
public:
    virtual ~ISourceReader() = default;

    /// Field names after normalization (see normalize_header).
    virtual const std::vector<std::string>& header() const = 0;

    /// Next non-blank data row, std::nullopt at end of input, or CorruptFile
    /// when the container breaks mid-stream.
    virtual std::expected<std::optional<SourceRow>, Error> next() = 0;

    /// Data row count when the container declares it, for progress totals.
    virtual std::optional<std::size_t> total_rows_hint() const { return std::nullopt; }
};

struct SourceOptions {
    std::string sheet;          ///< Worksheet name; empty selects the first
    std::optional<char> delimiter;  ///< Overrides the extension's delimiter
};

/// Source formats recognised by open_source.
enum class SourceFormat {
    Xlsx,
    Delimited,
};

/// Open a spreadsheet and position it on the first data row.
///
/// The format is chosen from the file content (zip magic for XLSX, OLE2
/// magic for legacy XLS, which is rejected) and otherwise from the
/// extension (.csv, .tsv, .txt).
/// @return UnsupportedFormat, CorruptFile, EmptySource, SheetNotFound or
///         IoError on failure.
std::expected<std::unique_ptr<ISourceReader>, Error> open_source(
    const std::string& path, const SourceOptions& options = {});

/// Worksheet names in workbook order. Delimited files have a single unnamed
/// sheet and return an empty list.
std::expected<std::vector<std::string>, Error> list_sheets(const std::string& path);

struct Preview {
    std::vector<std::string> header;
    std::vector<SourceRow> rows;
};

/// Header plus up to @p limit data rows.
std::expected<Preview, Error> preview(const std::string& path, std::size_t limit = 100,
                                      const SourceOptions& options = {});

/// Name empty header cells "Unnamed: <n>" (0-based position) and suffix
/// repeated names with ".1", ".2", ...
std::vector<std::string> normalize_header(const std::vector<CellValue>& raw);

/// Row shaping shared by the readers: truncates cells beyond the header,
/// pads short rows with nulls and drops rows whose cells are all null.
class RowShaper {
public:
    explicit RowShaper(std::vector<std::string> header)
        : header_(std::make_shared<const std::vector<std::string>>(std::move(header))) {}

    const std::vector<std::string>& header() const { return *header_; }

    /// Shape @p cells into the row at data position @p index, or
    /// std::nullopt for a blank row.
    std::optional<SourceRow> shape(std::vector<CellValue> cells, std::size_t index) const;

    /// True when every cell is null.
    static bool is_blank(const std::vector<CellValue>& cells);

private:
    std::shared_ptr<const std::vector<std::string>> header_;
};

}  // namespace sheetload
