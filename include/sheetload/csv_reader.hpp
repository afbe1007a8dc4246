// SPDX-License-Identifier: MIT

#pragma once

#include <expected>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sheetload/source_reader.hpp"

namespace sheetload {

// Delimited text reader (RFC 4180 quoting).
//
// Quoted fields may span lines and use "" for an embedded quote. Empty
// cells are null; every other cell is text. A leading UTF-8 BOM is skipped.
// The first non-blank record is the header.
class CsvReader : public ISourceReader {
public:
    static std::expected<std::unique_ptr<CsvReader>, Error> open(
        const std::string& path, char delimiter = ',');

    static std::expected<std::unique_ptr<CsvReader>, Error> from_stream(
        std::unique_ptr<std::istream> in, char delimiter = ',');

    const std::vector<std::string>& header() const override { return shaper_->header(); }
    std::expected<std::optional<SourceRow>, Error> next() override;

private:
    CsvReader(std::unique_ptr<std::istream> in, char delimiter);

    std::expected<void, Error> start();

    // Next raw record, std::nullopt at end of input
    std::expected<std::optional<std::vector<CellValue>>, Error> read_record();

    // Next non-blank data row
    std::expected<std::optional<SourceRow>, Error> read_row();

    std::unique_ptr<std::istream> in_;
    char delimiter_;
    std::size_t record_ = 0;         // Records consumed so far
    std::size_t header_record_ = 0;  // Record number of the header
    std::optional<RowShaper> shaper_;
    std::optional<SourceRow> pending_;
};

}  // namespace sheetload
