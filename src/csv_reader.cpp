// SPDX-License-Identifier: MIT

#include "sheetload/csv_reader.hpp"

#include <fmt/format.h>

#include <fstream>

namespace sheetload {

CsvReader::CsvReader(std::unique_ptr<std::istream> in, char delimiter)
    : in_(std::move(in)), delimiter_(delimiter) {}

std::expected<std::unique_ptr<CsvReader>, Error> CsvReader::open(
        const std::string& path, char delimiter) {
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*in) {
        return std::unexpected(Error{ErrorCode::IoError,
            fmt::format("Cannot open '{}'", path)});
    }
    return from_stream(std::move(in), delimiter);
}

std::expected<std::unique_ptr<CsvReader>, Error> CsvReader::from_stream(
        std::unique_ptr<std::istream> in, char delimiter) {
    std::unique_ptr<CsvReader> reader(new CsvReader(std::move(in), delimiter));
    if (auto started = reader->start(); !started) {
        return std::unexpected(started.error());
    }
    return reader;
}

std::expected<void, Error> CsvReader::start() {
    // Skip UTF-8 BOM
    if (in_->peek() == 0xEF) {
        char bom[3] = {};
        in_->read(bom, 3);
        if (in_->gcount() != 3 || static_cast<unsigned char>(bom[1]) != 0xBB ||
            static_cast<unsigned char>(bom[2]) != 0xBF) {
            in_->clear();
            in_->seekg(0);
        }
    }

    while (true) {
        auto record = read_record();
        if (!record) return std::unexpected(record.error());
        if (!*record) {
            return std::unexpected(Error{ErrorCode::EmptySource, "File has no header row"});
        }
        if (!RowShaper::is_blank(**record)) {
            header_record_ = record_;
            shaper_.emplace(normalize_header(**record));
            break;
        }
    }

    auto first = read_row();
    if (!first) return std::unexpected(first.error());
    if (!*first) {
        return std::unexpected(Error{ErrorCode::EmptySource, "File has no data rows"});
    }
    pending_ = std::move(*first);
    return {};
}

std::expected<std::optional<std::vector<CellValue>>, Error> CsvReader::read_record() {
    std::vector<CellValue> cells;
    std::string field;
    bool in_quotes = false;
    bool any = false;

    auto finish_field = [&]() {
        if (field.empty()) {
            cells.emplace_back(std::monostate{});
        } else {
            cells.emplace_back(std::move(field));
        }
        field.clear();
    };

    int c;
    while ((c = in_->get()) != std::char_traits<char>::eof()) {
        any = true;
        char ch = static_cast<char>(c);
        if (in_quotes) {
            if (ch == '"') {
                if (in_->peek() == '"') {
                    in_->get();
                    field += '"';
                } else {
                    in_quotes = false;
                }
            } else {
                field += ch;
            }
        } else if (ch == '"') {
            in_quotes = true;
        } else if (ch == delimiter_) {
            finish_field();
        } else if (ch == '\n') {
            break;
        } else if (ch == '\r') {
            if (in_->peek() == '\n') in_->get();
            break;
        } else {
            field += ch;
        }
    }

    if (in_->bad()) {
        return std::unexpected(Error{ErrorCode::IoError, "Read error"});
    }
    if (in_quotes) {
        return std::unexpected(Error{ErrorCode::CorruptFile,
            fmt::format("Unterminated quoted field in record {}", record_ + 1)});
    }
    if (!any) {
        return std::nullopt;
    }
    finish_field();
    ++record_;
    return cells;
}

std::expected<std::optional<SourceRow>, Error> CsvReader::read_row() {
    while (true) {
        auto record = read_record();
        if (!record) return std::unexpected(record.error());
        if (!*record) return std::nullopt;
        if (auto row = shaper_->shape(std::move(**record), record_ - header_record_)) {
            return row;
        }
    }
}

std::expected<std::optional<SourceRow>, Error> CsvReader::next() {
    if (pending_) {
        std::optional<SourceRow> row = std::move(pending_);
        pending_.reset();
        return row;
    }
    return read_row();
}

}  // namespace sheetload
