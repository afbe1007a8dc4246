// SPDX-License-Identifier: MIT

// include/sheetload/zip_archive.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <zlib.h>

#include "sheetload/error.hpp"

namespace sheetload {

/// Central directory entry of a zip archive.
struct ZipEntry {
    std::string name;
    uint16_t method = 0;              ///< 0 = stored, 8 = deflate
    uint16_t flags = 0;
    uint32_t crc = 0;                 ///< CRC-32 of the uncompressed data
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_header_offset = 0;
};

/// Streaming reader for one entry; inflates on the fly.
class ZipEntryReader {
public:
    ~ZipEntryReader();

    ZipEntryReader(const ZipEntryReader&) = delete;
    ZipEntryReader& operator=(const ZipEntryReader&) = delete;

    /// Read up to @p size bytes; returns 0 at the end of the entry. Data
    /// failing the entry's CRC-32 is reported as CorruptFile at the end.
    std::expected<std::size_t, Error> read(char* out, std::size_t size);

private:
    friend class ZipArchive;
    ZipEntryReader(std::ifstream file, const ZipEntry& entry, uint64_t data_offset);

    std::expected<void, Error> refill();
    std::expected<void, Error> check_crc() const;

    std::ifstream file_;
    ZipEntry entry_;
    uint64_t remaining_in_;           // Compressed bytes not yet read from file
    std::vector<unsigned char> in_buf_;
    z_stream zs_{};
    bool zs_init_ = false;
    bool done_ = false;
    uLong crc_ = 0;
};

/// Read-only zip archive (stored and deflate entries, no zip64, no encryption).
///
/// Only the central directory is loaded at open; entry data is read on demand.
class ZipArchive {
public:
    /// Open @p path and read its central directory.
    /// @return CorruptFile when no valid central directory is found.
    static std::expected<ZipArchive, Error> open(const std::string& path);

    const std::vector<ZipEntry>& entries() const { return entries_; }

    /// Entry by exact name, or nullptr.
    const ZipEntry* find(const std::string& name) const;

    /// Stream an entry's uncompressed contents.
    std::expected<std::unique_ptr<ZipEntryReader>, Error> open_entry(const ZipEntry& entry) const;

    /// Read a whole entry into memory.
    std::expected<std::string, Error> read_entry(const std::string& name) const;

private:
    explicit ZipArchive(std::string path) : path_(std::move(path)) {}

    std::string path_;
    std::vector<ZipEntry> entries_;
};

}  // namespace sheetload
