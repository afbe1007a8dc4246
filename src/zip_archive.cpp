// SPDX-License-Identifier: MIT

#include "sheetload/zip_archive.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace sheetload {

namespace {

constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr uint32_t kCentralDirSig = 0x02014b50;
constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kMaxCommentSize = 0xFFFF;
constexpr std::size_t kReadChunk = 64 * 1024;
constexpr uint64_t kMaxReserve = 64 * 1024 * 1024;

uint16_t read_u16(const unsigned char* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

Error corrupt(const std::string& detail) {
    return Error{ErrorCode::CorruptFile, "Invalid zip archive: " + detail};
}

}  // namespace

std::expected<ZipArchive, Error> ZipArchive::open(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(Error{ErrorCode::IoError,
            fmt::format("Cannot open '{}'", path)});
    }
    file.seekg(0, std::ios::end);
    const auto file_size = static_cast<uint64_t>(file.tellg());
    if (file_size < kEndOfCentralDirSize) {
        return std::unexpected(corrupt("file too small"));
    }

    // The end-of-central-directory record sits in the last 64KB + 22 bytes
    const uint64_t tail_size = std::min<uint64_t>(file_size, kMaxCommentSize + kEndOfCentralDirSize);
    std::vector<unsigned char> tail(tail_size);
    file.seekg(static_cast<std::streamoff>(file_size - tail_size));
    file.read(reinterpret_cast<char*>(tail.data()), static_cast<std::streamsize>(tail_size));
    if (!file) {
        return std::unexpected(corrupt("cannot read trailer"));
    }

    std::size_t eocd = tail_size;
    for (std::size_t i = tail_size - kEndOfCentralDirSize + 1; i-- > 0;) {
        if (read_u32(&tail[i]) == kEndOfCentralDirSig) {
            eocd = i;
            break;
        }
    }
    if (eocd == tail_size) {
        return std::unexpected(corrupt("end of central directory not found"));
    }

    const uint16_t entry_count = read_u16(&tail[eocd + 10]);
    const uint32_t cd_size = read_u32(&tail[eocd + 12]);
    const uint32_t cd_offset = read_u32(&tail[eocd + 16]);
    if (cd_offset == 0xFFFFFFFF || entry_count == 0xFFFF) {
        return std::unexpected(corrupt("zip64 archives are not supported"));
    }
    if (static_cast<uint64_t>(cd_offset) + cd_size > file_size) {
        return std::unexpected(corrupt("central directory out of bounds"));
    }

    std::vector<unsigned char> cd(cd_size);
    file.seekg(cd_offset);
    file.read(reinterpret_cast<char*>(cd.data()), cd_size);
    if (!file) {
        return std::unexpected(corrupt("cannot read central directory"));
    }

    ZipArchive archive(path);
    archive.entries_.reserve(entry_count);
    std::size_t pos = 0;
    for (uint16_t i = 0; i < entry_count; ++i) {
        if (pos + 46 > cd.size() || read_u32(&cd[pos]) != kCentralDirSig) {
            return std::unexpected(corrupt("bad central directory entry"));
        }
        const unsigned char* p = &cd[pos];
        ZipEntry entry;
        entry.flags = read_u16(p + 8);
        entry.method = read_u16(p + 10);
        entry.crc = read_u32(p + 16);
        entry.compressed_size = read_u32(p + 20);
        entry.uncompressed_size = read_u32(p + 24);
        const uint16_t name_len = read_u16(p + 28);
        const uint16_t extra_len = read_u16(p + 30);
        const uint16_t comment_len = read_u16(p + 32);
        entry.local_header_offset = read_u32(p + 42);
        if (pos + 46 + name_len > cd.size()) {
            return std::unexpected(corrupt("truncated entry name"));
        }
        entry.name.assign(reinterpret_cast<const char*>(p + 46), name_len);
        // Some writers store absolute part names
        if (!entry.name.empty() && entry.name.front() == '/') {
            entry.name.erase(0, 1);
        }
        archive.entries_.push_back(std::move(entry));
        pos += 46 + name_len + extra_len + comment_len;
    }
    return archive;
}

const ZipEntry* ZipArchive::find(const std::string& name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

std::expected<std::unique_ptr<ZipEntryReader>, Error> ZipArchive::open_entry(
        const ZipEntry& entry) const {
    if (entry.flags & 0x1) {
        return std::unexpected(corrupt(fmt::format("entry '{}' is encrypted", entry.name)));
    }
    if (entry.method != 0 && entry.method != 8) {
        return std::unexpected(corrupt(fmt::format(
            "entry '{}' uses unsupported compression method {}", entry.name, entry.method)));
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return std::unexpected(Error{ErrorCode::IoError,
            fmt::format("Cannot open '{}'", path_)});
    }
    unsigned char header[30];
    file.seekg(static_cast<std::streamoff>(entry.local_header_offset));
    file.read(reinterpret_cast<char*>(header), sizeof(header));
    if (!file || read_u32(header) != kLocalHeaderSig) {
        return std::unexpected(corrupt(fmt::format("bad local header for '{}'", entry.name)));
    }
    const uint64_t data_offset = entry.local_header_offset + 30 +
                                 read_u16(header + 26) + read_u16(header + 28);

    std::unique_ptr<ZipEntryReader> reader(
        new ZipEntryReader(std::move(file), entry, data_offset));
    if (entry.method == 8) {
        // Raw deflate stream, no zlib header
        if (inflateInit2(&reader->zs_, -MAX_WBITS) != Z_OK) {
            return std::unexpected(corrupt("inflateInit2 failed"));
        }
        reader->zs_init_ = true;
    }
    return reader;
}

std::expected<std::string, Error> ZipArchive::read_entry(const std::string& name) const {
    const ZipEntry* entry = find(name);
    if (!entry) {
        return std::unexpected(corrupt(fmt::format("missing part '{}'", name)));
    }
    auto reader = open_entry(*entry);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    std::string out;
    // The declared size is only a hint
    out.reserve(static_cast<std::size_t>(std::min<uint64_t>(entry->uncompressed_size,
                                                            kMaxReserve)));
    char buf[kReadChunk];
    while (true) {
        auto n = (*reader)->read(buf, sizeof(buf));
        if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        out.append(buf, *n);
    }
    return out;
}

ZipEntryReader::ZipEntryReader(std::ifstream file, const ZipEntry& entry, uint64_t data_offset)
    : file_(std::move(file))
    , entry_(entry)
    , remaining_in_(entry.compressed_size)
    , crc_(crc32(0L, Z_NULL, 0)) {
    file_.seekg(static_cast<std::streamoff>(data_offset));
}

ZipEntryReader::~ZipEntryReader() {
    if (zs_init_) {
        inflateEnd(&zs_);
    }
}

std::expected<void, Error> ZipEntryReader::refill() {
    const std::size_t want = static_cast<std::size_t>(
        std::min<uint64_t>(remaining_in_, kReadChunk));
    in_buf_.resize(want);
    file_.read(reinterpret_cast<char*>(in_buf_.data()), static_cast<std::streamsize>(want));
    if (static_cast<std::size_t>(file_.gcount()) != want) {
        return std::unexpected(corrupt(fmt::format("entry '{}' is truncated", entry_.name)));
    }
    remaining_in_ -= want;
    zs_.next_in = in_buf_.data();
    zs_.avail_in = static_cast<uInt>(want);
    return {};
}

std::expected<std::size_t, Error> ZipEntryReader::read(char* out, std::size_t size) {
    if (done_ || size == 0) {
        return 0;
    }

    if (entry_.method == 0) {
        const std::size_t want = static_cast<std::size_t>(
            std::min<uint64_t>(remaining_in_, size));
        if (want == 0) {
            done_ = true;
            if (auto r = check_crc(); !r) {
                return std::unexpected(r.error());
            }
            return 0;
        }
        file_.read(out, static_cast<std::streamsize>(want));
        if (static_cast<std::size_t>(file_.gcount()) != want) {
            return std::unexpected(corrupt(fmt::format("entry '{}' is truncated", entry_.name)));
        }
        remaining_in_ -= want;
        crc_ = crc32(crc_, reinterpret_cast<const Bytef*>(out), static_cast<uInt>(want));
        return want;
    }

    zs_.next_out = reinterpret_cast<Bytef*>(out);
    zs_.avail_out = static_cast<uInt>(size);
    while (zs_.avail_out == size) {
        if (zs_.avail_in == 0) {
            if (remaining_in_ == 0) {
                return std::unexpected(corrupt(fmt::format(
                    "entry '{}' ends inside the deflate stream", entry_.name)));
            }
            if (auto r = refill(); !r) {
                return std::unexpected(r.error());
            }
        }
        int ret = inflate(&zs_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            done_ = true;
            break;
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return std::unexpected(corrupt(fmt::format("entry '{}': {}", entry_.name,
                zs_.msg ? zs_.msg : "inflate failed")));
        }
    }
    const std::size_t produced = size - zs_.avail_out;
    crc_ = crc32(crc_, reinterpret_cast<const Bytef*>(out), static_cast<uInt>(produced));
    if (done_) {
        if (auto r = check_crc(); !r) {
            return std::unexpected(r.error());
        }
    }
    return produced;
}

std::expected<void, Error> ZipEntryReader::check_crc() const {
    if (static_cast<uint32_t>(crc_) != entry_.crc) {
        return std::unexpected(corrupt(fmt::format(
            "entry '{}' fails its CRC-32 check", entry_.name)));
    }
    return {};
}

}  // namespace sheetload
