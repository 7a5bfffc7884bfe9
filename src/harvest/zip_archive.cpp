#include "zip_archive.hpp"

#include <array>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <zlib.h>

namespace hatchet::harvest {

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_SIG = 0x06054b50;
constexpr size_t END_OF_CENTRAL_SIZE = 22;
constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t MAX_COMMENT = 0xffff;

constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATE = 8;

// 展開は固定長の塊ごとに行い、宣言されたサイズを超えた時点で打ち切る
// （ヘッダのサイズは信用せず、実際に出てきた分だけ確保する）
constexpr size_t INFLATE_CHUNK = 16 * 1024;

std::string inflate_raw(const char* data, size_t size, size_t expected) {
    z_stream stream{};
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    stream.avail_in = static_cast<uInt>(size);

    // 負のウィンドウビット: zlibヘッダなしの生deflate
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK)
        throw ArchiveError("failed to initialize inflate");

    std::string out;
    std::array<char, INFLATE_CHUNK> chunk;
    int rc = Z_OK;
    bool overflow = false;
    while (rc == Z_OK) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());
        // 入力が尽きて進まなくなれば Z_BUF_ERROR で抜ける
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END)
            break;
        size_t produced = chunk.size() - stream.avail_out;
        if (out.size() + produced > expected) {
            overflow = true;
            break;
        }
        out.append(chunk.data(), produced);
    }
    inflateEnd(&stream);

    if (overflow)
        throw ArchiveError(fmt::format("deflate stream exceeds declared size {}", expected));
    if (rc != Z_STREAM_END)
        throw ArchiveError(fmt::format("corrupt deflate stream (zlib status {})", rc));
    if (out.size() != expected)
        throw ArchiveError(
            fmt::format("deflate stream size {} differs from declared {}", out.size(), expected));
    return out;
}

}  // namespace

ZipArchive ZipArchive::open(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open())
        throw ArchiveError(fmt::format("cannot open archive {}", path.string()));

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return from_bytes(buffer.str());
}

ZipArchive ZipArchive::from_bytes(std::string data) {
    ZipArchive archive(std::move(data));
    archive.parse_central_directory();
    return archive;
}

uint16_t ZipArchive::u16(size_t offset) const {
    return static_cast<uint16_t>(static_cast<uint8_t>(data_[offset]) |
                                 (static_cast<uint8_t>(data_[offset + 1]) << 8));
}

uint32_t ZipArchive::u32(size_t offset) const {
    return static_cast<uint32_t>(u16(offset)) | (static_cast<uint32_t>(u16(offset + 2)) << 16);
}

void ZipArchive::parse_central_directory() {
    if (data_.size() < END_OF_CENTRAL_SIZE)
        throw ArchiveError("not a zip archive (too small)");

    // 末尾のコメントを考慮して終端レコードを後ろから探す
    size_t limit = data_.size() > END_OF_CENTRAL_SIZE + MAX_COMMENT
                       ? data_.size() - END_OF_CENTRAL_SIZE - MAX_COMMENT
                       : 0;
    size_t eocd = std::string::npos;
    for (size_t pos = data_.size() - END_OF_CENTRAL_SIZE + 1; pos-- > limit;) {
        if (u32(pos) == END_OF_CENTRAL_SIG) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos)
        throw ArchiveError("not a zip archive (no end of central directory)");

    uint16_t count = u16(eocd + 10);
    uint32_t dir_size = u32(eocd + 12);
    uint32_t dir_offset = u32(eocd + 16);
    if (dir_offset == 0xffffffffu || count == 0xffff)
        throw ArchiveError("zip64 archives are not supported");
    if (static_cast<size_t>(dir_offset) + dir_size > data_.size())
        throw ArchiveError("central directory lies outside the archive");

    size_t pos = dir_offset;
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + CENTRAL_HEADER_SIZE > data_.size() || u32(pos) != CENTRAL_HEADER_SIG)
            throw ArchiveError(fmt::format("bad central directory entry {}", i));

        ZipEntry entry;
        entry.method = u16(pos + 10);
        entry.crc32 = u32(pos + 16);
        entry.compressed_size = u32(pos + 20);
        entry.uncompressed_size = u32(pos + 24);
        uint16_t name_len = u16(pos + 28);
        uint16_t extra_len = u16(pos + 30);
        uint16_t comment_len = u16(pos + 32);
        entry.local_header_offset = u32(pos + 42);

        if (pos + CENTRAL_HEADER_SIZE + name_len > data_.size())
            throw ArchiveError(fmt::format("truncated name in entry {}", i));
        entry.name = data_.substr(pos + CENTRAL_HEADER_SIZE, name_len);

        entries_.push_back(std::move(entry));
        pos += CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;
    }
}

std::string ZipArchive::read(const ZipEntry& entry) const {
    size_t pos = entry.local_header_offset;
    if (pos + LOCAL_HEADER_SIZE > data_.size() || u32(pos) != LOCAL_HEADER_SIG)
        throw ArchiveError(fmt::format("bad local header for {}", entry.name));

    uint16_t name_len = u16(pos + 26);
    uint16_t extra_len = u16(pos + 28);
    size_t data_start = pos + LOCAL_HEADER_SIZE + name_len + extra_len;
    if (data_start + entry.compressed_size > data_.size())
        throw ArchiveError(fmt::format("truncated data for {}", entry.name));

    const char* raw = data_.data() + data_start;
    std::string content;
    switch (entry.method) {
        case METHOD_STORED:
            content.assign(raw, entry.compressed_size);
            break;
        case METHOD_DEFLATE:
            content = inflate_raw(raw, entry.compressed_size, entry.uncompressed_size);
            break;
        default:
            throw ArchiveError(
                fmt::format("unsupported compression method {} for {}", entry.method, entry.name));
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(content.data()),
                static_cast<uInt>(content.size()));
    if (static_cast<uint32_t>(crc) != entry.crc32)
        throw ArchiveError(fmt::format("crc mismatch for {}", entry.name));
    return content;
}

}  // namespace hatchet::harvest
