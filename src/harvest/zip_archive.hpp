#pragma once

// ZIP形式のアプリケーションバンドルの読み込み（展開はメモリ上のみ）

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace hatchet::harvest {

/// アーカイブの読み込み失敗
class ArchiveError : public std::runtime_error {
   public:
    explicit ArchiveError(const std::string& message) : std::runtime_error(message) {}
};

/// セントラルディレクトリのエントリ
struct ZipEntry {
    std::string name;  // アーカイブ内のパス（'/' 区切り）
    uint16_t method = 0;  // 0: stored, 8: deflate
    uint32_t crc32 = 0;
    uint32_t compressed_size = 0;
    uint32_t uncompressed_size = 0;
    uint32_t local_header_offset = 0;

    bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

class ZipArchive {
   public:
    /// ファイルから開く（ZIPでなければ ArchiveError）
    static ZipArchive open(const std::filesystem::path& path);

    /// メモリ上のデータから開く
    static ZipArchive from_bytes(std::string data);

    const std::vector<ZipEntry>& entries() const { return entries_; }

    /// エントリの内容を展開する（CRCを検証する）
    std::string read(const ZipEntry& entry) const;

   private:
    explicit ZipArchive(std::string data) : data_(std::move(data)) {}

    void parse_central_directory();
    uint16_t u16(size_t offset) const;
    uint32_t u32(size_t offset) const;

    std::string data_;
    std::vector<ZipEntry> entries_;
};

}  // namespace hatchet::harvest
