#pragma once

#include "../common/diagnostics.hpp"
#include "../common/identifier.hpp"
#include "code_unit.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace hatchet::harvest {

/// 収集の設定
class ZipArchive;

struct HarvestOptions {
    std::vector<std::string> extra_names;  // 常に加える名前（バインディング内部で使われる名前）
};

// ============================================================
// 識別子ハーベスター
// アプリケーションのコードユニットを走査し、属性アクセス名と
// 識別子として妥当な文字列定数を一つの IdentifierSet にまとめる
// 読めないユニットは警告を出して飛ばす（全体は止めない）
// ============================================================
class Harvester {
   public:
    explicit Harvester(HarvestOptions options = {});

    /// ディレクトリを再帰的に走査する
    /// __init__.py / __init__.pyc を持つサブディレクトリはパッケージとして扱う
    void add_directory(const std::filesystem::path& path, const std::string& package = "");

    /// 単一のファイル（.py / .pyc / .zip）を加える
    void add_file(const std::filesystem::path& path, const std::string& package = "");

    /// ZIPバンドル内の .py / .pyc を加える
    void add_archive(const std::filesystem::path& path);

    /// メモリ上のソースを加える
    void add_source(const std::string& module_name, std::string_view source,
                    const std::string& location);

    /// メモリ上の .pyc の内容を加える
    void add_compiled(const std::string& module_name, std::string_view data,
                      const std::string& location);

    /// 任意のコードユニットを加える
    void add_unit(const CodeUnit& unit);

    /// 収集結果（設定済みの名前を含む）
    const IdentifierSet& identifiers() const { return ids_; }

    const Diagnostics& diagnostics() const { return diagnostics_; }

    /// 走査したユニット数
    size_t unit_count() const { return unit_count_; }

   private:
    /// 開いたアーカイブのメンバーを加える（入れ子の .zip も展開する）
    void add_archive_members(const ZipArchive& archive, const std::string& location, int depth);

    void skip_unit(const std::string& location, const std::string& reason);

    HarvestOptions options_;
    IdentifierSet ids_;
    Diagnostics diagnostics_;
    size_t unit_count_ = 0;
};

}  // namespace hatchet::harvest
