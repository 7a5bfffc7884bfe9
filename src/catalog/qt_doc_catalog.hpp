#pragma once

#include "type_catalog.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hatchet::catalog {

// ============================================================
// Qtリファレンス（HTML）のオフラインミラーを読むバックエンド
//   classes.html          : 型の一覧（<dd> 行の最初のクラスリンク）
//   <name>.html           : Inherits / Inherited by / 純粋仮想の表
//   <name>-members.html   : メンバーの一覧（<li class="fn"> 行）
// ページはインスタンスごとにキャッシュする
// 存在しないページは否定の回答、存在するのに読めないページは CatalogError
// ============================================================
class QtDocCatalog : public CatalogBackend {
   public:
    explicit QtDocCatalog(std::filesystem::path root);

    std::vector<std::string> type_names() override;
    bool has_type(const std::string& name) override;
    std::vector<std::string> direct_bases(const std::string& type) override;
    std::vector<std::string> direct_derived(const std::string& type) override;
    std::vector<std::string> member_names(const std::string& type) override;
    std::vector<std::string> signature_type_names(const std::string& type,
                                                  const std::string& member) override;
    bool is_pure_virtual(const std::string& type, const std::string& member) override;

    /// 実際にディスクから読んだページ数
    size_t pages_read() const { return pages_read_; }

   private:
    const std::optional<std::string>& page(const std::string& name);
    std::vector<std::string> page_lines(const std::string& name);
    std::vector<std::string> linked_types_on(const std::string& type, const char* marker);

    std::filesystem::path root_;
    std::map<std::string, std::optional<std::string>> pages_;
    size_t pages_read_ = 0;
};

}  // namespace hatchet::catalog
