#pragma once

#include "type_catalog.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace hatchet::catalog {

/// 名前の正規化規則
struct CatalogOptions {
    // 別名の接尾辞 → ジェネリック型（"QObjectList" → "QObject" と "QList"）
    std::vector<std::pair<std::string, std::string>> generic_suffixes = {{"List", "QList"}};
    // テンプレート引数（黙って捨てる）
    std::set<std::string> placeholders = {"T"};
};

/// 問い合わせの統計
struct CatalogStats {
    size_t backend_queries = 0;  // バックエンドに届いた問い合わせ
    size_t cache_hits = 0;       // キャッシュで答えた問い合わせ
};

// ============================================================
// キャッシュ付きカタログアダプター
// バックエンドへの問い合わせは同じキーにつき一度だけ
// キャッシュの寿命はこのインスタンス（一回の解析）に限る
// ============================================================
class CachedTypeCatalog : public TypeCatalog {
   public:
    explicit CachedTypeCatalog(CatalogBackend& backend, CatalogOptions options = {});

    const std::vector<std::string>& all_types() override;
    bool has_type(const std::string& name) override;
    const std::vector<std::string>& ancestors(const std::string& type) override;
    const std::vector<std::string>& descendants(const std::string& type) override;
    const std::vector<std::string>& members(const std::string& type) override;
    const std::set<std::string>& related_types(const std::string& type,
                                               const std::string& member) override;
    bool is_pure_virtual(const std::string& type, const std::string& member) override;
    MemberKind member_kind(const std::string& type, const std::string& member) override;

    /// 名前を正規の型名に解決する（解決できなければ空）
    const std::vector<std::string>& canonical_names(const std::string& name);

    const CatalogStats& stats() const { return stats_; }

   private:
    using MemberKey = std::pair<std::string, std::string>;

    std::vector<std::string> resolve(const std::string& name, int depth);
    const std::vector<std::string>& direct_bases(const std::string& type);
    const std::vector<std::string>& direct_derived(const std::string& type);
    std::vector<std::string> traverse(const std::string& type, bool upward);
    std::vector<std::string> canonicalize_all(const std::vector<std::string>& raw);

    CatalogBackend& backend_;
    CatalogOptions options_;
    CatalogStats stats_;

    bool all_types_loaded_ = false;
    std::vector<std::string> all_types_;
    std::map<std::string, bool> has_type_;
    std::map<std::string, std::vector<std::string>> canonical_;
    std::map<std::string, std::vector<std::string>> bases_;
    std::map<std::string, std::vector<std::string>> derived_;
    std::map<std::string, std::vector<std::string>> ancestors_;
    std::map<std::string, std::vector<std::string>> descendants_;
    std::map<std::string, std::vector<std::string>> members_;
    std::map<MemberKey, std::set<std::string>> related_;
    std::map<MemberKey, bool> pure_virtual_;
    std::map<MemberKey, MemberKind> member_kind_;
};

}  // namespace hatchet::catalog
