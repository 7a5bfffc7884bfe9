#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hatchet::catalog {

/// メンバーの種類（除外レコードの記法を選ぶためだけに使う）
enum class MemberKind { Function, Field, Unknown };

inline const char* member_kind_str(MemberKind kind) {
    switch (kind) {
        case MemberKind::Function:
            return "function";
        case MemberKind::Field:
            return "field";
        case MemberKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

// ============================================================
// カタログのバックエンド
// 型ごとの生の問い合わせに答える（名前の正規化はしない）
// 「型ではない」は空の回答で返し、障害のときだけ CatalogError を投げる
// ============================================================
class CatalogBackend {
   public:
    virtual ~CatalogBackend() = default;

    /// 公開され得るすべての型名
    virtual std::vector<std::string> type_names() = 0;

    /// 名前が型を指すか
    virtual bool has_type(const std::string& name) = 0;

    /// 直接の基底（別名やインスタンス化された名前を含み得る）
    virtual std::vector<std::string> direct_bases(const std::string& type) = 0;

    /// 直接の派生
    virtual std::vector<std::string> direct_derived(const std::string& type) = 0;

    /// 直接宣言されたメンバー名（オーバーロードで重複し得る）
    virtual std::vector<std::string> member_names(const std::string& type) = 0;

    /// メンバーのシグネチャに現れる型らしい名前
    virtual std::vector<std::string> signature_type_names(const std::string& type,
                                                          const std::string& member) = 0;

    virtual bool is_pure_virtual(const std::string& type, const std::string& member) = 0;

    virtual MemberKind member_kind(const std::string& /*type*/, const std::string& /*member*/) {
        return MemberKind::Unknown;
    }

    /// 明示的な型別名（typedef）の解決先
    virtual std::optional<std::vector<std::string>> resolve_alias(const std::string& /*name*/) {
        return std::nullopt;
    }
};

// ============================================================
// 型カタログ（閉包エンジンが依存する契約）
// 問い合わせは読み取り専用。返す参照はカタログの寿命の間有効
// ============================================================
class TypeCatalog {
   public:
    virtual ~TypeCatalog() = default;

    virtual const std::vector<std::string>& all_types() = 0;

    virtual bool has_type(const std::string& name) = 0;

    /// 型自身を先頭に、近い順の祖先
    virtual const std::vector<std::string>& ancestors(const std::string& type) = 0;

    /// 型自身を先頭に、近い順の子孫
    virtual const std::vector<std::string>& descendants(const std::string& type) = 0;

    /// 直接宣言されたメンバー（継承分は含まない）
    virtual const std::vector<std::string>& members(const std::string& type) = 0;

    /// メンバーを通じて流れ得る型の近似（有用集合を広げるためだけに使う）
    virtual const std::set<std::string>& related_types(const std::string& type,
                                                       const std::string& member) = 0;

    virtual bool is_pure_virtual(const std::string& type, const std::string& member) = 0;

    virtual MemberKind member_kind(const std::string& type, const std::string& member) = 0;
};

}  // namespace hatchet::catalog
