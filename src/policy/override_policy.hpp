#pragma once

#include "../catalog/type_catalog.hpp"

#include <map>
#include <set>
#include <string>

namespace hatchet::policy {

/// メンバーが強制的に残される理由
enum class ForceReason {
    None,
    Wildcard,            // 型の全メンバー保持
    Global,              // すべての型に適用されるメンバー
    PerType,             // 型ごとの指定
    SelfNamed,           // 型と同名（コンストラクタ相当）
    PureVirtualAncestor  // 祖先のどこかで純粋仮想
};

const char* force_reason_str(ForceReason reason);

// ============================================================
// 上書きポリシー
// 使用の証拠がなくても残す型とメンバーの例外表
// 静的解析の取りこぼしはすべてここで補う
// ============================================================
class OverridePolicy {
   public:
    /// 型名またはメンバー名に使うワイルドカード
    static constexpr const char* WILDCARD = "*";

    OverridePolicy() = default;

    /// 組み込みの表
    static OverridePolicy defaults();

    /// 常に残す型
    OverridePolicy& keep_type(const std::string& type);

    /// 常に残すメンバー
    /// type が "*" ならすべての型、member が "*" なら型の全メンバー
    OverridePolicy& keep_member(const std::string& type, const std::string& member);

    bool is_kept_type(const std::string& type) const { return kept_types_.count(type) > 0; }
    const std::set<std::string>& kept_types() const { return kept_types_; }

    /// 型が全メンバー保持か
    bool has_wildcard(const std::string& type) const;

    /// type / member が強制的に残される理由（祖先の純粋仮想はカタログに問い合わせる）
    ForceReason why_forced(const std::string& type, const std::string& member,
                           catalog::TypeCatalog& catalog) const;

    /// 型の直接メンバーのうち強制的に残されるもの
    std::set<std::string> forced_members(const std::string& type,
                                         catalog::TypeCatalog& catalog) const;

    /// 設定された型ごとのメンバー表（"*" を含む）
    const std::map<std::string, std::set<std::string>>& kept_members() const {
        return kept_members_;
    }

   private:
    bool listed(const std::string& type, const std::string& member) const;

    std::set<std::string> kept_types_;
    std::map<std::string, std::set<std::string>> kept_members_;
};

}  // namespace hatchet::policy
