#pragma once

#include "../catalog/type_catalog.hpp"
#include "../common/identifier.hpp"
#include "../policy/override_policy.hpp"

#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace hatchet::closure {

/// 到達可能な型のメンバーのうち残るもの
struct MemberSets {
    std::set<std::string> harvested;  // 名前が IdentifierSet にある
    std::set<std::string> forced;     // ポリシーが強制する
    bool wildcard = false;            // 全メンバー保持

    bool keeps(const std::string& member) const {
        return wildcard || harvested.count(member) > 0 || forced.count(member) > 0;
    }
};

enum class TypeDisposition { AlwaysKeep, Useful, Rejected };
enum class MemberDisposition { Harvested, PolicyKept, Rejected };

const char* type_disposition_str(TypeDisposition d);
const char* member_disposition_str(MemberDisposition d);

/// 一回の実行の統計
struct ClosureStats {
    size_t seeded = 0;               // 種まきで加わった型（祖先を含む）
    size_t visited = 0;              // ワークリストから取り出した型
    size_t expansion_additions = 0;  // 展開で加わった型（祖先を含む）
    size_t members_checked = 0;      // 関連型を問い合わせたメンバー
};

// ============================================================
// 閉包の結果
// 一回の実行で作られ、以後は読み取り専用
// ============================================================
class ClosureResult {
   public:
    const std::set<std::string>& useful_types() const { return useful_; }
    bool is_useful(const std::string& type) const { return useful_.count(type) > 0; }

    /// 到達可能な型の残すメンバー（到達不能なら nullptr）
    const MemberSets* kept_members(const std::string& type) const;

    /// 有用集合に加わった順（削除は起きない）
    const std::vector<std::string>& additions() const { return additions_; }

    const ClosureStats& stats() const { return stats_; }

    /// AlwaysKeep > Useful > Rejected の順に判定する
    TypeDisposition classify_type(const std::string& type) const;

    /// Harvested > PolicyKept > Rejected の順に判定する
    /// 到達不能な型のメンバーは Rejected
    MemberDisposition classify_member(const std::string& type, const std::string& member) const;

   private:
    friend class ClosureEngine;

    std::set<std::string> always_keep_;
    std::set<std::string> useful_;
    std::map<std::string, MemberSets> members_;
    std::vector<std::string> additions_;
    ClosureStats stats_;
};

// ============================================================
// 閉包エンジン
// 有用集合の不動点をワークリストで求める
// 有用集合は単調に増えるだけで、各型はワークリストに一度しか入らない
// ============================================================
class ClosureEngine {
   public:
    ClosureEngine(catalog::TypeCatalog& catalog, const policy::OverridePolicy& policy);

    ClosureResult run(const IdentifierSet& ids);

   private:
    /// 型とその祖先を有用集合に加える（新しく加わった数を返す）
    size_t add_with_ancestors(const std::string& type, ClosureResult& result,
                              std::deque<std::string>& worklist);

    /// 型の残すメンバーを一度だけ計算する
    const MemberSets& compute_members(const std::string& type, const IdentifierSet& ids,
                                      ClosureResult& result);

    catalog::TypeCatalog& catalog_;
    const policy::OverridePolicy& policy_;
};

}  // namespace hatchet::closure
