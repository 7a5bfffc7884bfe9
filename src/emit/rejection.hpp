#pragma once

#include "../catalog/type_catalog.hpp"

#include <string>
#include <tuple>

namespace hatchet::emit {

/// 除外レコード
/// 型ごと除外するか、型は残してメンバーだけ除外するか
struct RejectionRecord {
    enum class Kind { Type, Member };

    Kind kind = Kind::Type;
    std::string type;
    std::string member;  // Kind::Type のときは空
    catalog::MemberKind member_kind = catalog::MemberKind::Unknown;

    static RejectionRecord for_type(std::string type) {
        RejectionRecord record;
        record.type = std::move(type);
        return record;
    }

    static RejectionRecord for_member(std::string type, std::string member,
                                      catalog::MemberKind kind) {
        RejectionRecord record;
        record.kind = Kind::Member;
        record.type = std::move(type);
        record.member = std::move(member);
        record.member_kind = kind;
        return record;
    }

    bool is_type() const { return kind == Kind::Type; }

    // 型名、メンバー名の昇順（型レコードはメンバー名が空なので先頭に来る）
    bool operator<(const RejectionRecord& other) const {
        return std::tie(type, member) < std::tie(other.type, other.member);
    }

    bool operator==(const RejectionRecord& other) const {
        return kind == other.kind && type == other.type && member == other.member;
    }
};

/// 除外の集計
struct RejectionSummary {
    size_t types = 0;
    size_t members = 0;
};

}  // namespace hatchet::emit
