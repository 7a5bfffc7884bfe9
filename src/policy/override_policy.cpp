#include "override_policy.hpp"

#include "../common/debug/policy.hpp"

namespace hatchet::policy {

const char* force_reason_str(ForceReason reason) {
    switch (reason) {
        case ForceReason::None:
            return "none";
        case ForceReason::Wildcard:
            return "wildcard";
        case ForceReason::Global:
            return "global";
        case ForceReason::PerType:
            return "per-type";
        case ForceReason::SelfNamed:
            return "self-named";
        case ForceReason::PureVirtualAncestor:
            return "pure-virtual-ancestor";
    }
    return "unknown";
}

OverridePolicy OverridePolicy::defaults() {
    debug::policy::log(debug::policy::Id::Defaults, "built-in");

    OverridePolicy policy;
    // ランタイムそのものが依存する型
    for (const char* type : {"QApplication", "QWidget", "QFlag", "QFlags", "QBuffer"}) {
        policy.keep_type(type);
    }

    // metaObject が無いと広範に壊れる
    // devType / metric が無いと描画やフォント表示が壊れる
    for (const char* member : {"metaObject", "devType", "metric"}) {
        policy.keep_member(WILDCARD, member);
    }
    policy.keep_member("QBitArray", "setBit");
    policy.keep_member("QByteArray", "insert");

    // 低レベルのキャストで内部表現を操作される型
    for (const char* type : {"QPixmap", "QImage", "QPicture", "QX11Info"}) {
        policy.keep_member(type, WILDCARD);
    }
    return policy;
}

OverridePolicy& OverridePolicy::keep_type(const std::string& type) {
    if (kept_types_.insert(type).second)
        debug::policy::log(debug::policy::Id::KeepType, type, debug::Level::Trace);
    return *this;
}

OverridePolicy& OverridePolicy::keep_member(const std::string& type, const std::string& member) {
    if (!kept_members_[type].insert(member).second)
        return *this;
    if (member == WILDCARD)
        debug::policy::log(debug::policy::Id::Wildcard, type, debug::Level::Trace);
    else
        debug::policy::log(debug::policy::Id::KeepMember, type + "." + member,
                           debug::Level::Trace);
    return *this;
}

bool OverridePolicy::listed(const std::string& type, const std::string& member) const {
    auto it = kept_members_.find(type);
    return it != kept_members_.end() && it->second.count(member) > 0;
}

bool OverridePolicy::has_wildcard(const std::string& type) const {
    return listed(type, WILDCARD) || listed(WILDCARD, WILDCARD);
}

ForceReason OverridePolicy::why_forced(const std::string& type, const std::string& member,
                                       catalog::TypeCatalog& catalog) const {
    if (has_wildcard(type))
        return ForceReason::Wildcard;
    if (listed(type, member))
        return ForceReason::PerType;
    if (listed(WILDCARD, member))
        return ForceReason::Global;
    if (member == type)
        return ForceReason::SelfNamed;
    // 純粋仮想の契約はチェーンのどこかで満たさなければならない
    for (const auto& ancestor : catalog.ancestors(type)) {
        if (catalog.is_pure_virtual(ancestor, member))
            return ForceReason::PureVirtualAncestor;
    }
    return ForceReason::None;
}

std::set<std::string> OverridePolicy::forced_members(const std::string& type,
                                                     catalog::TypeCatalog& catalog) const {
    std::set<std::string> forced;
    for (const auto& member : catalog.members(type)) {
        if (why_forced(type, member, catalog) != ForceReason::None)
            forced.insert(member);
    }
    return forced;
}

}  // namespace hatchet::policy
