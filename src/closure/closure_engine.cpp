#include "closure_engine.hpp"

#include "../common/debug/closure.hpp"

#include <fmt/format.h>

namespace hatchet::closure {

const char* type_disposition_str(TypeDisposition d) {
    switch (d) {
        case TypeDisposition::AlwaysKeep:
            return "always-keep";
        case TypeDisposition::Useful:
            return "useful";
        case TypeDisposition::Rejected:
            return "rejected";
    }
    return "unknown";
}

const char* member_disposition_str(MemberDisposition d) {
    switch (d) {
        case MemberDisposition::Harvested:
            return "harvested";
        case MemberDisposition::PolicyKept:
            return "policy-kept";
        case MemberDisposition::Rejected:
            return "rejected";
    }
    return "unknown";
}

// ============================================================
// ClosureResult
// ============================================================

const MemberSets* ClosureResult::kept_members(const std::string& type) const {
    auto it = members_.find(type);
    return it == members_.end() ? nullptr : &it->second;
}

TypeDisposition ClosureResult::classify_type(const std::string& type) const {
    if (always_keep_.count(type))
        return TypeDisposition::AlwaysKeep;
    if (useful_.count(type))
        return TypeDisposition::Useful;
    return TypeDisposition::Rejected;
}

MemberDisposition ClosureResult::classify_member(const std::string& type,
                                                 const std::string& member) const {
    const MemberSets* sets = kept_members(type);
    if (!sets)
        return MemberDisposition::Rejected;
    if (sets->harvested.count(member))
        return MemberDisposition::Harvested;
    if (sets->wildcard || sets->forced.count(member))
        return MemberDisposition::PolicyKept;
    return MemberDisposition::Rejected;
}

// ============================================================
// ClosureEngine
// ============================================================

ClosureEngine::ClosureEngine(catalog::TypeCatalog& catalog, const policy::OverridePolicy& policy)
    : catalog_(catalog), policy_(policy) {}

size_t ClosureEngine::add_with_ancestors(const std::string& type, ClosureResult& result,
                                         std::deque<std::string>& worklist) {
    size_t added = 0;
    // 継承したメンバーのために祖先チェーン全体が必要
    for (const auto& ancestor : catalog_.ancestors(type)) {
        if (!result.useful_.insert(ancestor).second)
            continue;
        debug::closure::log(debug::closure::Id::UsefulType, ancestor);
        result.additions_.push_back(ancestor);
        worklist.push_back(ancestor);
        ++added;
    }
    return added;
}

const MemberSets& ClosureEngine::compute_members(const std::string& type,
                                                 const IdentifierSet& ids,
                                                 ClosureResult& result) {
    auto it = result.members_.find(type);
    if (it != result.members_.end())
        return it->second;

    MemberSets sets;
    sets.wildcard = policy_.has_wildcard(type);
    for (const auto& member : catalog_.members(type)) {
        if (ids.count(member))
            sets.harvested.insert(member);
    }
    sets.forced = policy_.forced_members(type, catalog_);

    debug::closure::log(debug::closure::Id::KeptMembers,
                        fmt::format("{}: {} harvested, {} forced{}", type, sets.harvested.size(),
                                    sets.forced.size(), sets.wildcard ? ", all (wildcard)" : ""),
                        debug::Level::Trace);
    return result.members_.emplace(type, std::move(sets)).first->second;
}

ClosureResult ClosureEngine::run(const IdentifierSet& ids) {
    debug::closure::log(debug::closure::Id::Start,
                        fmt::format("{} identifiers", ids.size()));

    ClosureResult result;
    result.always_keep_ = policy_.kept_types();
    std::deque<std::string> worklist;

    // 種まき: 名前が使われている型
    for (const auto& type : catalog_.all_types()) {
        if (!ids.count(type))
            continue;
        debug::closure::log(debug::closure::Id::SeedType, type);
        result.stats_.seeded += add_with_ancestors(type, result, worklist);
    }

    // 常に残す型も到達可能として扱う（メンバーの刈り込みは通常どおり）
    for (const auto& type : policy_.kept_types()) {
        if (!catalog_.has_type(type))
            continue;
        debug::closure::log(debug::closure::Id::PolicyForced, type);
        result.stats_.seeded += add_with_ancestors(type, result, worklist);
    }

    // 展開
    while (!worklist.empty()) {
        std::string type = std::move(worklist.front());
        worklist.pop_front();
        ++result.stats_.visited;
        debug::closure::dump_worklist(type, worklist.size());

        const MemberSets& sets = compute_members(type, ids, result);
        for (const auto& member : catalog_.members(type)) {
            if (!sets.keeps(member))
                continue;
            debug::closure::log(debug::closure::Id::CheckMember, type + "." + member,
                                debug::Level::Trace);
            ++result.stats_.members_checked;
            for (const auto& related : catalog_.related_types(type, member)) {
                size_t added = add_with_ancestors(related, result, worklist);
                if (added > 0) {
                    debug::closure::log(debug::closure::Id::RelatedType,
                                        fmt::format("{}.{} -> {}", type, member, related));
                }
                result.stats_.expansion_additions += added;
            }
        }
    }

    debug::closure::log(debug::closure::Id::End,
                        fmt::format("{} useful types, {} visited", result.useful_.size(),
                                    result.stats_.visited));
    return result;
}

}  // namespace hatchet::closure
