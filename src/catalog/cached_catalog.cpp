#include "cached_catalog.hpp"

#include "../common/debug/catalog.hpp"

#include <deque>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace hatchet::catalog {

namespace {

// 別名の解決は有限の深さで打ち切る（別名の循環に備える）
constexpr int MAX_ALIAS_DEPTH = 8;

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() > suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void append_unique(std::vector<std::string>& out, std::set<std::string>& seen,
                   const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (seen.insert(name).second)
            out.push_back(name);
    }
}

}  // namespace

CachedTypeCatalog::CachedTypeCatalog(CatalogBackend& backend, CatalogOptions options)
    : backend_(backend), options_(std::move(options)) {}

const std::vector<std::string>& CachedTypeCatalog::all_types() {
    if (all_types_loaded_) {
        ++stats_.cache_hits;
        return all_types_;
    }
    debug::catalog::log(debug::catalog::Id::ListTypes);
    ++stats_.backend_queries;
    std::set<std::string> seen;
    append_unique(all_types_, seen, backend_.type_names());
    all_types_loaded_ = true;
    return all_types_;
}

bool CachedTypeCatalog::has_type(const std::string& name) {
    auto it = has_type_.find(name);
    if (it != has_type_.end()) {
        ++stats_.cache_hits;
        return it->second;
    }
    ++stats_.backend_queries;
    bool result = backend_.has_type(name);
    has_type_.emplace(name, result);
    return result;
}

const std::vector<std::string>& CachedTypeCatalog::canonical_names(const std::string& name) {
    auto it = canonical_.find(name);
    if (it != canonical_.end())
        return it->second;

    std::vector<std::string> result = resolve(name, 0);
    if (result.empty() && options_.placeholders.count(name) == 0) {
        // 解決できない名前は寄与しない（監査のために記録だけ残す）
        debug::catalog::log(debug::catalog::Id::NameDropped, name);
    }
    return canonical_.emplace(name, std::move(result)).first->second;
}

std::vector<std::string> CachedTypeCatalog::resolve(const std::string& name, int depth) {
    if (options_.placeholders.count(name)) {
        debug::catalog::log(debug::catalog::Id::PlaceholderDropped, name, debug::Level::Trace);
        return {};
    }
    if (has_type(name))
        return {name};
    if (depth >= MAX_ALIAS_DEPTH)
        return {};

    std::vector<std::string> result;
    std::set<std::string> seen;

    ++stats_.backend_queries;
    if (auto targets = backend_.resolve_alias(name)) {
        for (const auto& target : *targets) {
            append_unique(result, seen, resolve(target, depth + 1));
        }
        debug::catalog::log(debug::catalog::Id::AliasResolved,
                            fmt::format("{} -> {}", name, fmt::join(result, ", ")),
                            debug::Level::Trace);
        return result;
    }

    for (const auto& [suffix, generic] : options_.generic_suffixes) {
        if (!ends_with(name, suffix))
            continue;
        std::string element = name.substr(0, name.size() - suffix.size());
        append_unique(result, seen, resolve(element, depth + 1));
        append_unique(result, seen, resolve(generic, depth + 1));
        debug::catalog::log(debug::catalog::Id::SuffixResolved,
                            fmt::format("{} -> {}", name, fmt::join(result, ", ")),
                            debug::Level::Trace);
        break;
    }
    return result;
}

std::vector<std::string> CachedTypeCatalog::canonicalize_all(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& name : raw) {
        append_unique(out, seen, canonical_names(name));
    }
    return out;
}

const std::vector<std::string>& CachedTypeCatalog::direct_bases(const std::string& type) {
    auto it = bases_.find(type);
    if (it != bases_.end()) {
        ++stats_.cache_hits;
        return it->second;
    }
    ++stats_.backend_queries;
    return bases_.emplace(type, canonicalize_all(backend_.direct_bases(type))).first->second;
}

const std::vector<std::string>& CachedTypeCatalog::direct_derived(const std::string& type) {
    auto it = derived_.find(type);
    if (it != derived_.end()) {
        ++stats_.cache_hits;
        return it->second;
    }
    ++stats_.backend_queries;
    return derived_.emplace(type, canonicalize_all(backend_.direct_derived(type))).first->second;
}

std::vector<std::string> CachedTypeCatalog::traverse(const std::string& type, bool upward) {
    // 幅優先で近い順に並べる（菱形継承や循環があっても一度ずつ）
    std::vector<std::string> order;
    std::set<std::string> seen = {type};
    std::deque<std::string> queue = {type};

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        order.push_back(current);

        const auto& next = upward ? direct_bases(current) : direct_derived(current);
        for (const auto& n : next) {
            if (seen.insert(n).second)
                queue.push_back(n);
        }
    }
    return order;
}

const std::vector<std::string>& CachedTypeCatalog::ancestors(const std::string& type) {
    auto it = ancestors_.find(type);
    if (it != ancestors_.end()) {
        ++stats_.cache_hits;
        return it->second;
    }
    auto chain = traverse(type, true);
    debug::catalog::log(debug::catalog::Id::AncestorsComputed,
                        fmt::format("{}: {}", type, fmt::join(chain, " <- ")),
                        debug::Level::Trace);
    return ancestors_.emplace(type, std::move(chain)).first->second;
}

const std::vector<std::string>& CachedTypeCatalog::descendants(const std::string& type) {
    auto it = descendants_.find(type);
    if (it != descendants_.end()) {
        ++stats_.cache_hits;
        return it->second;
    }
    auto set = traverse(type, false);
    debug::catalog::log(debug::catalog::Id::DescendantsComputed,
                        fmt::format("{}: {} types", type, set.size()), debug::Level::Trace);
    return descendants_.emplace(type, std::move(set)).first->second;
}

const std::vector<std::string>& CachedTypeCatalog::members(const std::string& type) {
    auto it = members_.find(type);
    if (it != members_.end()) {
        ++stats_.cache_hits;
        return it->second;
    }
    ++stats_.backend_queries;
    // オーバーロードは一つの名前にまとめる
    std::vector<std::string> names;
    std::set<std::string> seen;
    append_unique(names, seen, backend_.member_names(type));
    return members_.emplace(type, std::move(names)).first->second;
}

const std::set<std::string>& CachedTypeCatalog::related_types(const std::string& type,
                                                              const std::string& member) {
    MemberKey key(type, member);
    auto it = related_.find(key);
    if (it != related_.end()) {
        ++stats_.cache_hits;
        return it->second;
    }
    ++stats_.backend_queries;
    std::set<std::string> related;
    for (const auto& raw : backend_.signature_type_names(type, member)) {
        for (const auto& name : canonical_names(raw)) {
            related.insert(name);
        }
    }
    return related_.emplace(std::move(key), std::move(related)).first->second;
}

bool CachedTypeCatalog::is_pure_virtual(const std::string& type, const std::string& member) {
    MemberKey key(type, member);
    auto it = pure_virtual_.find(key);
    if (it != pure_virtual_.end()) {
        ++stats_.cache_hits;
        return it->second;
    }
    ++stats_.backend_queries;
    bool result = backend_.is_pure_virtual(type, member);
    pure_virtual_.emplace(std::move(key), result);
    return result;
}

MemberKind CachedTypeCatalog::member_kind(const std::string& type, const std::string& member) {
    MemberKey key(type, member);
    auto it = member_kind_.find(key);
    if (it != member_kind_.end()) {
        ++stats_.cache_hits;
        return it->second;
    }
    ++stats_.backend_queries;
    MemberKind kind = backend_.member_kind(type, member);
    member_kind_.emplace(std::move(key), kind);
    return kind;
}

}  // namespace hatchet::catalog
