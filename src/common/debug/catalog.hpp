#pragma once

#include "../debug.hpp"

#include <string>

namespace hatchet::debug::catalog {

/// Catalog メッセージID
enum class Id {
    ListTypes,
    PageRead,
    PageMissing,
    PageCached,
    AncestorsComputed,
    DescendantsComputed,
    AliasResolved,
    SuffixResolved,
    NameDropped,
    PlaceholderDropped,
    CatalogParsed
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Listing catalog types", "カタログの型を列挙"},
    {"Reading page", "ページを読み込み"},
    {"Page not found", "ページが見つかりません"},
    {"Using cached page", "キャッシュ済みページを使用"},
    {"Ancestor chain computed", "祖先チェーンを計算"},
    {"Descendant set computed", "子孫集合を計算"},
    {"Alias resolved", "エイリアスを解決"},
    {"Generic suffix resolved", "ジェネリック接尾辞を解決"},
    {"Unresolvable type name dropped", "解決できない型名を破棄"},
    {"Template placeholder dropped", "テンプレート引数を破棄"},
    {"Catalog description parsed", "カタログ記述を解析"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::hatchet::debug::g_lang];
}

inline void log(Id id, ::hatchet::debug::Level level = ::hatchet::debug::Level::Debug) {
    if (!::hatchet::debug::enabled(level))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Catalog, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::hatchet::debug::Level level = ::hatchet::debug::Level::Debug) {
    if (!::hatchet::debug::enabled(level))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Catalog, level,
                          std::string(get(id)) + ": " + detail);
}

}  // namespace hatchet::debug::catalog
