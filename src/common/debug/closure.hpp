#pragma once

#include "../debug.hpp"

#include <string>

namespace hatchet::debug::closure {

/// Closure メッセージID
enum class Id {
    Start,
    End,
    SeedType,
    UsefulType,
    CheckMember,
    KeptMembers,
    PolicyForced,
    RelatedType
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting closure", "閉包計算を開始"},
    {"Completed closure", "閉包計算を完了"},
    {"Seeding type", "型を初期集合に追加"},
    {"Useful type", "有用な型"},
    {"Checking member", "メンバーを検査"},
    {"Kept members", "保持するメンバー"},
    {"Type kept by policy", "ポリシーにより型を保持"},
    {"Related type", "関連する型"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::hatchet::debug::g_lang];
}

inline void log(Id id, ::hatchet::debug::Level level = ::hatchet::debug::Level::Debug) {
    if (!::hatchet::debug::enabled(level))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Closure, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::hatchet::debug::Level level = ::hatchet::debug::Level::Debug) {
    if (!::hatchet::debug::enabled(level))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Closure, level,
                          std::string(get(id)) + ": " + detail);
}

/// ワークリストの状態をダンプ（Traceレベル）
inline void dump_worklist(const std::string& current, size_t remaining) {
    if (!::hatchet::debug::enabled(::hatchet::debug::Level::Trace))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Closure, ::hatchet::debug::Level::Trace,
                          current + " [" + std::to_string(remaining) + " more to do]");
}

}  // namespace hatchet::debug::closure
