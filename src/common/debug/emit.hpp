#pragma once

#include "../debug.hpp"

#include <string>

namespace hatchet::debug::emit {

/// Emit メッセージID
enum class Id { Start, End, RejectType, RejectMember, WildcardType, Summary, WriteOutput };

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting rejection emission", "除外レコードの生成を開始"},
    {"Completed rejection emission", "除外レコードの生成を完了"},
    {"Rejecting type", "型を除外"},
    {"Rejecting member", "メンバーを除外"},
    {"Every member kept", "全メンバーを保持"},
    {"Rejection summary", "除外の集計"},
    {"Writing output", "出力を書き込み"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::hatchet::debug::g_lang];
}

inline void log(Id id, ::hatchet::debug::Level level = ::hatchet::debug::Level::Debug) {
    if (!::hatchet::debug::enabled(level))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Emit, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::hatchet::debug::Level level = ::hatchet::debug::Level::Debug) {
    if (!::hatchet::debug::enabled(level))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Emit, level,
                          std::string(get(id)) + ": " + detail);
}

}  // namespace hatchet::debug::emit
