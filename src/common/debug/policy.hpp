#pragma once

#include "../debug.hpp"

#include <string>

namespace hatchet::debug::policy {

enum class Id { Defaults, KeepType, KeepMember, Wildcard };

inline const char* messages[][2] = {
    {"Loading built-in policy tables", "組み込みポリシー表を読み込み"},
    {"Always-keep type", "常に保持する型"},
    {"Always-keep member", "常に保持するメンバー"},
    {"Wildcard member exemption", "全メンバー保持の指定"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::hatchet::debug::g_lang];
}

inline void log(Id id, const std::string& detail,
                ::hatchet::debug::Level level = ::hatchet::debug::Level::Debug) {
    if (!::hatchet::debug::enabled(level))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Policy, level,
                          std::string(get(id)) + ": " + detail);
}

}  // namespace hatchet::debug::policy
