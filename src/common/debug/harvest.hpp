#pragma once

#include "../debug.hpp"

#include <string>

namespace hatchet::debug::harvest {

/// Harvester メッセージID
enum class Id {
    Start,
    End,
    DirectoryEnter,
    PackageFound,
    SourceUnit,
    CompiledUnit,
    ArchiveOpen,
    ArchiveMember,
    NestedUnit,
    NameFound,
    ConstantFound,
    UnitSkipped,
    ExtraNames
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting identifier harvest", "識別子の収集を開始"},
    {"Completed identifier harvest", "識別子の収集を完了"},
    {"Entering directory", "ディレクトリに入る"},
    {"Package found", "パッケージを検出"},
    {"Scanning source unit", "ソースユニットを走査"},
    {"Scanning compiled unit", "コンパイル済みユニットを走査"},
    {"Opening archive", "アーカイブを開く"},
    {"Archive member", "アーカイブメンバー"},
    {"Nested code unit", "ネストしたコードユニット"},
    {"Name found", "名前を検出"},
    {"Identifier constant found", "識別子定数を検出"},
    {"Code unit skipped", "コードユニットをスキップ"},
    {"Adding configured names", "設定済みの名前を追加"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::hatchet::debug::g_lang];
}

inline void log(Id id, ::hatchet::debug::Level level = ::hatchet::debug::Level::Debug) {
    if (!::hatchet::debug::enabled(level))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Harvest, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::hatchet::debug::Level level = ::hatchet::debug::Level::Debug) {
    if (!::hatchet::debug::enabled(level))
        return;
    ::hatchet::debug::log(::hatchet::debug::Stage::Harvest, level,
                          std::string(get(id)) + ": " + detail);
}

}  // namespace hatchet::debug::harvest
