// ============================================================
// 解析段階ごとのデバッグログ
// ============================================================
// 収集・カタログ・ポリシー・閉包・出力の各段階が同じ出力先に書く
// 既定では無効。-d / -d=<level> で有効にし、--lang=ja で日本語にする
// 段階ごとのメッセージ表は common/debug/<stage>.hpp にある

#pragma once

#include <iostream>
#include <optional>
#include <string>

namespace hatchet::debug {

inline bool g_debug_mode = false;

/// 0=English, 1=Japanese
inline int g_lang = 0;

enum class Level { Trace, Debug, Info, Warn, Error };

inline Level g_debug_level = Level::Debug;

/// 出力先（テストでは文字列ストリームに差し替える）
inline std::ostream* g_sink = &std::cerr;

/// 解析の処理段階
enum class Stage { Harvest, Catalog, Policy, Closure, Emit, Driver };

inline const char* stage_str(Stage s) {
    switch (s) {
        case Stage::Harvest:
            return "HARVEST";
        case Stage::Catalog:
            return "CATALOG";
        case Stage::Policy:
            return "POLICY";
        case Stage::Closure:
            return "CLOSURE";
        case Stage::Emit:
            return "EMIT";
        case Stage::Driver:
            return "DRIVER";
    }
    return "UNKNOWN";
}

inline const char* level_str(Level l) {
    switch (l) {
        case Level::Trace:
            return "trace";
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warn:
            return "warn";
        case Level::Error:
            return "error";
    }
    return "unknown";
}

/// このレベルのログが出力されるか（メッセージを組み立てる前に確認する）
inline bool enabled(Level level) {
    return g_debug_mode && level >= g_debug_level;
}

/// "[CLOSURE] WARN: ..." の形式で一行書く
inline void log(Stage stage, Level level, const std::string& msg) {
    if (!enabled(level))
        return;
    *g_sink << "[" << stage_str(stage) << "] ";
    if (level == Level::Warn)
        *g_sink << "WARN: ";
    else if (level == Level::Error)
        *g_sink << "ERROR: ";
    *g_sink << msg << std::endl;
}

inline void set_debug_mode(bool enabled) {
    g_debug_mode = enabled;
}
inline void set_lang(int lang) {
    g_lang = lang;
}
inline void set_level(Level level) {
    g_debug_level = level;
}
inline void set_sink(std::ostream& out) {
    g_sink = &out;
}

/// "trace" / "debug" / "info" / "warn" / "error"（不明なら nullopt）
inline std::optional<Level> parse_level(const std::string& s) {
    for (Level l : {Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error}) {
        if (s == level_str(l))
            return l;
    }
    return std::nullopt;
}

}  // namespace hatchet::debug
