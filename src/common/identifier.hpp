#pragma once

#include <set>
#include <string>
#include <string_view>

namespace hatchet {

/// アプリケーションから収集した識別子の集合（重複なし、順序は意味を持たない）
using IdentifierSet = std::set<std::string>;

inline bool is_identifier_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

inline bool is_identifier_char(char c) {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

/// 文字列全体が識別子として妥当か（[A-Za-z_][A-Za-z0-9_]*）
inline bool is_identifier(std::string_view s) {
    if (s.empty() || !is_identifier_start(s[0]))
        return false;
    for (char c : s.substr(1)) {
        if (!is_identifier_char(c))
            return false;
    }
    return true;
}

}  // namespace hatchet
