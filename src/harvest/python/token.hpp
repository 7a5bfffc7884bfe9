#pragma once

#include <cstdint>
#include <string>

namespace hatchet::harvest::python {

/// トークンの種類
enum class TokenKind {
    Name,     // foo, QWidget
    String,   // "hello", b'x', f"{x}"
    Number,   // 123, 0x1f, 1.5e3
    Op,       // . ( ) : , など
    Newline,  // 論理行の終わり
    Eof
};

/// Pythonソースのトークン
struct Token {
    TokenKind kind;
    std::string text;  // 文字列リテラルはエスケープ処理後の本体
    uint32_t line = 0;
    uint32_t indent = 0;      // 論理行の先頭トークンのみ有効
    bool line_start = false;  // 論理行の先頭か
    bool fstring = false;     // f-string（置換フィールドを含む）

    Token(TokenKind k, std::string t, uint32_t ln) : kind(k), text(std::move(t)), line(ln) {}

    bool is_op(const char* op) const { return kind == TokenKind::Op && text == op; }
    bool is_name(const char* name) const { return kind == TokenKind::Name && text == name; }
};

/// トークン種別を文字列に変換
inline const char* token_kind_to_string(TokenKind kind) {
    switch (kind) {
        case TokenKind::Name:
            return "NAME";
        case TokenKind::String:
            return "STRING";
        case TokenKind::Number:
            return "NUMBER";
        case TokenKind::Op:
            return "OP";
        case TokenKind::Newline:
            return "NEWLINE";
        case TokenKind::Eof:
            return "EOF";
    }
    return "UNKNOWN";
}

}  // namespace hatchet::harvest::python
