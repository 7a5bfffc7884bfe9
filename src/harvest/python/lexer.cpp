#include "lexer.hpp"

#include "../../common/identifier.hpp"

#include <fmt/format.h>

namespace hatchet::harvest::python {

namespace {

bool is_name_char(char c) {
    // 非ASCII（UTF-8の継続バイトを含む）は識別子の一部として扱う
    return is_identifier_char(c) || static_cast<unsigned char>(c) >= 0x80;
}

bool is_name_start(char c) {
    return is_identifier_start(c) || static_cast<unsigned char>(c) >= 0x80;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// 文字列プレフィックスとして妥当か（r, u, b, f, br, rb, fr, rf 大文字小文字を問わず）
bool is_string_prefix(const std::string& word) {
    if (word.empty() || word.size() > 2)
        return false;
    std::string lower;
    for (char c : word) {
        lower += static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
    }
    return lower == "r" || lower == "u" || lower == "b" || lower == "f" || lower == "br" ||
           lower == "rb" || lower == "fr" || lower == "rf";
}

bool has_prefix_char(const std::string& prefix, char lower) {
    for (char c : prefix) {
        if (c == lower || c == lower - 'a' + 'A')
            return true;
    }
    return false;
}

}  // namespace

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;

    while (!is_at_end() && error_.empty()) {
        if (at_line_start_ && depth_ == 0) {
            current_indent_ = measure_indent();
            at_line_start_ = false;
            continue;
        }

        char c = peek();
        if (c == '\n') {
            advance();
            ++line_;
            if (depth_ == 0) {
                if (line_has_tokens_) {
                    tokens.emplace_back(TokenKind::Newline, "", line_ - 1);
                    line_has_tokens_ = false;
                }
                at_line_start_ = true;
            }
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
            advance();
            continue;
        }
        if (c == '#') {
            while (!is_at_end() && peek() != '\n')
                advance();
            continue;
        }
        if (c == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
            // 行継続
            advance();
            if (peek() == '\r')
                advance();
            advance();
            ++line_;
            continue;
        }

        Token tok = next_token();
        if (!error_.empty())
            break;
        if (!line_has_tokens_) {
            tok.line_start = true;
            tok.indent = current_indent_;
            line_has_tokens_ = true;
        }
        tokens.push_back(std::move(tok));
    }

    if (line_has_tokens_) {
        tokens.emplace_back(TokenKind::Newline, "", line_);
    }
    tokens.emplace_back(TokenKind::Eof, "", line_);
    return tokens;
}

uint32_t Lexer::measure_indent() {
    uint32_t indent = 0;
    while (!is_at_end()) {
        char c = peek();
        if (c == ' ') {
            ++indent;
        } else if (c == '\t') {
            indent = (indent / 8 + 1) * 8;
        } else if (c == '\f') {
            indent = 0;
        } else {
            break;
        }
        advance();
    }
    return indent;
}

void Lexer::fail(const std::string& message, uint32_t line) {
    if (error_.empty()) {
        error_ = message;
        error_line_ = line;
    }
}

Token Lexer::next_token() {
    char c = peek();
    if (is_name_start(c))
        return scan_name_or_prefixed_string();
    if (is_digit(c) || (c == '.' && is_digit(peek(1))))
        return scan_number();
    if (c == '"' || c == '\'')
        return scan_string("");
    return scan_operator();
}

Token Lexer::scan_name_or_prefixed_string() {
    size_t start = pos_;
    while (!is_at_end() && is_name_char(peek()))
        advance();
    std::string word(source_.substr(start, pos_ - start));

    if ((peek() == '"' || peek() == '\'') && is_string_prefix(word)) {
        return scan_string(word);
    }
    return Token(TokenKind::Name, std::move(word), line_);
}

Token Lexer::scan_number() {
    size_t start = pos_;
    while (!is_at_end()) {
        char c = peek();
        if (is_identifier_char(c) || c == '.') {
            advance();
            // 指数部の符号
            if ((c == 'e' || c == 'E') && (peek() == '+' || peek() == '-') &&
                !(source_.size() > start + 1 && (source_[start + 1] == 'x' ||
                                                 source_[start + 1] == 'X'))) {
                advance();
            }
        } else {
            break;
        }
    }
    return Token(TokenKind::Number, std::string(source_.substr(start, pos_ - start)), line_);
}

Token Lexer::scan_string(const std::string& prefix) {
    uint32_t start_line = line_;
    bool raw = has_prefix_char(prefix, 'r');
    bool fstr = has_prefix_char(prefix, 'f');

    char quote = advance();
    bool triple = false;
    if (peek() == quote && peek(1) == quote) {
        advance();
        advance();
        triple = true;
    }

    std::string value;
    while (true) {
        if (is_at_end()) {
            fail(fmt::format("unterminated string literal starting on line {}", start_line),
                 start_line);
            break;
        }
        char c = peek();
        if (c == quote) {
            if (!triple) {
                advance();
                break;
            }
            if (peek(1) == quote && peek(2) == quote) {
                advance();
                advance();
                advance();
                break;
            }
            value += advance();
            continue;
        }
        if (c == '\n') {
            if (!triple) {
                fail(fmt::format("unterminated string literal starting on line {}", start_line),
                     start_line);
                break;
            }
            ++line_;
            value += advance();
            continue;
        }
        if (c == '\\') {
            advance();
            if (is_at_end())
                continue;
            if (raw) {
                // raw文字列ではバックスラッシュを残す（引用符は閉じない）
                value += '\\';
                if (peek() == '\n')
                    ++line_;
                value += advance();
            } else {
                scan_escape(value);
            }
            continue;
        }
        value += advance();
    }

    Token tok(TokenKind::String, std::move(value), start_line);
    tok.fstring = fstr;
    return tok;
}

void Lexer::scan_escape(std::string& value) {
    char c = advance();
    switch (c) {
        case '\n':
            // 行継続（文字列には何も加えない）
            ++line_;
            break;
        case 'n':
            value += '\n';
            break;
        case 't':
            value += '\t';
            break;
        case 'r':
            value += '\r';
            break;
        case 'a':
            value += '\a';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'v':
            value += '\v';
            break;
        case '0':
            value += '\0';
            break;
        case '\\':
        case '\'':
        case '"':
            value += c;
            break;
        case 'x': {
            int hi = hex_value(peek());
            int lo = hex_value(peek(1));
            if (hi >= 0 && lo >= 0) {
                advance();
                advance();
                value += static_cast<char>(hi * 16 + lo);
            } else {
                value += "\\x";
            }
            break;
        }
        default:
            // 未知のエスケープはそのまま残る
            value += '\\';
            value += c;
            break;
    }
}

Token Lexer::scan_operator() {
    static const char* const three_char_ops[] = {"**=", "//=", ">>=", "<<=", "..."};
    static const char* const two_char_ops[] = {"->", ":=", "**", "//", "<<", ">>", "<=", ">=",
                                               "==", "!=", "<>", "+=", "-=", "*=", "/=", "%=",
                                               "&=", "|=", "^=", "@="};

    for (const char* op : three_char_ops) {
        if (source_.compare(pos_, 3, op) == 0) {
            pos_ += 3;
            return Token(TokenKind::Op, op, line_);
        }
    }
    for (const char* op : two_char_ops) {
        if (source_.compare(pos_, 2, op) == 0) {
            pos_ += 2;
            return Token(TokenKind::Op, op, line_);
        }
    }

    char c = advance();
    switch (c) {
        case '(':
        case '[':
        case '{':
            ++depth_;
            break;
        case ')':
        case ']':
        case '}':
            if (depth_ > 0)
                --depth_;
            break;
        default:
            break;
    }
    return Token(TokenKind::Op, std::string(1, c), line_);
}

}  // namespace hatchet::harvest::python
