#pragma once

#include "token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace hatchet::harvest::python {

// ============================================================
// Pythonソースの字句解析
// 識別子の収集に必要な粒度のみ（INDENT/DEDENTは出さず、
// 論理行の先頭トークンにインデント幅を持たせる）
// ============================================================
class Lexer {
   public:
    explicit Lexer(std::string_view source) : source_(source) {}

    std::vector<Token> tokenize();

    /// 字句エラー（閉じていない文字列など）があったか
    bool has_error() const { return !error_.empty(); }
    const std::string& error_message() const { return error_; }
    uint32_t error_line() const { return error_line_; }

   private:
    Token next_token();
    Token scan_name_or_prefixed_string();
    Token scan_number();
    Token scan_string(const std::string& prefix);
    Token scan_operator();
    void scan_escape(std::string& value);
    uint32_t measure_indent();
    void fail(const std::string& message, uint32_t line);

    bool is_at_end() const { return pos_ >= source_.size(); }
    char peek(size_t offset = 0) const {
        return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
    }
    char advance() { return source_[pos_++]; }

    std::string_view source_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    int depth_ = 0;  // 括弧のネスト（内部の改行は論理行を終えない）
    bool at_line_start_ = true;
    bool line_has_tokens_ = false;
    uint32_t current_indent_ = 0;
    std::string error_;
    uint32_t error_line_ = 0;
};

}  // namespace hatchet::harvest::python
