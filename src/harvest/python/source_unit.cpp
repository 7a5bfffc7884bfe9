#include "source_unit.hpp"

#include "lexer.hpp"

#include <unordered_set>

namespace hatchet::harvest::python {

bool is_keyword(const std::string& word) {
    static const std::unordered_set<std::string> keywords = {
        "False",  "None",     "True",    "and",    "as",     "assert", "async",
        "await",  "break",    "class",   "continue", "def",  "del",    "elif",
        "else",   "except",   "finally", "for",    "from",   "global", "if",
        "import", "in",       "is",      "lambda", "nonlocal", "not",  "or",
        "pass",   "raise",    "return",  "try",    "while",  "with",   "yield"};
    return keywords.count(word) > 0;
}

namespace {

// ブロックの情報
struct Frame {
    SourceUnit* unit;
    int header_indent;  // このインデント以下の行でブロックが閉じる
};

// 論理行の範囲 [begin, end)
struct LogicalLine {
    size_t begin;
    size_t end;
};

std::vector<LogicalLine> split_lines(const std::vector<Token>& tokens) {
    std::vector<LogicalLine> lines;
    size_t begin = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind == TokenKind::Newline || tokens[i].kind == TokenKind::Eof) {
            if (i > begin) {
                lines.push_back({begin, i});
            }
            begin = i + 1;
        }
    }
    return lines;
}

// 括弧の外にある最初の ':' の位置
size_t find_header_colon(const std::vector<Token>& tokens, size_t begin, size_t end) {
    int depth = 0;
    for (size_t i = begin; i < end; ++i) {
        const Token& tok = tokens[i];
        if (tok.kind != TokenKind::Op)
            continue;
        if (tok.text == "(" || tok.text == "[" || tok.text == "{") {
            ++depth;
        } else if (tok.text == ")" || tok.text == "]" || tok.text == "}") {
            --depth;
        } else if (tok.text == ":" && depth == 0) {
            return i;
        }
    }
    return end;
}

}  // namespace

std::unique_ptr<SourceUnit> SourceUnit::parse(const std::string& module_name,
                                              std::string_view source, SourceError* error) {
    Lexer lexer(source);
    std::vector<Token> tokens = lexer.tokenize();
    if (lexer.has_error()) {
        if (error) {
            error->line = lexer.error_line();
            error->message = lexer.error_message();
        }
        return nullptr;
    }

    auto module = std::make_unique<SourceUnit>(module_name);
    std::vector<Frame> stack;
    stack.push_back({module.get(), -1});

    for (const LogicalLine& line : split_lines(tokens)) {
        int indent = static_cast<int>(tokens[line.begin].indent);
        while (stack.size() > 1 && indent <= stack.back().header_indent) {
            stack.pop_back();
        }
        SourceUnit* current = stack.back().unit;

        // async def も関数定義
        size_t head = line.begin;
        if (tokens[head].is_name("async") && head + 1 < line.end)
            ++head;

        bool is_header = (tokens[head].is_name("def") || tokens[head].is_name("class")) &&
                         head + 1 < line.end && tokens[head + 1].kind == TokenKind::Name;
        if (!is_header) {
            current->add_tokens(tokens, line.begin, line.end);
            continue;
        }

        // ヘッダ（名前、既定値、基底クラス）は外側、':' 以降は内側に属する
        size_t colon = find_header_colon(tokens, head, line.end);
        current->add_tokens(tokens, line.begin, colon);

        SourceUnit* child = current->add_child(tokens[head + 1].text);
        if (colon + 1 < line.end) {
            child->add_tokens(tokens, colon + 1, line.end);
        }
        stack.push_back({child, indent});
    }

    return module;
}

std::vector<const CodeUnit*> SourceUnit::nested_units() const {
    std::vector<const CodeUnit*> units;
    units.reserve(children_.size());
    for (const auto& child : children_) {
        units.push_back(child.get());
    }
    return units;
}

SourceUnit* SourceUnit::add_child(std::string name) {
    children_.push_back(std::make_unique<SourceUnit>(std::move(name)));
    return children_.back().get();
}

void SourceUnit::add_tokens(const std::vector<Token>& tokens, size_t begin, size_t end) {
    size_t i = begin;
    while (i < end) {
        const Token& tok = tokens[i];
        if (tok.kind == TokenKind::Name) {
            if (!is_keyword(tok.text)) {
                names_.push_back(tok.text);
            }
            ++i;
            continue;
        }
        if (tok.kind != TokenKind::String) {
            ++i;
            continue;
        }

        // 隣接する文字列リテラルは一つの定数に連結される
        std::string joined;
        bool has_fields = false;
        while (i < end && tokens[i].kind == TokenKind::String) {
            if (tokens[i].fstring) {
                add_fstring_fields(tokens[i].text);
                has_fields = true;
            }
            joined += tokens[i].text;
            ++i;
        }
        if (!has_fields) {
            constants_.push_back(std::move(joined));
        }
    }
}

void SourceUnit::add_fstring_fields(const std::string& body) {
    size_t i = 0;
    while (i < body.size()) {
        if (body[i] == '{' && i + 1 < body.size() && body[i + 1] == '{') {
            i += 2;
            continue;
        }
        if (body[i] != '{') {
            ++i;
            continue;
        }
        // 対応する '}' までを式として解析
        int depth = 1;
        size_t start = ++i;
        while (i < body.size() && depth > 0) {
            if (body[i] == '{')
                ++depth;
            else if (body[i] == '}')
                --depth;
            ++i;
        }
        size_t length = (depth == 0 ? i - 1 : i) - start;
        Lexer lexer(std::string_view(body).substr(start, length));
        std::vector<Token> tokens = lexer.tokenize();
        if (lexer.has_error())
            continue;
        add_tokens(tokens, 0, tokens.size());
    }
}

}  // namespace hatchet::harvest::python
