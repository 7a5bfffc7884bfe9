#pragma once

#include "../code_unit.hpp"
#include "token.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hatchet::harvest::python {

/// ソース解析の失敗（字句エラー）
struct SourceError {
    uint32_t line = 0;
    std::string message;
};

// ============================================================
// Pythonソースのコードユニット
// モジュール本体と、def/class の本体をインデントで分割したネスト
// ============================================================
class SourceUnit : public CodeUnit {
   public:
    explicit SourceUnit(std::string name) : name_(std::move(name)) {}

    /// ソースを解析してモジュールのユニットを作る
    /// 字句エラーがあれば nullptr を返し error に理由を入れる
    static std::unique_ptr<SourceUnit> parse(const std::string& module_name,
                                             std::string_view source, SourceError* error);

    const std::string& name() const override { return name_; }
    const std::vector<std::string>& referenced_names() const override { return names_; }
    const std::vector<std::string>& string_constants() const override { return constants_; }
    std::vector<const CodeUnit*> nested_units() const override;

    /// 直下の子ユニット
    const std::vector<std::unique_ptr<SourceUnit>>& children() const { return children_; }

   private:
    SourceUnit* add_child(std::string name);
    void add_tokens(const std::vector<Token>& tokens, size_t begin, size_t end);
    void add_fstring_fields(const std::string& body);

    std::string name_;
    std::vector<std::string> names_;
    std::vector<std::string> constants_;
    std::vector<std::unique_ptr<SourceUnit>> children_;
};

/// Pythonの予約語か
bool is_keyword(const std::string& word);

}  // namespace hatchet::harvest::python
