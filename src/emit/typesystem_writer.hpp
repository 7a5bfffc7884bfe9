#pragma once

#include "rejection.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace hatchet::emit {

enum class OutputFormat { Xml, Text };

/// "xml" / "text" を解析する（不明なら nullopt）
std::optional<OutputFormat> parse_output_format(const std::string& name);

// ============================================================
// 除外レコードの書き出し
//   xml  : バインディング生成器の typesystem 断片
//          <rejection class="QFoo" function-name="bar"/>
//   text : 一行一レコード
// 既存ファイルの書き換えはしない
// ============================================================
class TypesystemWriter {
   public:
    explicit TypesystemWriter(std::string package = "", OutputFormat format = OutputFormat::Xml)
        : package_(std::move(package)), format_(format) {}

    void write(std::ostream& out, const std::vector<RejectionRecord>& records) const;

   private:
    void write_xml(std::ostream& out, const std::vector<RejectionRecord>& records) const;
    void write_text(std::ostream& out, const std::vector<RejectionRecord>& records) const;

    std::string package_;
    OutputFormat format_;
};

/// XML属性値のエスケープ
std::string xml_escape(const std::string& s);

}  // namespace hatchet::emit
