#pragma once

#include "../code_unit.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace hatchet::harvest::python {

/// バイトコードの読み込み失敗
class MarshalError : public std::runtime_error {
   public:
    explicit MarshalError(const std::string& message) : std::runtime_error(message) {}
};

/// code オブジェクトのフィールド配置
enum class CodeLayout {
    Py2,    // 2.x
    Py30,   // 3.0 - 3.7
    Py38,   // 3.8 - 3.10 (posonlyargcount)
    Py311,  // 3.11+ (localsplusnames, qualname)
};

/// .pyc ヘッダの情報
struct PycHeader {
    uint16_t magic = 0;
    size_t header_size = 0;
    CodeLayout layout = CodeLayout::Py30;
};

/// マジックナンバーからヘッダ長と code レイアウトを決める
/// "\r\n" が続かなければ MarshalError
PycHeader read_pyc_header(std::string_view data);

// ============================================================
// コンパイル済みコードオブジェクトのユニット
// co_names, co_consts 内の文字列, co_consts 内の code を公開する
// ============================================================
class CompiledUnit : public CodeUnit {
   public:
    CompiledUnit() = default;

    const std::string& name() const override { return name_; }
    const std::vector<std::string>& referenced_names() const override { return names_; }
    const std::vector<std::string>& string_constants() const override { return constants_; }
    std::vector<const CodeUnit*> nested_units() const override;

    /// .pyc の内容を読み込む（失敗時は MarshalError）
    static std::shared_ptr<CompiledUnit> from_pyc(std::string_view data);

    /// ヘッダなしの marshal データ（code オブジェクト）を読み込む
    static std::shared_ptr<CompiledUnit> from_marshal(std::string_view data, CodeLayout layout);

   private:
    friend class MarshalReader;

    std::string name_;
    std::vector<std::string> names_;
    std::vector<std::string> constants_;
    std::vector<std::shared_ptr<CompiledUnit>> children_;
};

}  // namespace hatchet::harvest::python
