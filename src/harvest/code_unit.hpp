#pragma once

#include "../common/identifier.hpp"

#include <string>
#include <vector>

namespace hatchet::harvest {

// ============================================================
// コードユニット
// ホスト側のコード表現（ソース、バイトコード）ごとに一度だけ実装する
// ============================================================
class CodeUnit {
   public:
    virtual ~CodeUnit() = default;

    /// ユニット名（モジュール名、関数名、クラス名）
    virtual const std::string& name() const = 0;

    /// 直接参照している名前（属性アクセス、グローバル参照、import）
    virtual const std::vector<std::string>& referenced_names() const = 0;

    /// 文字列定数（識別子かどうかは問わない）
    virtual const std::vector<std::string>& string_constants() const = 0;

    /// 内側のコードユニット（関数本体、クラス本体）
    virtual std::vector<const CodeUnit*> nested_units() const = 0;
};

/// ユニットとその内側すべてから識別子を集める
/// 名前はすべて、文字列定数は識別子として妥当なものだけを加える
void collect_identifiers(const CodeUnit& root, IdentifierSet& ids);

}  // namespace hatchet::harvest
