#pragma once

#include "../catalog/type_catalog.hpp"
#include "../closure/closure_engine.hpp"
#include "rejection.hpp"

#include <vector>

namespace hatchet::emit {

// ============================================================
// 除外レコードの生成
// 有用集合の補集合を決定的な順序（型名、メンバー名の昇順）で並べる
// ファイルには触れない
// ============================================================
class RejectionEmitter {
   public:
    explicit RejectionEmitter(catalog::TypeCatalog& catalog) : catalog_(catalog) {}

    std::vector<RejectionRecord> emit(const closure::ClosureResult& result);

   private:
    catalog::TypeCatalog& catalog_;
};

/// 型とメンバーの除外数を数える
RejectionSummary summarize(const std::vector<RejectionRecord>& records);

}  // namespace hatchet::emit
