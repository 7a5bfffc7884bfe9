#pragma once

#include <stdexcept>
#include <string>

namespace hatchet {

/// カタログのバックエンド障害（読み込み失敗、記述ファイルの構文誤り）
/// 「型ではない」は障害ではなく否定の回答として返す
class CatalogError : public std::runtime_error {
   public:
    explicit CatalogError(const std::string& message) : std::runtime_error(message) {}
};

/// 設定ファイルの誤り
class ConfigError : public std::runtime_error {
   public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace hatchet
