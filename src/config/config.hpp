// ============================================================
// 設定システム
// ============================================================
// .hatchet.yml からポリシー・収集・カタログ・出力の設定を読み込む

#pragma once

#include "../catalog/cached_catalog.hpp"
#include "../emit/typesystem_writer.hpp"
#include "../harvest/harvester.hpp"
#include "../policy/override_policy.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hatchet::config {

/// 設定ファイル名
inline constexpr const char* CONFIG_FILE_NAME = ".hatchet.yml";

// 読み込んだ設定
struct Config {
    // policy:
    bool policy_defaults = true;
    std::vector<std::string> keep_types;
    std::vector<std::pair<std::string, std::string>> keep_members;  // (型 or "*", メンバー or "*")

    // harvest:
    std::vector<std::string> extra_names;

    // catalog:（未指定なら組み込みの既定値）
    std::optional<std::vector<std::pair<std::string, std::string>>> generic_suffixes;
    std::optional<std::vector<std::string>> placeholders;

    // output:
    std::string package;
    emit::OutputFormat format = emit::OutputFormat::Xml;

    /// 上書きポリシーを組み立てる
    policy::OverridePolicy make_policy() const;

    catalog::CatalogOptions catalog_options() const;

    harvest::HarvestOptions harvest_options() const;
};

// 設定ローダー
class ConfigLoader {
   public:
    // 設定ファイルを読み込み（読めない・誤りがあれば ConfigError）
    void load(const std::string& filepath);

    // .hatchet.yml を探す（start_path から親に向かって）
    // 見つからなければ false
    bool find_and_load(const std::string& start_path = ".");

    // 設定テキストを解析
    void parse(const std::string& content, const std::string& origin = "<config>");

    const Config& config() const { return config_; }

    bool is_loaded() const { return loaded_; }

    const std::string& config_path() const { return config_path_; }

   private:
    // 簡易YAMLパーサーの状態
    struct Cursor {
        std::string section;
        std::string key;
        std::string subkey;
    };

    void add_item(const Cursor& at, const std::string& item, const std::string& where);
    void set_scalar(const Cursor& at, const std::string& value, const std::string& where);

    static std::string trim(const std::string& str);
    static std::string unquote(const std::string& str);

    Config config_;
    std::string config_path_;
    bool loaded_ = false;
};

}  // namespace hatchet::config
