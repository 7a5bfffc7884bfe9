// ============================================================
// 設定システム - 実装
// ============================================================

#include "config.hpp"

#include "../common/error.hpp"
#include "../common/identifier.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace hatchet::config {

// ============================================================
// Config
// ============================================================

policy::OverridePolicy Config::make_policy() const {
    policy::OverridePolicy result =
        policy_defaults ? policy::OverridePolicy::defaults() : policy::OverridePolicy();
    for (const auto& type : keep_types) {
        result.keep_type(type);
    }
    for (const auto& [type, member] : keep_members) {
        result.keep_member(type, member);
    }
    return result;
}

catalog::CatalogOptions Config::catalog_options() const {
    catalog::CatalogOptions options;
    if (generic_suffixes)
        options.generic_suffixes = *generic_suffixes;
    if (placeholders)
        options.placeholders = std::set<std::string>(placeholders->begin(), placeholders->end());
    return options;
}

harvest::HarvestOptions Config::harvest_options() const {
    harvest::HarvestOptions options;
    options.extra_names = extra_names;
    return options;
}

// ============================================================
// ConfigLoader
// ============================================================

void ConfigLoader::load(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("cannot open config file '{}'", filepath));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    parse(buffer.str(), filepath);
    config_path_ = filepath;
}

bool ConfigLoader::find_and_load(const std::string& start_path) {
    fs::path current = fs::absolute(start_path);

    // 最大10レベルまで親ディレクトリを探索
    for (int i = 0; i < 10; ++i) {
        fs::path config_file = current / CONFIG_FILE_NAME;
        if (fs::exists(config_file)) {
            load(config_file.string());
            return true;
        }

        fs::path parent = current.parent_path();
        if (parent == current) {
            break;  // ルートに到達
        }
        current = parent;
    }

    return false;
}

void ConfigLoader::parse(const std::string& content, const std::string& origin) {
    // 簡易YAMLパーサー
    // サポート形式:
    // policy:
    //   defaults: true
    //   keep-types: [QFoo, QBar]
    //   keep-members:
    //     "*": [metaObject]
    //     QPixmap:
    //       - "*"
    // catalog:
    //   generic-suffixes:
    //     List: QList

    std::istringstream stream(content);
    std::string line;
    int line_num = 0;
    Cursor cursor;

    while (std::getline(stream, line)) {
        line_num++;
        std::string where = fmt::format("{}:{}", origin, line_num);

        // コメントを除去（行頭または空白の後の #）
        size_t hash = line.find(" #");
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        // インデントレベルを計算
        size_t indent = 0;
        for (char c : line) {
            if (c == ' ')
                indent++;
            else if (c == '\t')
                indent += 2;  // タブは2スペースとして扱う
            else
                break;
        }

        // リスト項目: "- item"
        if (trimmed[0] == '-' && (trimmed.size() == 1 || trimmed[1] == ' ')) {
            if (indent == 0 || cursor.key.empty())
                throw ConfigError(fmt::format("{}: list item without a key", where));
            add_item(cursor, unquote(trim(trimmed.substr(1))), where);
            continue;
        }

        // "key: value"（"*" のように引用されたキーも許す）
        size_t key_end = 0;
        if (trimmed[0] == '"' || trimmed[0] == '\'') {
            key_end = trimmed.find(trimmed[0], 1);
            if (key_end == std::string::npos)
                throw ConfigError(fmt::format("{}: unterminated quoted key", where));
            ++key_end;
        }
        size_t colon_pos = trimmed.find(':', key_end);
        if (colon_pos == std::string::npos)
            throw ConfigError(fmt::format("{}: expected 'key: value'", where));
        std::string name = unquote(trim(trimmed.substr(0, colon_pos)));
        std::string value = trim(trimmed.substr(colon_pos + 1));

        if (indent == 0) {
            if (name != "policy" && name != "harvest" && name != "catalog" && name != "output")
                throw ConfigError(fmt::format("{}: unknown section '{}'", where, name));
            if (!value.empty())
                throw ConfigError(fmt::format("{}: section '{}' takes no value", where, name));
            cursor = Cursor{name, "", ""};
            continue;
        }
        if (cursor.section.empty())
            throw ConfigError(fmt::format("{}: key '{}' outside of a section", where, name));

        if (indent < 4) {
            cursor.key = name;
            cursor.subkey.clear();
        } else {
            if (cursor.key != "keep-members" && cursor.key != "generic-suffixes")
                throw ConfigError(
                    fmt::format("{}: '{}' does not take nested keys", where, cursor.key));
            cursor.subkey = name;
        }

        if (value.empty())
            continue;  // 後続の "- item" 行か入れ子のキーで値を与える

        if (value.front() == '[') {
            if (value.back() != ']')
                throw ConfigError(fmt::format("{}: unterminated inline list", where));
            std::istringstream items(value.substr(1, value.size() - 2));
            std::string item;
            while (std::getline(items, item, ',')) {
                std::string trimmed_item = unquote(trim(item));
                if (!trimmed_item.empty())
                    add_item(cursor, trimmed_item, where);
            }
        } else {
            set_scalar(cursor, unquote(value), where);
        }
    }

    loaded_ = true;
}

void ConfigLoader::add_item(const Cursor& at, const std::string& item, const std::string& where) {
    auto require_identifier = [&](const std::string& name, bool allow_wildcard) {
        if (is_identifier(name) || (allow_wildcard && name == "*"))
            return;
        throw ConfigError(fmt::format("{}: '{}' is not a valid name", where, name));
    };

    if (at.section == "policy" && at.key == "keep-types" && at.subkey.empty()) {
        require_identifier(item, false);
        config_.keep_types.push_back(item);
    } else if (at.section == "policy" && at.key == "keep-members" && !at.subkey.empty()) {
        require_identifier(at.subkey, true);
        require_identifier(item, true);
        config_.keep_members.emplace_back(at.subkey, item);
    } else if (at.section == "harvest" && at.key == "extra-names" && at.subkey.empty()) {
        require_identifier(item, false);
        config_.extra_names.push_back(item);
    } else if (at.section == "catalog" && at.key == "placeholders" && at.subkey.empty()) {
        require_identifier(item, false);
        if (!config_.placeholders)
            config_.placeholders.emplace();
        config_.placeholders->push_back(item);
    } else {
        throw ConfigError(fmt::format("{}: '{}.{}' does not take a list", where, at.section,
                                      at.subkey.empty() ? at.key : at.key + "." + at.subkey));
    }
}

void ConfigLoader::set_scalar(const Cursor& at, const std::string& value,
                              const std::string& where) {
    if (at.section == "policy" && at.key == "defaults" && at.subkey.empty()) {
        if (value == "true" || value == "yes" || value == "on")
            config_.policy_defaults = true;
        else if (value == "false" || value == "no" || value == "off")
            config_.policy_defaults = false;
        else
            throw ConfigError(fmt::format("{}: expected true or false, got '{}'", where, value));
    } else if (at.section == "catalog" && at.key == "generic-suffixes" && !at.subkey.empty()) {
        if (!is_identifier(at.subkey) || !is_identifier(value))
            throw ConfigError(
                fmt::format("{}: invalid generic suffix '{}: {}'", where, at.subkey, value));
        if (!config_.generic_suffixes)
            config_.generic_suffixes.emplace();
        config_.generic_suffixes->emplace_back(at.subkey, value);
    } else if (at.section == "output" && at.key == "package" && at.subkey.empty()) {
        config_.package = value;
    } else if (at.section == "output" && at.key == "format" && at.subkey.empty()) {
        auto format = emit::parse_output_format(value);
        if (!format)
            throw ConfigError(fmt::format("{}: unknown output format '{}'", where, value));
        config_.format = *format;
    } else if (at.section == "policy" && at.key == "keep-members" && !at.subkey.empty()) {
        // "QBitArray: setBit" の単一要素形式
        add_item(at, value, where);
    } else {
        throw ConfigError(fmt::format("{}: unknown setting '{}.{}'", where, at.section,
                                      at.subkey.empty() ? at.key : at.key + "." + at.subkey));
    }
}

std::string ConfigLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string ConfigLoader::unquote(const std::string& str) {
    if (str.size() >= 2 && (str.front() == '"' || str.front() == '\'') &&
        str.back() == str.front())
        return str.substr(1, str.size() - 2);
    return str;
}

}  // namespace hatchet::config
