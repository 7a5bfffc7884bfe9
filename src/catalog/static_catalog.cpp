#include "static_catalog.hpp"

#include "../common/debug/catalog.hpp"
#include "../common/error.hpp"
#include "../common/identifier.hpp"
#include "signature.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace hatchet::catalog {

namespace {

std::string_view trim(std::string_view s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string_view::npos)
        return {};
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

bool consume_word(std::string_view& s, std::string_view word) {
    if (s.substr(0, word.size()) != word)
        return false;
    if (s.size() > word.size() && s[word.size()] != ' ' && s[word.size()] != '\t')
        return false;
    s = trim(s.substr(word.size()));
    return true;
}

std::string take_identifier(std::string_view& s) {
    size_t len = 0;
    while (len < s.size() && (len == 0 ? is_identifier_start(s[len]) : is_identifier_char(s[len])))
        ++len;
    std::string name(s.substr(0, len));
    s = trim(s.substr(len));
    return name;
}

// "A, B, C" → {"A", "B", "C"}（空要素は誤り）
bool split_names(std::string_view s, std::vector<std::string>& out) {
    while (true) {
        size_t comma = s.find(',');
        std::string_view item = trim(s.substr(0, comma));
        if (!is_identifier(item))
            return false;
        out.emplace_back(item);
        if (comma == std::string_view::npos)
            return true;
        s = s.substr(comma + 1);
    }
}

void push_unique(std::vector<std::string>& v, const std::string& name) {
    if (std::find(v.begin(), v.end(), name) == v.end())
        v.push_back(name);
}

}  // namespace

// ============================================================
// 組み立て
// ============================================================

StaticCatalog& StaticCatalog::add_type(const std::string& name,
                                       const std::vector<std::string>& bases) {
    auto [it, inserted] = types_.try_emplace(name);
    if (inserted)
        order_.push_back(name);
    for (const auto& base : bases) {
        if (std::find(it->second.bases.begin(), it->second.bases.end(), base) !=
            it->second.bases.end())
            continue;
        it->second.bases.push_back(base);
        push_unique(derived_[base], name);
    }
    return *this;
}

StaticCatalog& StaticCatalog::add_member(const std::string& type, MemberInfo member) {
    add_type(type);
    types_[type].members.push_back(std::move(member));
    return *this;
}

StaticCatalog& StaticCatalog::add_function(const std::string& type, const std::string& name,
                                           const std::string& signature, bool pure_virtual) {
    return add_member(type, MemberInfo{name, MemberKind::Function, signature, pure_virtual});
}

StaticCatalog& StaticCatalog::add_field(const std::string& type, const std::string& name,
                                        const std::string& field_type) {
    return add_member(type, MemberInfo{name, MemberKind::Field, field_type, false});
}

StaticCatalog& StaticCatalog::add_alias(const std::string& alias,
                                        const std::vector<std::string>& targets) {
    aliases_[alias] = targets;
    return *this;
}

// ============================================================
// 記述ファイルの解析
// ============================================================

StaticCatalog StaticCatalog::parse(std::string_view text, const std::string& origin) {
    StaticCatalog catalog;
    std::string current;  // 直前の class 行の型
    int line_no = 0;

    auto fail = [&](const std::string& message) {
        throw CatalogError(fmt::format("{}:{}: {}", origin, line_no, message));
    };

    while (!text.empty()) {
        ++line_no;
        size_t nl = text.find('\n');
        std::string_view raw = text.substr(0, nl);
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);

        std::string_view line = trim(raw);
        if (line.empty() || line[0] == '#')
            continue;
        bool indented = raw[0] == ' ' || raw[0] == '\t';

        if (!indented) {
            if (consume_word(line, "class")) {
                std::string name = take_identifier(line);
                if (name.empty())
                    fail("expected type name after 'class'");
                std::vector<std::string> bases;
                if (!line.empty()) {
                    if (line[0] != ':')
                        fail(fmt::format("unexpected '{}' after type name", line));
                    if (!split_names(line.substr(1), bases))
                        fail("malformed base list");
                }
                catalog.add_type(name, bases);
                current = name;
            } else if (consume_word(line, "alias")) {
                std::string name = take_identifier(line);
                if (name.empty() || line.empty() || line[0] != '=')
                    fail("expected 'alias <name> = <type>, ...'");
                std::vector<std::string> targets;
                if (!split_names(line.substr(1), targets))
                    fail("malformed alias target list");
                catalog.add_alias(name, targets);
                current.clear();
            } else {
                fail(fmt::format("unknown directive '{}'", line));
            }
            continue;
        }

        // メンバー行
        if (current.empty())
            fail("member declared outside of a class");
        bool pure = consume_word(line, "pure");
        if (consume_word(line, "function")) {
            std::string name = take_identifier(line);
            if (name.empty())
                fail("expected member name after 'function'");
            catalog.add_function(current, name, std::string(line), pure);
        } else if (consume_word(line, "field")) {
            if (pure)
                fail("a field cannot be pure virtual");
            std::string name = take_identifier(line);
            if (name.empty())
                fail("expected member name after 'field'");
            if (!line.empty() && line[0] == ':')
                line = trim(line.substr(1));
            catalog.add_field(current, name, std::string(line));
        } else {
            fail(fmt::format("expected 'function' or 'field', got '{}'", line));
        }
    }

    debug::catalog::log(debug::catalog::Id::CatalogParsed,
                        fmt::format("{} ({} types)", origin, catalog.type_count()));
    return catalog;
}

StaticCatalog StaticCatalog::load(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw CatalogError(fmt::format("cannot open catalog file '{}'", path.string()));
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad())
        throw CatalogError(fmt::format("failed to read catalog file '{}'", path.string()));
    return parse(buffer.str(), path.string());
}

// ============================================================
// 問い合わせ
// ============================================================

const StaticCatalog::TypeInfo* StaticCatalog::find(const std::string& type) const {
    auto it = types_.find(type);
    return it == types_.end() ? nullptr : &it->second;
}

std::vector<std::string> StaticCatalog::type_names() {
    return order_;
}

bool StaticCatalog::has_type(const std::string& name) {
    return types_.count(name) > 0;
}

std::vector<std::string> StaticCatalog::direct_bases(const std::string& type) {
    const TypeInfo* info = find(type);
    return info ? info->bases : std::vector<std::string>{};
}

std::vector<std::string> StaticCatalog::direct_derived(const std::string& type) {
    auto it = derived_.find(type);
    return it == derived_.end() ? std::vector<std::string>{} : it->second;
}

std::vector<std::string> StaticCatalog::member_names(const std::string& type) {
    std::vector<std::string> names;
    if (const TypeInfo* info = find(type)) {
        for (const auto& member : info->members) {
            names.push_back(member.name);
        }
    }
    return names;
}

std::vector<std::string> StaticCatalog::signature_type_names(const std::string& type,
                                                             const std::string& member) {
    std::vector<std::string> names;
    const TypeInfo* info = find(type);
    if (!info)
        return names;
    for (const auto& m : info->members) {
        if (m.name != member)
            continue;
        for (const auto& name : catalog::signature_type_names(m.signature)) {
            push_unique(names, name);
        }
    }
    return names;
}

bool StaticCatalog::is_pure_virtual(const std::string& type, const std::string& member) {
    const TypeInfo* info = find(type);
    if (!info)
        return false;
    return std::any_of(info->members.begin(), info->members.end(), [&](const MemberInfo& m) {
        return m.name == member && m.pure_virtual;
    });
}

MemberKind StaticCatalog::member_kind(const std::string& type, const std::string& member) {
    if (const TypeInfo* info = find(type)) {
        for (const auto& m : info->members) {
            if (m.name == member)
                return m.kind;
        }
    }
    return MemberKind::Unknown;
}

std::optional<std::vector<std::string>> StaticCatalog::resolve_alias(const std::string& name) {
    auto it = aliases_.find(name);
    if (it == aliases_.end())
        return std::nullopt;
    return it->second;
}

}  // namespace hatchet::catalog
