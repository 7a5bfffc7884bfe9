#include "qt_doc_catalog.hpp"

#include "../common/debug/catalog.hpp"
#include "../common/error.hpp"
#include "signature.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace hatchet::catalog {

namespace {

const std::regex RE_BASIC_TAG(R"(<[^>]+>)");
const std::regex RE_CLASS_LINK(R"(<a href="(\w+)\.html">(\w+)</a>)");
const std::regex RE_METHOD_LINK(R"re(<a href="(\w+)\.html#([\w\-\.]+)">(\w+)</a>)re");

// ページに現れない合成の型
const char* const SYNTHETIC_TYPES[] = {"QTextStreamManipulator", "QScriptExtensionInterface"};

bool is_synthetic(const std::string& name) {
    return std::find(std::begin(SYNTHETIC_TYPES), std::end(SYNTHETIC_TYPES), name) !=
           std::end(SYNTHETIC_TYPES);
}

// ドキュメントに載っていない手書きのメンバーと、そのシグネチャに現れる型
struct ExtraMember {
    const char* type;
    const char* member;
    std::vector<std::string> related;
};

const std::vector<ExtraMember>& extra_members() {
    static const std::vector<ExtraMember> extras = {
        {"QAbstractItemModel", "decodeData", {"QModelIndexList", "QDataStream"}},
        {"QAbstractItemModel", "encodeData", {"QModelIndexList", "QDataStream"}},
        {"QScriptExtensionInterface", "initialize", {"QScriptEngine"}},
    };
    return extras;
}

const ExtraMember* find_extra(const std::string& type, const std::string& member) {
    for (const auto& extra : extra_members()) {
        if (type == extra.type && member == extra.member)
            return &extra;
    }
    return nullptr;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

// <a href="qobject.html">QObject</a> のように、リンク先が型名自身のページであるもの
std::vector<std::string> linked_classes(const std::string& line) {
    std::vector<std::string> names;
    for (std::sregex_iterator it(line.begin(), line.end(), RE_CLASS_LINK), end; it != end; ++it) {
        if ((*it)[1].str() == to_lower((*it)[2].str()))
            names.push_back((*it)[2].str());
    }
    return names;
}

// <a href="qwidget.html#show">show</a> のように、アンカーが名前を含むもの
std::vector<std::string> linked_methods(const std::string& line) {
    std::vector<std::string> names;
    for (std::sregex_iterator it(line.begin(), line.end(), RE_METHOD_LINK), end; it != end;
         ++it) {
        if ((*it)[2].str().find((*it)[3].str()) != std::string::npos)
            names.push_back((*it)[3].str());
    }
    return names;
}

}  // namespace

QtDocCatalog::QtDocCatalog(std::filesystem::path root) : root_(std::move(root)) {}

const std::optional<std::string>& QtDocCatalog::page(const std::string& name) {
    auto it = pages_.find(name);
    if (it != pages_.end()) {
        debug::catalog::log(debug::catalog::Id::PageCached, name, debug::Level::Trace);
        return it->second;
    }

    std::filesystem::path path = root_ / name;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        debug::catalog::log(debug::catalog::Id::PageMissing, name, debug::Level::Trace);
        return pages_.emplace(name, std::nullopt).first->second;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file)
        throw CatalogError(fmt::format("cannot read documentation page '{}'", path.string()));
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad())
        throw CatalogError(fmt::format("failed to read documentation page '{}'", path.string()));

    ++pages_read_;
    debug::catalog::log(debug::catalog::Id::PageRead, name);
    return pages_.emplace(name, buffer.str()).first->second;
}

std::vector<std::string> QtDocCatalog::page_lines(const std::string& name) {
    std::vector<std::string> lines;
    const auto& content = page(name);
    if (!content)
        return lines;
    std::istringstream stream(*content);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(trim(line));
    }
    return lines;
}

std::vector<std::string> QtDocCatalog::type_names() {
    std::vector<std::string> names(std::begin(SYNTHETIC_TYPES), std::end(SYNTHETIC_TYPES));
    if (!page("classes.html"))
        throw CatalogError(
            fmt::format("class index '{}' not found", (root_ / "classes.html").string()));
    for (const auto& line : page_lines("classes.html")) {
        if (!starts_with(line, "<dd>"))
            continue;
        auto linked = linked_classes(line);
        if (!linked.empty())
            names.push_back(linked.front());
    }
    return names;
}

bool QtDocCatalog::has_type(const std::string& name) {
    if (is_synthetic(name))
        return true;
    return page(to_lower(name) + "-members.html").has_value();
}

std::vector<std::string> QtDocCatalog::linked_types_on(const std::string& type,
                                                       const char* marker) {
    std::vector<std::string> names;
    for (const auto& line : page_lines(to_lower(type) + ".html")) {
        if (line.find(marker) == std::string::npos)
            continue;
        for (auto& name : linked_classes(line)) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

std::vector<std::string> QtDocCatalog::direct_bases(const std::string& type) {
    return linked_types_on(type, "Inherits");
}

std::vector<std::string> QtDocCatalog::direct_derived(const std::string& type) {
    return linked_types_on(type, "Inherited by");
}

std::vector<std::string> QtDocCatalog::member_names(const std::string& type) {
    std::vector<std::string> names;
    for (const auto& extra : extra_members()) {
        if (type == extra.type)
            names.push_back(extra.member);
    }
    if (is_synthetic(type))
        return names;
    for (const auto& line : page_lines(to_lower(type) + "-members.html")) {
        if (!starts_with(line, "<li class=\"fn\">"))
            continue;
        for (auto& name : linked_methods(line)) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

std::vector<std::string> QtDocCatalog::signature_type_names(const std::string& type,
                                                            const std::string& member) {
    if (const ExtraMember* extra = find_extra(type, member))
        return extra->related;
    if (is_synthetic(type))
        return {};

    std::vector<std::string> names;
    std::string needle = ">" + member + "<";
    for (const auto& line : page_lines(to_lower(type) + "-members.html")) {
        if (!starts_with(line, "<li class=\"fn\">") || line.find(needle) == std::string::npos)
            continue;
        // 名前の太字部分より後ろがシグネチャ
        size_t bold = line.rfind("</b>");
        std::string signature = bold == std::string::npos ? line : line.substr(bold + 4);
        signature = std::regex_replace(signature, RE_BASIC_TAG, " ");
        for (auto& name : catalog::signature_type_names(signature)) {
            if (std::find(names.begin(), names.end(), name) == names.end())
                names.push_back(std::move(name));
        }
    }
    return names;
}

bool QtDocCatalog::is_pure_virtual(const std::string& type, const std::string& member) {
    std::string needle = ">" + member + "<";
    for (const auto& line : page_lines(to_lower(type) + ".html")) {
        if (!starts_with(line, "<tr><td class=\"memItemLeft "))
            continue;
        if (line.find(needle) != std::string::npos && line.find("= 0</td>") != std::string::npos)
            return true;
    }
    return false;
}

}  // namespace hatchet::catalog
