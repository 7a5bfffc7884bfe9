#include "harvester.hpp"

#include "../common/debug/harvest.hpp"
#include "python/compiled_unit.hpp"
#include "python/source_unit.hpp"
#include "zip_archive.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace hatchet::harvest {

namespace {

// アーカイブの中のアーカイブをたどる深さの上限
constexpr int MAX_ARCHIVE_DEPTH = 4;

bool read_file(const fs::path& path, std::string& out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open())
        return false;
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad())
        return false;
    out = buffer.str();
    return true;
}

bool has_extension(const std::string& name, const char* ext) {
    std::string suffix(ext);
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "pkg/sub/mod.py" -> "pkg.sub.mod"
std::string module_name_for(const std::string& archive_path) {
    std::string name = archive_path;
    size_t dot = name.rfind('.');
    if (dot != std::string::npos)
        name.erase(dot);
    std::replace(name.begin(), name.end(), '/', '.');
    return name;
}

}  // namespace

Harvester::Harvester(HarvestOptions options) : options_(std::move(options)) {
    if (!options_.extra_names.empty()) {
        debug::harvest::log(debug::harvest::Id::ExtraNames,
                            std::to_string(options_.extra_names.size()));
    }
    for (const auto& name : options_.extra_names) {
        ids_.insert(name);
    }
}

void Harvester::add_directory(const fs::path& path, const std::string& package) {
    debug::harvest::log(debug::harvest::Id::DirectoryEnter, path.string());

    std::error_code ec;
    std::vector<fs::path> children;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(it->path());
    }
    if (ec) {
        skip_unit(path.string(), ec.message());
        return;
    }
    // 走査順を固定する
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        std::string name = child.filename().string();
        if (fs::is_directory(child, ec)) {
            bool is_package = fs::exists(child / "__init__.py", ec) ||
                              fs::exists(child / "__init__.pyc", ec);
            if (is_package) {
                debug::harvest::log(debug::harvest::Id::PackageFound, package + name);
                add_directory(child, package + name + ".");
            } else {
                add_directory(child);
            }
        } else {
            add_file(child, package);
        }
    }
}

void Harvester::add_file(const fs::path& path, const std::string& package) {
    std::string name = path.filename().string();
    if (has_extension(name, ".zip")) {
        add_archive(path);
        return;
    }
    bool source = has_extension(name, ".py");
    bool compiled = has_extension(name, ".pyc");
    if (!source && !compiled)
        return;

    std::string content;
    if (!read_file(path, content)) {
        skip_unit(path.string(), "cannot read file");
        return;
    }
    std::string module = package + path.stem().string();
    if (source) {
        add_source(module, content, path.string());
    } else {
        add_compiled(module, content, path.string());
    }
}

void Harvester::add_archive(const fs::path& path) {
    debug::harvest::log(debug::harvest::Id::ArchiveOpen, path.string());
    try {
        add_archive_members(ZipArchive::open(path), path.string(), 0);
    } catch (const ArchiveError& e) {
        skip_unit(path.string(), e.what());
    }
}

void Harvester::add_archive_members(const ZipArchive& archive, const std::string& location,
                                    int depth) {
    for (const ZipEntry& entry : archive.entries()) {
        if (entry.is_directory())
            continue;
        bool source = has_extension(entry.name, ".py");
        bool compiled = has_extension(entry.name, ".pyc");
        bool bundle = has_extension(entry.name, ".zip");
        if (!source && !compiled && !bundle)
            continue;

        std::string member = location + "!" + entry.name;
        debug::harvest::log(debug::harvest::Id::ArchiveMember, member, debug::Level::Trace);
        if (bundle && depth + 1 > MAX_ARCHIVE_DEPTH) {
            skip_unit(member, "archive nested too deeply");
            continue;
        }

        std::string content;
        try {
            content = archive.read(entry);
            if (bundle) {
                debug::harvest::log(debug::harvest::Id::ArchiveOpen, member);
                add_archive_members(ZipArchive::from_bytes(std::move(content)), member,
                                    depth + 1);
                continue;
            }
        } catch (const ArchiveError& e) {
            skip_unit(member, e.what());
            continue;
        }
        std::string module = module_name_for(entry.name);
        if (source) {
            add_source(module, content, member);
        } else {
            add_compiled(module, content, member);
        }
    }
}

void Harvester::add_source(const std::string& module_name, std::string_view source,
                           const std::string& location) {
    debug::harvest::log(debug::harvest::Id::SourceUnit, location);
    python::SourceError error;
    auto unit = python::SourceUnit::parse(module_name, source, &error);
    if (!unit) {
        skip_unit(location, fmt::format("line {}: {}", error.line, error.message));
        return;
    }
    add_unit(*unit);
}

void Harvester::add_compiled(const std::string& module_name, std::string_view data,
                             const std::string& location) {
    debug::harvest::log(debug::harvest::Id::CompiledUnit, location);
    try {
        auto unit = python::CompiledUnit::from_pyc(data);
        debug::harvest::log(debug::harvest::Id::CompiledUnit, module_name, debug::Level::Trace);
        add_unit(*unit);
    } catch (const python::MarshalError& e) {
        skip_unit(location, e.what());
    }
}

void Harvester::add_unit(const CodeUnit& unit) {
    ++unit_count_;
    collect_identifiers(unit, ids_);
}

void Harvester::skip_unit(const std::string& location, const std::string& reason) {
    debug::harvest::log(debug::harvest::Id::UnitSkipped, location + ": " + reason,
                        debug::Level::Warn);
    diagnostics_.warning(location, fmt::format("skipped code unit: {}", reason));
}

}  // namespace hatchet::harvest
