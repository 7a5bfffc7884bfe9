#include "catalog/cached_catalog.hpp"
#include "catalog/qt_doc_catalog.hpp"
#include "catalog/static_catalog.hpp"
#include "closure/closure_engine.hpp"
#include "common/debug_messages.hpp"
#include "common/error.hpp"
#include "config/config.hpp"
#include "emit/rejection_emitter.hpp"
#include "emit/typesystem_writer.hpp"
#include "harvest/harvester.hpp"

#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#ifndef HATCHET_VERSION
#define HATCHET_VERSION "0.1.0"
#endif

namespace fs = std::filesystem;

namespace hatchet {

// コマンドラインオプション
enum class Command { None, Analyze, Harvest, Inspect, Help };

struct Options {
    Command command = Command::None;
    std::vector<std::string> inputs;  // analyze/harvest: アプリのルート, inspect: 型名
    std::string catalog_file;         // --catalog=
    std::string qt_docs_dir;          // --qt-docs=
    std::string config_file;          // --config=
    std::string package;              // --package=
    std::string format;               // --format=
    std::string output_file;          // -o オプション
    bool stats = false;
    bool debug = false;
    std::string debug_level = "debug";
};

// ヘルプメッセージを表示
void print_help(const char* program_name) {
    std::cout << "hatchet v" << HATCHET_VERSION << " - バインディング層の到達可能性解析\n\n";
    std::cout << "使用方法:\n";
    std::cout << "  " << program_name << " <コマンド> [オプション] <引数>\n\n";
    std::cout << "コマンド:\n";
    std::cout << "  analyze <appdir>      除外できる型とメンバーを出力\n";
    std::cout << "  harvest <appdir>      アプリが使う識別子を一覧表示\n";
    std::cout << "  inspect <type>...     型の祖先・子孫・メンバーを表示\n";
    std::cout << "  help                  このヘルプを表示\n\n";
    std::cout << "カタログ:\n";
    std::cout << "  --catalog=<file>      カタログ記述ファイルを使用\n";
    std::cout << "  --qt-docs=<dir>       Qtリファレンスのオフラインミラーを使用\n\n";
    std::cout << "オプション:\n";
    std::cout << "  --config=<file>       設定ファイル（既定: .hatchet.yml を上方向に探索）\n";
    std::cout << "  --package=<name>      typesystem のパッケージ名\n";
    std::cout << "  --format=xml|text     出力形式（既定: xml）\n";
    std::cout << "  -o <file>             出力ファイル名を指定\n";
    std::cout << "  --stats               解析の統計を表示\n";
    std::cout << "  --debug, -d           デバッグ出力を有効化\n";
    std::cout << "  -d=<level>            デバッグレベル（trace/debug/info/warn/error）\n\n";
    std::cout << "その他のオプション:\n";
    std::cout << "  --lang=ja             日本語デバッグメッセージ\n";
    std::cout << "  --version             バージョン情報を表示\n\n";
    std::cout << "例:\n";
    std::cout << "  " << program_name << " analyze myapp --qt-docs=qt-4.7-docs -o rejections.xml\n";
    std::cout << "  " << program_name << " analyze myapp --catalog=qtgui.catalog --format=text\n";
    std::cout << "  " << program_name << " inspect QWidget --catalog=qtgui.catalog\n";
}

// コマンドラインオプションをパース
Options parse_options(int argc, char* argv[]) {
    Options opts;

    if (argc < 2) {
        return opts;  // コマンドなし
    }

    // 最初の引数でコマンドを判定
    std::string cmd = argv[1];
    if (cmd == "analyze") {
        opts.command = Command::Analyze;
    } else if (cmd == "harvest") {
        opts.command = Command::Harvest;
    } else if (cmd == "inspect") {
        opts.command = Command::Inspect;
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        opts.command = Command::Help;
        return opts;
    } else if (cmd == "--version") {
        std::cout << "hatchet v" << HATCHET_VERSION << "\n";
        std::exit(0);
    } else {
        std::cerr << "不明なコマンド: " << cmd << "\n";
        std::cerr << "'hatchet help' でヘルプを表示\n";
        std::exit(1);
    }

    // 残りの引数を処理
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.substr(0, 10) == "--catalog=") {
            opts.catalog_file = arg.substr(10);
        } else if (arg.substr(0, 10) == "--qt-docs=") {
            opts.qt_docs_dir = arg.substr(10);
        } else if (arg.substr(0, 9) == "--config=") {
            opts.config_file = arg.substr(9);
        } else if (arg.substr(0, 10) == "--package=") {
            opts.package = arg.substr(10);
        } else if (arg.substr(0, 9) == "--format=") {
            opts.format = arg.substr(9);
        } else if (arg == "--stats") {
            opts.stats = true;
        } else if (arg == "-o") {
            if (i + 1 < argc) {
                opts.output_file = argv[++i];
            } else {
                std::cerr << "-o オプションには出力ファイル名が必要です\n";
                std::exit(1);
            }
        } else if (arg == "--debug" || arg == "-d") {
            opts.debug = true;
            debug::set_debug_mode(true);
        } else if (arg.substr(0, 3) == "-d=") {
            opts.debug = true;
            opts.debug_level = arg.substr(3);
            debug::set_debug_mode(true);
            auto level = debug::parse_level(opts.debug_level);
            if (!level) {
                std::cerr << "不明なデバッグレベル: " << opts.debug_level
                          << "（trace/debug/info/warn/error）\n";
                std::exit(1);
            }
            debug::set_level(*level);
        } else if (arg == "--lang=ja") {
            debug::set_lang(1);
        } else if (arg[0] != '-') {
            opts.inputs.push_back(arg);
        } else {
            std::cerr << "不明なオプション: " << arg << "\n";
            std::cerr << "'hatchet help' でヘルプを表示\n";
            std::exit(1);
        }
    }

    return opts;
}

// 設定を読み込む（--config= が無ければ start から上方向に探す）
config::Config load_config(const Options& opts, const std::string& start) {
    config::ConfigLoader loader;
    if (!opts.config_file.empty()) {
        loader.load(opts.config_file);
    } else if (!loader.find_and_load(start)) {
        return config::Config{};
    }
    debug::log(debug::Stage::Driver, debug::Level::Info,
               fmt::format("config: {}", loader.config_path()));
    return loader.config();
}

// カタログのバックエンドを作る
std::unique_ptr<catalog::CatalogBackend> make_backend(const Options& opts) {
    if (!opts.catalog_file.empty() && !opts.qt_docs_dir.empty()) {
        std::cerr << "error: --catalog と --qt-docs は同時に指定できません\n";
        std::exit(1);
    }
    if (!opts.catalog_file.empty()) {
        return std::make_unique<catalog::StaticCatalog>(
            catalog::StaticCatalog::load(opts.catalog_file));
    }
    if (!opts.qt_docs_dir.empty()) {
        if (!fs::is_directory(opts.qt_docs_dir)) {
            std::cerr << "error: ディレクトリが見つかりません: " << opts.qt_docs_dir << "\n";
            std::exit(1);
        }
        return std::make_unique<catalog::QtDocCatalog>(opts.qt_docs_dir);
    }
    std::cerr << "error: --catalog=<file> か --qt-docs=<dir> でカタログを指定してください\n";
    std::exit(1);
}

// アプリケーションの識別子を集める
harvest::Harvester run_harvest(const std::string& app_root, const config::Config& cfg) {
    debug::harvest::log(debug::harvest::Id::Start, app_root);

    harvest::Harvester harvester(cfg.harvest_options());
    if (fs::is_directory(app_root)) {
        harvester.add_directory(app_root);
    } else {
        harvester.add_file(app_root);
    }
    harvester.diagnostics().print();

    debug::harvest::log(debug::harvest::Id::End,
                        fmt::format("{} units, {} identifiers", harvester.unit_count(),
                                    harvester.identifiers().size()));
    return harvester;
}

int command_harvest(const Options& opts) {
    const std::string& app_root = opts.inputs.front();
    config::Config cfg = load_config(opts, app_root);
    harvest::Harvester harvester = run_harvest(app_root, cfg);
    for (const auto& id : harvester.identifiers()) {
        std::cout << id << "\n";
    }
    return 0;
}

int command_analyze(const Options& opts) {
    const std::string& app_root = opts.inputs.front();
    config::Config cfg = load_config(opts, app_root);

    emit::OutputFormat format = cfg.format;
    if (!opts.format.empty()) {
        auto parsed = emit::parse_output_format(opts.format);
        if (!parsed) {
            std::cerr << "error: 不明な出力形式 '" << opts.format << "'（xml / text）\n";
            return 1;
        }
        format = *parsed;
    }
    std::string package = opts.package.empty() ? cfg.package : opts.package;

    harvest::Harvester harvester = run_harvest(app_root, cfg);

    auto backend = make_backend(opts);
    catalog::CachedTypeCatalog catalog(*backend, cfg.catalog_options());
    policy::OverridePolicy override_policy = cfg.make_policy();

    closure::ClosureEngine engine(catalog, override_policy);
    closure::ClosureResult result = engine.run(harvester.identifiers());

    emit::RejectionEmitter emitter(catalog);
    std::vector<emit::RejectionRecord> records = emitter.emit(result);
    emit::RejectionSummary summary = emit::summarize(records);
    debug::emit::log(debug::emit::Id::Summary,
                     fmt::format("{} types, {} members", summary.types, summary.members),
                     debug::Level::Info);

    emit::TypesystemWriter writer(package, format);
    if (opts.output_file.empty()) {
        writer.write(std::cout, records);
    } else {
        std::ofstream out(opts.output_file);
        if (!out.is_open()) {
            std::cerr << "error: ファイルを開けません: " << opts.output_file << "\n";
            return 1;
        }
        writer.write(out, records);
    }

    std::cerr << "rejecting " << summary.types << " types, " << summary.members << " members\n";

    if (opts.stats) {
        const auto& cs = result.stats();
        const auto& qs = catalog.stats();
        std::cerr << "=== Statistics ===\n";
        std::cerr << "  code units:          " << harvester.unit_count() << "\n";
        std::cerr << "  identifiers:         " << harvester.identifiers().size() << "\n";
        std::cerr << "  catalog types:       " << catalog.all_types().size() << "\n";
        std::cerr << "  useful types:        " << result.useful_types().size() << "\n";
        std::cerr << "  seeded:              " << cs.seeded << "\n";
        std::cerr << "  visited:             " << cs.visited << "\n";
        std::cerr << "  expansion additions: " << cs.expansion_additions << "\n";
        std::cerr << "  members checked:     " << cs.members_checked << "\n";
        std::cerr << "  backend queries:     " << qs.backend_queries << "\n";
        std::cerr << "  cache hits:          " << qs.cache_hits << "\n";
    }
    return 0;
}

int command_inspect(const Options& opts) {
    config::Config cfg = load_config(opts, ".");
    auto backend = make_backend(opts);
    catalog::CachedTypeCatalog catalog(*backend, cfg.catalog_options());
    policy::OverridePolicy override_policy = cfg.make_policy();

    int status = 0;
    for (const auto& type : opts.inputs) {
        if (!catalog.has_type(type)) {
            std::cerr << "error: 型ではありません: " << type << "\n";
            status = 1;
            continue;
        }
        std::cout << type;
        if (override_policy.is_kept_type(type))
            std::cout << " (always kept)";
        std::cout << "\n";
        std::cout << "  ancestors:   " << fmt::format("{}", fmt::join(catalog.ancestors(type), ", "))
                  << "\n";
        std::cout << "  descendants: "
                  << fmt::format("{}", fmt::join(catalog.descendants(type), ", ")) << "\n";
        std::cout << "  members:\n";
        for (const auto& member : catalog.members(type)) {
            policy::ForceReason reason = override_policy.why_forced(type, member, catalog);
            std::cout << "    " << member << " ["
                      << catalog::member_kind_str(catalog.member_kind(type, member)) << "]";
            if (reason != policy::ForceReason::None)
                std::cout << " kept: " << policy::force_reason_str(reason);
            std::cout << "\n";
        }
    }
    return status;
}

}  // namespace hatchet

int main(int argc, char* argv[]) {
    using namespace hatchet;

    // オプションをパース
    Options opts = parse_options(argc, argv);

    // コマンドの処理
    if (opts.command == Command::Help) {
        print_help(argv[0]);
        return 0;
    }

    if (opts.command == Command::None || opts.inputs.empty()) {
        if (argc == 1) {
            std::cerr << "エラー: コマンドが指定されていません\n";
            std::cerr << "'hatchet help' でヘルプを表示\n";
        } else {
            std::cerr << "エラー: 入力が指定されていません\n";
        }
        return 1;
    }

    if (opts.command != Command::Inspect && opts.inputs.size() > 1) {
        std::cerr << "複数の入力は指定できません\n";
        return 1;
    }

    if (opts.command != Command::Inspect && !fs::exists(opts.inputs.front())) {
        std::cerr << "error: 見つかりません: " << opts.inputs.front() << "\n";
        return 1;
    }

    try {
        switch (opts.command) {
            case Command::Analyze:
                return command_analyze(opts);
            case Command::Harvest:
                return command_harvest(opts);
            case Command::Inspect:
                return command_inspect(opts);
            default:
                break;
        }
    } catch (const CatalogError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
