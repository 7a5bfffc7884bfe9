#pragma once

#include <iostream>
#include <string>
#include <vector>

namespace hatchet {

/// 診断メッセージの重大度
enum class Severity {
    Error,
    Warning,
    Note,
};

/// 単一の診断メッセージ
/// location はファイルパス、またはアーカイブ内なら "bundle.zip!pkg/mod.py"
struct Diagnostic {
    Severity severity;
    std::string location;
    std::string message;

    Diagnostic(Severity sev, std::string loc, std::string msg)
        : severity(sev), location(std::move(loc)), message(std::move(msg)) {}
};

/// 診断メッセージを収集・表示するクラス
class Diagnostics {
   public:
    Diagnostics() : error_count_(0), warning_count_(0) {}

    /// エラーを追加
    void error(const std::string& location, const std::string& message) {
        diagnostics_.emplace_back(Severity::Error, location, message);
        ++error_count_;
    }

    /// 警告を追加
    void warning(const std::string& location, const std::string& message) {
        diagnostics_.emplace_back(Severity::Warning, location, message);
        ++warning_count_;
    }

    /// ノートを追加
    void note(const std::string& location, const std::string& message) {
        diagnostics_.emplace_back(Severity::Note, location, message);
    }

    /// エラーがあるか
    bool has_errors() const { return error_count_ > 0; }

    /// エラー数を取得
    size_t error_count() const { return error_count_; }

    /// 警告数を取得
    size_t warning_count() const { return warning_count_; }

    /// 全ての診断メッセージ
    const std::vector<Diagnostic>& all() const { return diagnostics_; }

    /// 全ての診断メッセージを表示
    void print(std::ostream& out = std::cerr, bool color = true) const;

    /// 診断メッセージをクリア
    void clear() {
        diagnostics_.clear();
        error_count_ = 0;
        warning_count_ = 0;
    }

   private:
    void print_diagnostic(std::ostream& out, const Diagnostic& diag, bool color) const;

    std::vector<Diagnostic> diagnostics_;
    size_t error_count_;
    size_t warning_count_;
};

}  // namespace hatchet
