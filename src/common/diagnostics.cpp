// ============================================================
// Diagnostics 実装
// ============================================================

#include "diagnostics.hpp"

namespace hatchet {

void Diagnostics::print(std::ostream& out, bool color) const {
    for (const auto& diag : diagnostics_) {
        print_diagnostic(out, diag, color);
    }

    // サマリー
    if (error_count_ > 0 || warning_count_ > 0) {
        out << "\n";
        if (error_count_ > 0) {
            out << "error: " << error_count_ << " error(s)";
        }
        if (warning_count_ > 0) {
            if (error_count_ > 0)
                out << ", ";
            out << warning_count_ << " warning(s)";
        }
        out << " generated.\n";
    }
}

void Diagnostics::print_diagnostic(std::ostream& out, const Diagnostic& diag, bool color) const {
    // 色付け用のANSIコード
    const char* color_reset = color ? "\033[0m" : "";
    const char* color_bold = color ? "\033[1m" : "";
    const char* color_red = color ? "\033[31m" : "";
    const char* color_yellow = color ? "\033[33m" : "";
    const char* color_cyan = color ? "\033[36m" : "";

    // 場所
    out << color_bold << diag.location << ": " << color_reset;

    // 重大度
    switch (diag.severity) {
        case Severity::Error:
            out << color_bold << color_red << "error: " << color_reset;
            break;
        case Severity::Warning:
            out << color_bold << color_yellow << "warning: " << color_reset;
            break;
        case Severity::Note:
            out << color_bold << color_cyan << "note: " << color_reset;
            break;
    }

    out << diag.message << "\n";
}

}  // namespace hatchet
