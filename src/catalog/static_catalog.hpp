#pragma once

#include "type_catalog.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hatchet::catalog {

/// 宣言されたメンバー（オーバーロードごとに一つ）
struct MemberInfo {
    std::string name;
    MemberKind kind = MemberKind::Function;
    std::string signature;  // "(QLayout *layout) -> void" / "int"
    bool pure_virtual = false;
};

// ============================================================
// メモリ上のカタログ
// プログラムから組み立てるか、行単位の記述ファイルから読み込む
//
//   # comment
//   class QWidget : QObject, QPaintDevice
//       function setLayout(QLayout *layout) -> void
//       pure function paintEngine() -> QPaintEngine *
//       field x : int
//   alias QObjectList = QList, QObject
// ============================================================
class StaticCatalog : public CatalogBackend {
   public:
    StaticCatalog() = default;

    /// 型を宣言する（既にあれば基底を追加する）
    StaticCatalog& add_type(const std::string& name, const std::vector<std::string>& bases = {});

    /// メンバーを宣言する（型が未宣言なら宣言する）
    StaticCatalog& add_member(const std::string& type, MemberInfo member);

    StaticCatalog& add_function(const std::string& type, const std::string& name,
                                const std::string& signature = "", bool pure_virtual = false);

    StaticCatalog& add_field(const std::string& type, const std::string& name,
                             const std::string& field_type = "");

    /// 型別名（"QObjectList" → QList, QObject）
    StaticCatalog& add_alias(const std::string& alias, const std::vector<std::string>& targets);

    /// 記述テキストを解析する（誤りは CatalogError）
    static StaticCatalog parse(std::string_view text, const std::string& origin = "<catalog>");

    /// 記述ファイルを読み込む（読めなければ CatalogError）
    static StaticCatalog load(const std::filesystem::path& path);

    size_t type_count() const { return order_.size(); }

    std::vector<std::string> type_names() override;
    bool has_type(const std::string& name) override;
    std::vector<std::string> direct_bases(const std::string& type) override;
    std::vector<std::string> direct_derived(const std::string& type) override;
    std::vector<std::string> member_names(const std::string& type) override;
    std::vector<std::string> signature_type_names(const std::string& type,
                                                  const std::string& member) override;
    bool is_pure_virtual(const std::string& type, const std::string& member) override;
    MemberKind member_kind(const std::string& type, const std::string& member) override;
    std::optional<std::vector<std::string>> resolve_alias(const std::string& name) override;

   private:
    struct TypeInfo {
        std::vector<std::string> bases;
        std::vector<MemberInfo> members;
    };

    const TypeInfo* find(const std::string& type) const;

    std::vector<std::string> order_;  // 宣言順
    std::map<std::string, TypeInfo> types_;
    std::map<std::string, std::vector<std::string>> derived_;
    std::map<std::string, std::vector<std::string>> aliases_;
};

}  // namespace hatchet::catalog
