#include "../../src/harvest/python/compiled_unit.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace hatchet;
using namespace hatchet::harvest::python;
namespace m = hatchet::test_support::marshal;

// ============================================================
// .pyc ヘッダ
// ============================================================
TEST(PycHeaderTest, HeaderSizeAndLayoutByMagic) {
    struct Case {
        uint16_t magic;
        size_t header_size;
        CodeLayout layout;
    };
    const Case cases[] = {
        {62211, 8, CodeLayout::Py2},    // 2.7
        {3150, 8, CodeLayout::Py30},    // 3.1
        {3230, 12, CodeLayout::Py30},   // 3.3
        {3379, 12, CodeLayout::Py30},   // 3.6
        {3394, 16, CodeLayout::Py30},   // 3.7
        {3413, 16, CodeLayout::Py38},   // 3.8
        {3439, 16, CodeLayout::Py38},   // 3.10
        {3495, 16, CodeLayout::Py311},  // 3.11
    };
    for (const auto& c : cases) {
        PycHeader header = read_pyc_header(m::pyc_header(c.magic));
        EXPECT_EQ(header.magic, c.magic);
        EXPECT_EQ(header.header_size, c.header_size) << "magic " << c.magic;
        EXPECT_EQ(header.layout, c.layout) << "magic " << c.magic;
    }
}

TEST(PycHeaderTest, RejectsNonPycData) {
    EXPECT_THROW(read_pyc_header("print('hello')\n"), MarshalError);
    EXPECT_THROW(read_pyc_header("ab"), MarshalError);
}

// ============================================================
// code オブジェクト
// ============================================================
class CompiledUnitTest : public ::testing::Test {
   protected:
    static IdentifierSet collect(const CompiledUnit& unit) {
        IdentifierSet ids;
        harvest::collect_identifiers(unit, ids);
        return ids;
    }
};

TEST_F(CompiledUnitTest, Python38ModuleWithNestedFunction) {
    std::string function = m::code38("on_click", m::small_tuple({m::none()}),
                                     m::small_tuple({m::str("statusBar"), m::str("showMessage")}));
    std::string module = m::code38(
        "<module>",
        m::small_tuple({function, m::str("setWindowTitle"), m::str("not an identifier"),
                        m::integer(42), m::none()}),
        m::small_tuple({m::str("QMainWindow"), m::str("show")}));

    auto unit = CompiledUnit::from_pyc(m::pyc_header(3413) + module);
    ASSERT_NE(unit, nullptr);
    EXPECT_EQ(unit->name(), "<module>");
    EXPECT_EQ(unit->referenced_names(), (std::vector<std::string>{"QMainWindow", "show"}));
    ASSERT_EQ(unit->nested_units().size(), 1u);
    EXPECT_EQ(unit->nested_units()[0]->name(), "on_click");

    EXPECT_EQ(collect(*unit), (IdentifierSet{"QMainWindow", "show", "setWindowTitle",
                                             "statusBar", "showMessage"}));
}

TEST_F(CompiledUnitTest, ConstantTuplesAndFrozensetsAreSearched) {
    std::string module = m::code38(
        "<module>",
        m::small_tuple({m::small_tuple({m::str("sizeHint"), m::small_tuple({m::str("QSize")})}),
                        m::frozenset({m::str("paintEvent")})}),
        m::small_tuple({}));

    auto unit = CompiledUnit::from_pyc(m::pyc_header(3425) + module);
    auto ids = collect(*unit);
    EXPECT_TRUE(ids.count("sizeHint"));
    EXPECT_TRUE(ids.count("QSize"));
    EXPECT_TRUE(ids.count("paintEvent"));
}

TEST_F(CompiledUnitTest, ObjectReferences) {
    // 最初の文字列に参照フラグを立て、二つ目の名前で参照する
    std::string module = m::code38("<module>", m::small_tuple({m::ref(0)}),
                                   m::small_tuple({m::str("QLabel", true), m::ref(0)}));
    // co_consts の参照は co_names より先に読まれるので、順序を入れ替えて組み立てる
    std::string names_first = m::code38("<module>", m::small_tuple({m::str("QLabel", true)}),
                                         m::small_tuple({m::ref(0), m::str("setText")}));

    auto unit = CompiledUnit::from_pyc(m::pyc_header(3413) + names_first);
    EXPECT_EQ(unit->referenced_names(), (std::vector<std::string>{"QLabel", "setText"}));
    EXPECT_EQ(unit->string_constants(), (std::vector<std::string>{"QLabel"}));

    // 未定義の参照は読み込みエラー
    EXPECT_THROW(CompiledUnit::from_pyc(m::pyc_header(3413) + module), MarshalError);
}

TEST_F(CompiledUnitTest, Python311Layout) {
    std::string method = m::code311("paintEvent", m::small_tuple({}),
                                    m::small_tuple({m::str("QPainter"), m::str("drawText")}));
    std::string module = m::code311("<module>", m::small_tuple({method, m::str("update")}),
                                    m::small_tuple({m::str("QWidget")}));

    auto unit = CompiledUnit::from_pyc(m::pyc_header(3495) + module);
    EXPECT_EQ(collect(*unit),
              (IdentifierSet{"QWidget", "update", "QPainter", "drawText"}));
    ASSERT_EQ(unit->nested_units().size(), 1u);
    EXPECT_EQ(unit->nested_units()[0]->name(), "paintEvent");
}

TEST_F(CompiledUnitTest, Python2LayoutWithInternedStrings) {
    std::string module = m::code2(
        "<module>", m::tuple({m::bytes("setObjectName"), m::none()}),
        m::tuple({m::interned("QWidget"), m::interned("resize"), m::interned_ref(0)}));

    auto unit = CompiledUnit::from_pyc(m::pyc_header(62211) + module);
    EXPECT_EQ(unit->referenced_names(),
              (std::vector<std::string>{"QWidget", "resize", "QWidget"}));
    EXPECT_EQ(collect(*unit), (IdentifierSet{"QWidget", "resize", "setObjectName"}));
}

TEST_F(CompiledUnitTest, TruncatedDataThrows) {
    std::string module = m::code38("<module>", m::small_tuple({}), m::small_tuple({}));
    std::string truncated = m::pyc_header(3413) + module.substr(0, module.size() / 2);
    EXPECT_THROW(CompiledUnit::from_pyc(truncated), MarshalError);
}

TEST_F(CompiledUnitTest, NonCodeTopLevelObjectThrows) {
    EXPECT_THROW(CompiledUnit::from_pyc(m::pyc_header(3413) + m::str("hello")), MarshalError);
}

TEST_F(CompiledUnitTest, UnknownTypeCodeThrows) {
    EXPECT_THROW(CompiledUnit::from_pyc(m::pyc_header(3413) + "?"), MarshalError);
}
