#include "../../src/harvest/python/lexer.hpp"
#include "../../src/harvest/python/source_unit.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace hatchet;
using namespace hatchet::harvest::python;

// ============================================================
// 字句解析
// ============================================================
class PythonLexerTest : public ::testing::Test {
   protected:
    std::vector<Token> tokenize(const std::string& source) {
        Lexer lexer(source);
        auto tokens = lexer.tokenize();
        EXPECT_FALSE(lexer.has_error()) << lexer.error_message();
        return tokens;
    }
};

TEST_F(PythonLexerTest, AttributeAccess) {
    auto tokens = tokenize("self.label.setText(\"Hello\")");
    ASSERT_EQ(tokens.size(), 10u);  // self . label . setText ( "Hello" ) NEWLINE EOF
    EXPECT_TRUE(tokens[0].is_name("self"));
    EXPECT_TRUE(tokens[1].is_op("."));
    EXPECT_TRUE(tokens[4].is_name("setText"));
    EXPECT_EQ(tokens[6].kind, TokenKind::String);
    EXPECT_EQ(tokens[6].text, "Hello");
    EXPECT_EQ(tokens[8].kind, TokenKind::Newline);
    EXPECT_EQ(tokens[9].kind, TokenKind::Eof);
}

TEST_F(PythonLexerTest, CommentsAreSkipped) {
    auto tokens = tokenize("# widget.hide()\nx = 1  # trailing.comment\n");
    ASSERT_EQ(tokens.size(), 5u);  // x = 1 NEWLINE EOF
    EXPECT_TRUE(tokens[0].is_name("x"));
    EXPECT_EQ(tokens[2].kind, TokenKind::Number);
}

TEST_F(PythonLexerTest, StringPrefixes) {
    auto tokens = tokenize("r'a\\nb' b\"bytes\" u'text' Rb'\\d' f\"{x}\"");
    ASSERT_GE(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].text, "a\\nb");
    EXPECT_EQ(tokens[1].text, "bytes");
    EXPECT_EQ(tokens[2].text, "text");
    EXPECT_EQ(tokens[3].text, "\\d");
    EXPECT_EQ(tokens[4].kind, TokenKind::String);
    EXPECT_TRUE(tokens[4].fstring);
    EXPECT_FALSE(tokens[0].fstring);
}

TEST_F(PythonLexerTest, PrefixWordIsStillAName) {
    auto tokens = tokenize("rb = f(b)");
    EXPECT_TRUE(tokens[0].is_name("rb"));
    EXPECT_TRUE(tokens[2].is_name("f"));
    EXPECT_TRUE(tokens[4].is_name("b"));
}

TEST_F(PythonLexerTest, Escapes) {
    auto tokens = tokenize("'tab\\there' '\\x41\\'q'");
    EXPECT_EQ(tokens[0].text, "tab\there");
    EXPECT_EQ(tokens[1].text, "A'q");
}

TEST_F(PythonLexerTest, TripleQuotedStringSpansLines) {
    auto tokens = tokenize("doc = \"\"\"first\nsecond \" quote\"\"\"\nvalue = 1\n");
    ASSERT_GE(tokens.size(), 4u);
    EXPECT_EQ(tokens[2].text, "first\nsecond \" quote");
    EXPECT_TRUE(tokens[4].is_name("value"));
    EXPECT_EQ(tokens[4].line, 3u);
}

TEST_F(PythonLexerTest, BracketsJoinLines) {
    auto tokens = tokenize("call(a,\n     b)\nnext_line\n");
    int newlines = 0;
    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::Newline)
            ++newlines;
    }
    EXPECT_EQ(newlines, 2);
}

TEST_F(PythonLexerTest, BackslashContinuation) {
    auto tokens = tokenize("total = first + \\\n    second\n");
    int newlines = 0;
    for (const auto& tok : tokens) {
        if (tok.kind == TokenKind::Newline)
            ++newlines;
    }
    EXPECT_EQ(newlines, 1);
}

TEST_F(PythonLexerTest, IndentOfLogicalLines) {
    auto tokens = tokenize("if x:\n    y()\n\tz()\n");
    EXPECT_TRUE(tokens[0].line_start);
    EXPECT_EQ(tokens[0].indent, 0u);
    // y
    EXPECT_TRUE(tokens[4].line_start);
    EXPECT_EQ(tokens[4].indent, 4u);
    // z（タブは8桁単位）
    EXPECT_TRUE(tokens[8].line_start);
    EXPECT_EQ(tokens[8].indent, 8u);
}

TEST(PythonLexerErrorTest, UnterminatedString) {
    Lexer lexer("ok = 1\nbad = 'oops\n");
    lexer.tokenize();
    EXPECT_TRUE(lexer.has_error());
    EXPECT_EQ(lexer.error_line(), 2u);
}

TEST(PythonLexerErrorTest, UnterminatedTripleQuotedString) {
    Lexer lexer("doc = '''never closed\n\n");
    lexer.tokenize();
    EXPECT_TRUE(lexer.has_error());
    EXPECT_EQ(lexer.error_line(), 1u);
}

// ============================================================
// ソースユニット
// ============================================================
class SourceUnitTest : public ::testing::Test {
   protected:
    std::unique_ptr<SourceUnit> parse(const std::string& source) {
        SourceError error;
        auto unit = SourceUnit::parse("app", source, &error);
        EXPECT_NE(unit, nullptr) << error.message;
        return unit;
    }

    IdentifierSet collect(const std::string& source) {
        auto unit = parse(source);
        IdentifierSet ids;
        if (unit)
            harvest::collect_identifiers(*unit, ids);
        return ids;
    }

    static bool contains(const std::vector<std::string>& v, const std::string& s) {
        return std::find(v.begin(), v.end(), s) != v.end();
    }
};

TEST_F(SourceUnitTest, ClassAndFunctionBodiesAreNestedUnits) {
    const std::string source = R"(import sys

class MainWindow(QMainWindow):
    def __init__(self):
        self.setWindowTitle("Main Title")
        getattr(self, "resizeEvent")

    def other(self): return self.close()

window = MainWindow()
)";
    auto unit = parse(source);
    ASSERT_NE(unit, nullptr);

    // モジュール: ヘッダ（クラス名、基底）と本体の外の行
    EXPECT_TRUE(contains(unit->referenced_names(), "sys"));
    EXPECT_TRUE(contains(unit->referenced_names(), "QMainWindow"));
    EXPECT_TRUE(contains(unit->referenced_names(), "window"));
    EXPECT_FALSE(contains(unit->referenced_names(), "setWindowTitle"));

    ASSERT_EQ(unit->children().size(), 1u);
    const SourceUnit& cls = *unit->children()[0];
    EXPECT_EQ(cls.name(), "MainWindow");
    ASSERT_EQ(cls.children().size(), 2u);

    const SourceUnit& init = *cls.children()[0];
    EXPECT_EQ(init.name(), "__init__");
    EXPECT_TRUE(contains(init.referenced_names(), "setWindowTitle"));
    EXPECT_TRUE(contains(init.string_constants(), "resizeEvent"));
    EXPECT_TRUE(contains(init.string_constants(), "Main Title"));

    // 一行の本体は ':' の後ろが内側
    const SourceUnit& other = *cls.children()[1];
    EXPECT_EQ(other.name(), "other");
    EXPECT_TRUE(contains(other.referenced_names(), "close"));
}

TEST_F(SourceUnitTest, CollectsNamesAndIdentifierConstants) {
    auto ids = collect(R"(
class MainWindow(QMainWindow):
    def __init__(self):
        self.setWindowTitle("Main Title")
        getattr(self, "resizeEvent")
)");
    EXPECT_TRUE(ids.count("QMainWindow"));
    EXPECT_TRUE(ids.count("setWindowTitle"));
    EXPECT_TRUE(ids.count("resizeEvent"));
    EXPECT_TRUE(ids.count("self"));
    EXPECT_FALSE(ids.count("Main Title"));
    // 予約語は名前ではない
    EXPECT_FALSE(ids.count("class"));
    EXPECT_FALSE(ids.count("def"));
}

TEST_F(SourceUnitTest, AdjacentStringsAreConcatenated) {
    auto ids = collect("getattr(widget, \"set\" 'Text')(value)\n");
    EXPECT_TRUE(ids.count("setText"));
    EXPECT_FALSE(ids.count("set"));
    EXPECT_FALSE(ids.count("Text"));
}

TEST_F(SourceUnitTest, FStringFieldsAreScannedForNames) {
    auto ids = collect("label = f\"{widget.width()} px and {{literal}}\"\n");
    EXPECT_TRUE(ids.count("widget"));
    EXPECT_TRUE(ids.count("width"));
    EXPECT_FALSE(ids.count("literal"));
}

TEST_F(SourceUnitTest, LambdasAndComprehensionsStayInEnclosingUnit) {
    auto unit = parse(R"(
texts = [item.text() for item in items]
key = lambda w: w.objectName()
)");
    ASSERT_NE(unit, nullptr);
    EXPECT_TRUE(unit->children().empty());
    EXPECT_TRUE(contains(unit->referenced_names(), "text"));
    EXPECT_TRUE(contains(unit->referenced_names(), "objectName"));
}

TEST_F(SourceUnitTest, DecoratorsAndAsyncDefinitions) {
    auto unit = parse(R"(
@Slot(QModelIndex)
async def on_clicked(index):
    await index.data()

after = True
)");
    ASSERT_NE(unit, nullptr);
    EXPECT_TRUE(contains(unit->referenced_names(), "Slot"));
    EXPECT_TRUE(contains(unit->referenced_names(), "QModelIndex"));
    EXPECT_TRUE(contains(unit->referenced_names(), "after"));
    ASSERT_EQ(unit->children().size(), 1u);
    EXPECT_EQ(unit->children()[0]->name(), "on_clicked");
    EXPECT_TRUE(contains(unit->children()[0]->referenced_names(), "data"));
}

TEST_F(SourceUnitTest, DefaultArgumentsBelongToOuterUnit) {
    auto unit = parse(R"(
def build(parent=QWidget.default_parent()):
    return parent.layout()
)");
    ASSERT_NE(unit, nullptr);
    EXPECT_TRUE(contains(unit->referenced_names(), "default_parent"));
    ASSERT_EQ(unit->children().size(), 1u);
    EXPECT_TRUE(contains(unit->children()[0]->referenced_names(), "layout"));
    EXPECT_FALSE(contains(unit->children()[0]->referenced_names(), "default_parent"));
}

TEST_F(SourceUnitTest, DedentReturnsToOuterBlock) {
    auto unit = parse(R"(
class A:
    def f(self):
        inner_call()
    attr = outer_in_class()
top_level()
)");
    ASSERT_NE(unit, nullptr);
    EXPECT_TRUE(contains(unit->referenced_names(), "top_level"));
    const SourceUnit& cls = *unit->children()[0];
    EXPECT_TRUE(contains(cls.referenced_names(), "outer_in_class"));
    EXPECT_TRUE(contains(cls.children()[0]->referenced_names(), "inner_call"));
}

TEST(SourceUnitErrorTest, LexErrorReturnsNull) {
    SourceError error;
    auto unit = SourceUnit::parse("broken", "x = 1\ny = 'oops\n", &error);
    EXPECT_EQ(unit, nullptr);
    EXPECT_EQ(error.line, 2u);
    EXPECT_FALSE(error.message.empty());
}

TEST(SourceUnitKeywordTest, Keywords) {
    EXPECT_TRUE(is_keyword("lambda"));
    EXPECT_TRUE(is_keyword("None"));
    EXPECT_FALSE(is_keyword("self"));
    EXPECT_FALSE(is_keyword("print"));
}
