#include "../../src/catalog/qt_doc_catalog.hpp"
#include "../../src/common/error.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace hatchet;
using namespace hatchet::catalog;
using hatchet::test_support::TempDir;

// ============================================================
// テストヘルパー（Qtリファレンスの小さなミラー）
// ============================================================
class QtDocCatalogTest : public ::testing::Test {
   protected:
    void SetUp() override {
        dir.write("classes.html", R"(<html><body>
<dl>
<dd><a href="qobject.html">QObject</a></dd>
<dd><a href="qwidget.html">QWidget</a> (<a href="qtgui.html">QtGui</a>)</dd>
<dd><a href="qlayout.html">QLayout</a></dd>
<dd><a href="qabstractitemmodel.html">QAbstractItemModel</a></dd>
</dl>
<p><a href="qnotlisted.html">QNotListed</a></p>
</body></html>
)");

        dir.write("qobject.html", R"(<html>
<p>Inherited by <a href="qwidget.html">QWidget</a> and <a href="qlayout.html">QLayout</a>.</p>
</html>
)");
        dir.write("qobject-members.html", R"(<ul>
<li class="fn">QString <b><a href="qobject.html#objectName-prop">objectName</a></b> () const</li>
<li class="fn">void <b><a href="qobject.html#setParent">setParent</a></b> ( QObject * <i>parent</i> )</li>
</ul>
)");

        dir.write("qwidget.html", R"(<html>
<p>Inherits <a href="qobject.html">QObject</a> and <a href="qpaintdevice.html">QPaintDevice</a>.</p>
</html>
)");
        dir.write("qwidget-members.html", R"(<ul>
<li class="fn">void <b><a href="qwidget.html#setLayout">setLayout</a></b> ( <a href="qlayout.html">QLayout</a> * <i>layout</i> )</li>
<li class="fn">void <b><a href="qwidget.html#resize">resize</a></b> ( int <i>w</i>, int <i>h</i> )</li>
<li class="fn">void <b><a href="qwidget.html#resize-2">resize</a></b> ( const QSize &amp; <i>size</i> )</li>
<li class="fn">void <b><a href="qwidget.html#setFont">setFont</a></b> ( const QFont &amp; <i>font</i>, Qt::FocusPolicy <i>p</i> )</li>
<li>void <b><a href="qwidget.html#notAFunction">notAFunction</a></b> ()</li>
</ul>
)");

        dir.write("qlayout.html", R"(<html>
<p>Inherits <a href="qobject.html">QObject</a>.</p>
<table>
<tr><td class="memItemLeft rightAlign">virtual int </td><td class="memItemRight"><b><a href="qlayout.html#count">count</a></b> () const = 0</td></tr>
<tr><td class="memItemLeft rightAlign">virtual void </td><td class="memItemRight"><b><a href="qlayout.html#addItem">addItem</a></b> ( QLayoutItem * <i>item</i> ) = 0</td></tr>
<tr><td class="memItemLeft rightAlign">void </td><td class="memItemRight"><b><a href="qlayout.html#update">update</a></b> ()</td></tr>
</table>
</html>
)");
        dir.write("qlayout-members.html", R"(<ul>
<li class="fn">int <b><a href="qlayout.html#count">count</a></b> () const</li>
</ul>
)");

        dir.write("qabstractitemmodel.html", "<html></html>\n");
        dir.write("qabstractitemmodel-members.html", R"(<ul>
<li class="fn">int <b><a href="qabstractitemmodel.html#rowCount">rowCount</a></b> ( const QModelIndex &amp; <i>parent</i> ) const</li>
</ul>
)");
    }

    TempDir dir;
};

TEST_F(QtDocCatalogTest, ListsClassesFromIndexPlusSyntheticTypes) {
    QtDocCatalog catalog(dir.path());

    EXPECT_EQ(catalog.type_names(),
              (std::vector<std::string>{"QTextStreamManipulator", "QScriptExtensionInterface",
                                        "QObject", "QWidget", "QLayout", "QAbstractItemModel"}));
}

TEST_F(QtDocCatalogTest, MissingIndexIsCatalogError) {
    TempDir empty;
    QtDocCatalog catalog(empty.path());

    EXPECT_THROW(catalog.type_names(), CatalogError);
}

TEST_F(QtDocCatalogTest, HasTypeChecksMembersPage) {
    QtDocCatalog catalog(dir.path());

    EXPECT_TRUE(catalog.has_type("QWidget"));
    EXPECT_TRUE(catalog.has_type("QTextStreamManipulator"));
    EXPECT_FALSE(catalog.has_type("QPaintDevice"));
    EXPECT_FALSE(catalog.has_type("QModelIndexList"));
}

TEST_F(QtDocCatalogTest, InheritanceLinks) {
    QtDocCatalog catalog(dir.path());

    EXPECT_EQ(catalog.direct_bases("QWidget"),
              (std::vector<std::string>{"QObject", "QPaintDevice"}));
    EXPECT_EQ(catalog.direct_derived("QObject"),
              (std::vector<std::string>{"QWidget", "QLayout"}));
    EXPECT_TRUE(catalog.direct_bases("QObject").empty());
    // ページがない型は否定の回答
    EXPECT_TRUE(catalog.direct_bases("QPaintDevice").empty());
}

TEST_F(QtDocCatalogTest, MemberNamesFromFunctionItems) {
    QtDocCatalog catalog(dir.path());

    EXPECT_EQ(catalog.member_names("QWidget"),
              (std::vector<std::string>{"setLayout", "resize", "resize", "setFont"}));
    EXPECT_EQ(catalog.member_names("QObject"),
              (std::vector<std::string>{"objectName", "setParent"}));
}

TEST_F(QtDocCatalogTest, UndocumentedMembersAreAdded) {
    QtDocCatalog catalog(dir.path());

    EXPECT_EQ(catalog.member_names("QAbstractItemModel"),
              (std::vector<std::string>{"decodeData", "encodeData", "rowCount"}));
    EXPECT_EQ(catalog.signature_type_names("QAbstractItemModel", "decodeData"),
              (std::vector<std::string>{"QModelIndexList", "QDataStream"}));
    // 他のメンバーはページから読む
    EXPECT_EQ(catalog.signature_type_names("QAbstractItemModel", "rowCount"),
              (std::vector<std::string>{"QModelIndex"}));

    EXPECT_EQ(catalog.member_names("QScriptExtensionInterface"),
              (std::vector<std::string>{"initialize"}));
    EXPECT_EQ(catalog.signature_type_names("QScriptExtensionInterface", "initialize"),
              (std::vector<std::string>{"QScriptEngine"}));
    EXPECT_TRUE(catalog.member_names("QTextStreamManipulator").empty());
}

TEST_F(QtDocCatalogTest, SignatureTypesIgnoreMarkup) {
    QtDocCatalog catalog(dir.path());

    EXPECT_EQ(catalog.signature_type_names("QWidget", "setLayout"),
              (std::vector<std::string>{"QLayout"}));
    // オーバーロードはまとめる
    EXPECT_EQ(catalog.signature_type_names("QWidget", "resize"),
              (std::vector<std::string>{"QSize"}));
    EXPECT_EQ(catalog.signature_type_names("QWidget", "setFont"),
              (std::vector<std::string>{"QFont", "Qt"}));
    EXPECT_TRUE(catalog.signature_type_names("QWidget", "missing").empty());
}

TEST_F(QtDocCatalogTest, PureVirtualFromMemberTable) {
    QtDocCatalog catalog(dir.path());

    EXPECT_TRUE(catalog.is_pure_virtual("QLayout", "count"));
    EXPECT_TRUE(catalog.is_pure_virtual("QLayout", "addItem"));
    EXPECT_FALSE(catalog.is_pure_virtual("QLayout", "update"));
    EXPECT_FALSE(catalog.is_pure_virtual("QWidget", "setLayout"));
}

TEST_F(QtDocCatalogTest, PagesAreReadOnce) {
    QtDocCatalog catalog(dir.path());

    catalog.member_names("QWidget");
    catalog.signature_type_names("QWidget", "setLayout");
    catalog.signature_type_names("QWidget", "resize");
    catalog.has_type("QWidget");
    EXPECT_EQ(catalog.pages_read(), 1u);

    catalog.direct_bases("QWidget");
    catalog.is_pure_virtual("QWidget", "resize");
    EXPECT_EQ(catalog.pages_read(), 2u);
}

TEST_F(QtDocCatalogTest, AnchorsWithSuffixesStillNameTheMember) {
    dir.write("qaction-members.html", R"(<ul>
<li class="fn">void <b><a href="qaction.html#setShortcut-2">setShortcut</a></b> ( QKeySequence::StandardKey <i>key</i> )</li>
<li class="fn">QString <b><a href="qaction.html#text-prop">text</a></b> () const</li>
<li class="fn">void <b><a href="qaction.html#toggled.signal">toggled</a></b> ( bool <i>checked</i> )</li>
<li class="fn">void <b><a href="qaction.html#other">mismatched</a></b> ()</li>
</ul>
)");
    QtDocCatalog catalog(dir.path());

    EXPECT_EQ(catalog.member_names("QAction"),
              (std::vector<std::string>{"setShortcut", "text", "toggled"}));
    EXPECT_EQ(catalog.signature_type_names("QAction", "setShortcut"),
              (std::vector<std::string>{"QKeySequence"}));
}
