#include "../../src/harvest/zip_archive.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace hatchet::harvest;
using hatchet::test_support::TempDir;
using hatchet::test_support::ZipBuilder;

TEST(ZipArchiveTest, ListsEntriesInDirectoryOrder) {
    std::string data = ZipBuilder()
                           .add("app/", "")
                           .add("app/__init__.py", "")
                           .add("app/main.py", "window.show()\n")
                           .build();
    ZipArchive archive = ZipArchive::from_bytes(data);

    ASSERT_EQ(archive.entries().size(), 3u);
    EXPECT_EQ(archive.entries()[0].name, "app/");
    EXPECT_TRUE(archive.entries()[0].is_directory());
    EXPECT_EQ(archive.entries()[2].name, "app/main.py");
    EXPECT_FALSE(archive.entries()[2].is_directory());
}

TEST(ZipArchiveTest, ReadsStoredEntry) {
    ZipArchive archive = ZipArchive::from_bytes(ZipBuilder().add("a.py", "x.hide()\n").build());
    ASSERT_EQ(archive.entries().size(), 1u);
    EXPECT_EQ(archive.entries()[0].method, 0);
    EXPECT_EQ(archive.read(archive.entries()[0]), "x.hide()\n");
}

TEST(ZipArchiveTest, ReadsDeflatedEntry) {
    std::string content;
    for (int i = 0; i < 200; ++i) {
        content += "self.layout().addWidget(QPushButton('button'))\n";
    }
    ZipArchive archive = ZipArchive::from_bytes(ZipBuilder().add("big.py", content, true).build());
    const ZipEntry& entry = archive.entries()[0];
    EXPECT_EQ(entry.method, 8);
    EXPECT_LT(entry.compressed_size, entry.uncompressed_size);
    EXPECT_EQ(archive.read(entry), content);
}

TEST(ZipArchiveTest, CrcMismatchIsDetected) {
    std::string data = ZipBuilder().add("a.txt", "hello").build();
    size_t pos = data.find("hello");
    ASSERT_NE(pos, std::string::npos);
    data[pos] = 'j';

    ZipArchive archive = ZipArchive::from_bytes(data);
    EXPECT_THROW(archive.read(archive.entries()[0]), ArchiveError);
}

TEST(ZipArchiveTest, RejectsNonZipData) {
    EXPECT_THROW(ZipArchive::from_bytes("this is not a zip archive at all"), ArchiveError);
    EXPECT_THROW(ZipArchive::from_bytes(""), ArchiveError);
}

TEST(ZipArchiveTest, OpensFromFile) {
    TempDir dir;
    auto path = dir.write("bundle.zip", ZipBuilder().add("m.py", "pass\n", true).build());
    ZipArchive archive = ZipArchive::open(path);
    ASSERT_EQ(archive.entries().size(), 1u);
    EXPECT_EQ(archive.read(archive.entries()[0]), "pass\n");

    EXPECT_THROW(ZipArchive::open(dir.path() / "missing.zip"), ArchiveError);
}

// ============================================================
// 宣言されたサイズと実際の展開結果が食い違うアーカイブ
// ============================================================

namespace {

// 最初のセントラルディレクトリエントリの展開後サイズを書き換える
std::string with_declared_size(std::string data, uint32_t size) {
    size_t pos = data.rfind(std::string("PK\x01\x02", 4));
    EXPECT_NE(pos, std::string::npos);
    for (int i = 0; i < 4; ++i) {
        data[pos + 24 + i] = static_cast<char>((size >> (8 * i)) & 0xff);
    }
    return data;
}

std::string deflated_bundle() {
    std::string content;
    for (int i = 0; i < 100; ++i) {
        content += "button.clicked.connect(self.accept)\n";
    }
    return ZipBuilder().add("dialog.py", content, true).build();
}

}  // namespace

TEST(ZipArchiveTest, HugeDeclaredSizeIsRejectedWithoutAllocating) {
    ZipArchive archive = ZipArchive::from_bytes(with_declared_size(deflated_bundle(), 0xfffffff0u));
    const ZipEntry& entry = archive.entries()[0];
    EXPECT_EQ(entry.uncompressed_size, 0xfffffff0u);

    EXPECT_THROW(archive.read(entry), ArchiveError);
}

TEST(ZipArchiveTest, StreamLongerThanDeclaredSizeIsRejected) {
    ZipArchive archive = ZipArchive::from_bytes(with_declared_size(deflated_bundle(), 10));

    EXPECT_THROW(archive.read(archive.entries()[0]), ArchiveError);
}

TEST(ZipArchiveTest, EmptyDeflatedEntry) {
    ZipArchive archive = ZipArchive::from_bytes(ZipBuilder().add("empty.py", "", true).build());

    EXPECT_EQ(archive.read(archive.entries()[0]), "");
}
