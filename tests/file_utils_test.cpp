#include "file_utils.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

namespace fs = std::filesystem;
using namespace cbzxl;

TEST(NaturalLessTest, OrdersEmbeddedNumbersByValue) {
    std::vector<std::string> names = {"page10.jpg", "page2.jpg", "page1.jpg", "page02b.jpg"};
    std::sort(names.begin(), names.end(), natural_less);
    EXPECT_EQ(names, (std::vector<std::string>{"page1.jpg", "page2.jpg", "page02b.jpg", "page10.jpg"}));
}

TEST(NaturalLessTest, IsStrictWeakOrderingOnLeadingZeros) {
    EXPECT_FALSE(natural_less("a01", "a01"));
    EXPECT_NE(natural_less("a01", "a1"), natural_less("a1", "a01"));
}

TEST(MakeUniqueNameTest, ReturnsNameWhenFree) {
    const auto name = make_unique_name("001.jpg", [](const std::string&) { return false; });
    EXPECT_EQ(name, "001.jpg");
}

TEST(MakeUniqueNameTest, AppendsSmallestFreeSuffixBeforeExtension) {
    const std::set<std::string> taken = {"001.jpg", "001_1.jpg", "001_2.jpg"};
    const auto name = make_unique_name("001.jpg", [&](const std::string& n) { return taken.contains(n); });
    EXPECT_EQ(name, "001_3.jpg");
}

TEST(MetadataMarkerTest, RecognizesPlatformFiles) {
    EXPECT_TRUE(is_metadata_marker(".DS_Store"));
    EXPECT_TRUE(is_metadata_marker("dir/Thumbs.db"));
    EXPECT_TRUE(is_metadata_marker("desktop.ini"));
    EXPECT_TRUE(is_metadata_marker("._001.jpg"));
    EXPECT_FALSE(is_metadata_marker("001.jpg"));
}

TEST(FormatBytesTest, KeepsSignAndUnit) {
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.50 KB");
    EXPECT_EQ(format_bytes(-2 * 1024 * 1024), "-2.00 MB");
}

TEST(RelativeKeyTest, UsesForwardSlashes) {
    EXPECT_EQ(relative_key("/data/comics", "/data/comics/series/vol1.cbz"), "series/vol1.cbz");
}

TEST(TempDirTest, CreatesAndCleansUp) {
    const fs::path dir = make_temp_dir_for("/somewhere/book.cbz", "tree");
    ASSERT_FALSE(dir.empty());
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_NE(dir.filename().string().find("book"), std::string::npos);
    test::write_file(dir / "a" / "b.txt", "x");
    cleanup_temp_dir(dir);
    EXPECT_FALSE(fs::exists(dir));
}
