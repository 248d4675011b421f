#include "archive_scanner.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace cbzxl;
using namespace cbzxl::test;

TEST(ArchiveScannerTest, FindsArchivesRecursivelyInNaturalOrder) {
    TempDir root;
    write_file(root / "Series" / "vol10.cbz", "x");
    write_file(root / "Series" / "vol2.CBZ", "xy");
    write_file(root / "a.cbz", "xyz");
    write_file(root / "notes.txt", "n");
    write_file(root / "Series" / ".vol2.CBZ.cbzxl-123.tmp", "t");
    write_file(root / "Series" / "vol3.cbz.bak", "b");

    const auto entries = ArchiveScanner::scan(root.path());

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].relative, "Series/vol2.CBZ");
    EXPECT_EQ(entries[1].relative, "Series/vol10.cbz");
    EXPECT_EQ(entries[2].relative, "a.cbz");
    EXPECT_EQ(entries[2].size, 3u);
}

TEST(ArchiveScannerTest, MissingRootIsFatal) {
    TempDir root;
    EXPECT_THROW((void)ArchiveScanner::scan(root / "missing"), std::runtime_error);
}

TEST(ArchiveScannerTest, UnreadableDirectoryDoesNotHideTheRest) {
    TempDir root;
    write_file(root / "a_locked" / "hidden.cbz", "x");
    write_file(root / "b" / "vol1.cbz", "x");
    write_file(root / "z.cbz", "x");
    std::filesystem::permissions(root / "a_locked", std::filesystem::perms::none);

    const auto entries = ArchiveScanner::scan(root.path());
    std::filesystem::permissions(root / "a_locked", std::filesystem::perms::owner_all);

    std::vector<std::string> found;
    for (const auto& e : entries) found.push_back(e.relative);
    // root can still read the locked directory
    std::erase(found, "a_locked/hidden.cbz");
    EXPECT_EQ(found, (std::vector<std::string>{"b/vol1.cbz", "z.cbz"}));
}
