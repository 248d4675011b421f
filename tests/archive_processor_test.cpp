#include "archive_processor.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace cbzxl;
using namespace cbzxl::test;

TEST(ArchiveProcessorTest, ZipRoundTripKeepsContentAndNaturalOrder) {
    TempDir work;
    const fs::path src = work / "src";
    write_file(src / "page10.jpg", jpeg_bytes(300));
    write_file(src / "page2.jpg", jpeg_bytes(200));
    write_file(src / "sub" / "page1.png", png_bytes(100));

    const fs::path zip = work / "book.cbz";
    ArchiveProcessor::write_zip(src, zip);

    EXPECT_EQ(ArchiveProcessor::list_entries(zip),
              (std::vector<std::string>{"page2.jpg", "page10.jpg", "sub/page1.png"}));

    const fs::path out = work / "out";
    fs::create_directories(out);
    ArchiveProcessor::extract(zip, out);
    EXPECT_EQ(list_tree(out), list_tree(src));
    EXPECT_EQ(read_file(out / "page10.jpg"), jpeg_bytes(300));
    EXPECT_EQ(read_file(out / "sub" / "page1.png"), png_bytes(100));
}

TEST(ArchiveProcessorTest, CorruptArchiveThrows) {
    TempDir work;
    write_file(work / "bad.cbz", "this is not a zip file at all");
    fs::create_directories(work / "out");
    EXPECT_THROW(ArchiveProcessor::extract(work / "bad.cbz", work / "out"), ArchiveError);
}

TEST(ArchiveProcessorTest, MissingArchiveThrows) {
    TempDir work;
    EXPECT_THROW(ArchiveProcessor::extract(work / "none.cbz", work.path()), ArchiveError);
}

TEST(ArchiveProcessorTest, RepackReplacesOriginalAndLeavesNoTemporary) {
    TempDir work;
    write_file(work / "v1" / "001.jpg", jpeg_bytes(100));
    const fs::path archive = work / "lib" / "book.cbz";
    fs::create_directories(archive.parent_path());
    ArchiveProcessor::write_zip(work / "v1", archive);

    write_file(work / "v2" / "001.jxl", jxl_bytes(50));
    ArchiveProcessor::repack(work / "v2", archive, false);

    EXPECT_EQ(ArchiveProcessor::list_entries(archive), std::vector<std::string>{"001.jxl"});
    EXPECT_EQ(list_tree(archive.parent_path()), std::vector<std::string>{"book.cbz"});
}

TEST(ArchiveProcessorTest, RepackWithBackupKeepsOldArchive) {
    TempDir work;
    write_file(work / "v1" / "001.jpg", jpeg_bytes(100));
    const fs::path archive = work / "book.cbz";
    ArchiveProcessor::write_zip(work / "v1", archive);
    const std::string before = read_file(archive);

    write_file(work / "v2" / "001.jxl", jxl_bytes(50));
    ArchiveProcessor::repack(work / "v2", archive, true);

    EXPECT_EQ(read_file(work / "book.cbz.bak"), before);
    EXPECT_EQ(ArchiveProcessor::list_entries(archive), std::vector<std::string>{"001.jxl"});
}
