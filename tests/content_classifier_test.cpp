#include "content_classifier.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace cbzxl;
using namespace cbzxl::test;

class ContentClassifierTest : public ::testing::Test {
protected:
    TempDir tree;
    FakeMimeDetector detector;
};

TEST(DominantTypeTest, FollowsCounts) {
    EXPECT_EQ(ContentClassifier::dominant_type(3, 1), "JPG");
    EXPECT_EQ(ContentClassifier::dominant_type(1, 3), "PNG");
    EXPECT_EQ(ContentClassifier::dominant_type(2, 2), "Mixed");
    EXPECT_EQ(ContentClassifier::dominant_type(0, 0), "N/A");
}

TEST_F(ContentClassifierTest, EveryMemberLandsInExactlyOneBucket) {
    write_file(tree / "001.jpg", jpeg_bytes(100));
    write_file(tree / "002.jpg", jpeg_bytes(100));
    write_file(tree / "003.png", png_bytes(100));
    write_file(tree / "004.jxl", jxl_bytes(100));
    write_file(tree / "005.webp", webp_bytes(100));
    write_file(tree / "ComicInfo.xml", text_bytes(50));
    write_file(tree / ".DS_Store", text_bytes(10));

    const ContentClassifier classifier(detector, false);
    const auto c = classifier.classify(tree.path());

    ASSERT_EQ(c.members.size(), 6u);
    EXPECT_EQ(c.jpg_count, 2u);
    EXPECT_EQ(c.png_count, 1u);
    EXPECT_EQ(c.target_count, 1u);
    EXPECT_EQ(c.other_count, 1u);
    EXPECT_EQ(c.unrecognized_count, 1u);
    EXPECT_EQ(c.jpg_count + c.png_count + c.target_count + c.other_count + c.unrecognized_count,
              c.members.size());
    EXPECT_EQ(c.image_count(), 5u);
    EXPECT_EQ(c.dominant_type, "JPG");
    EXPECT_TRUE(std::holds_alternative<HasConvertibles>(c.decision));
}

TEST_F(ContentClassifierTest, CorrectsMismatchedExtensions) {
    write_file(tree / "001.png", jpeg_bytes(100));
    write_file(tree / "001.jpg", jpeg_bytes(80));

    const ContentClassifier classifier(detector, false);
    const auto c = classifier.classify(tree.path());

    EXPECT_EQ(c.renamed_count, 1u);
    EXPECT_EQ(c.jpg_count, 2u);
    // "001.jpg" is taken, so the renamed member gets a suffix
    EXPECT_EQ(list_tree(tree.path()), (std::vector<std::string>{"001.jpg", "001_1.jpg"}));
    EXPECT_EQ(read_file(tree / "001_1.jpg").size(), 100u);
}

TEST_F(ContentClassifierTest, DryRunOnlyPlansRenames) {
    write_file(tree / "001.png", jpeg_bytes(100));

    const ContentClassifier classifier(detector, true);
    const auto c = classifier.classify(tree.path());

    EXPECT_EQ(c.renamed_count, 1u);
    EXPECT_TRUE(fs::exists(tree / "001.png"));
    EXPECT_FALSE(fs::exists(tree / "001.jpg"));
}

TEST_F(ContentClassifierTest, OnlyTargetFormatNeedsNothing) {
    write_file(tree / "001.jxl", jxl_bytes(100));
    write_file(tree / "002.jxl", jxl_bytes(100));

    const auto c = ContentClassifier(detector, false).classify(tree.path());
    EXPECT_TRUE(std::holds_alternative<outcome::AlreadyTargetFormat>(c.decision));
    EXPECT_EQ(c.dominant_type, "N/A");
}

TEST_F(ContentClassifierTest, FallsBackToJxlSignature) {
    detector.jxl_as_octet_stream = true;
    write_file(tree / "001.jxl", jxl_bytes(100));

    const auto c = ContentClassifier(detector, false).classify(tree.path());
    EXPECT_EQ(c.target_count, 1u);
    EXPECT_TRUE(std::holds_alternative<outcome::AlreadyTargetFormat>(c.decision));
}

TEST_F(ContentClassifierTest, OtherFormatsRecordMajorityExtension) {
    write_file(tree / "001.webp", webp_bytes(100));
    write_file(tree / "002.webp", webp_bytes(100));
    write_file(tree / "003.gif", gif_bytes(100));
    write_file(tree / "004.jxl", jxl_bytes(100));

    const auto c = ContentClassifier(detector, false).classify(tree.path());
    const auto* other = std::get_if<outcome::OtherFormatsOnly>(&c.decision);
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(other->majority_extension, ".webp");
}

TEST_F(ContentClassifierTest, NothingRecognized) {
    write_file(tree / "readme.txt", text_bytes(100));

    const auto c = ContentClassifier(detector, false).classify(tree.path());
    EXPECT_TRUE(std::holds_alternative<outcome::NoImagesRecognized>(c.decision));
    EXPECT_EQ(c.image_count(), 0u);
}

TEST_F(ContentClassifierTest, MembersAreInNaturalOrder) {
    write_file(tree / "page10.jpg", jpeg_bytes(10));
    write_file(tree / "page2.jpg", jpeg_bytes(10));
    write_file(tree / "page1.jpg", jpeg_bytes(10));

    const auto c = ContentClassifier(detector, false).classify(tree.path());
    ASSERT_EQ(c.members.size(), 3u);
    EXPECT_EQ(c.members[0].path.filename(), "page1.jpg");
    EXPECT_EQ(c.members[1].path.filename(), "page2.jpg");
    EXPECT_EQ(c.members[2].path.filename(), "page10.jpg");
}
