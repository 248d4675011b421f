#include "image_type.hpp"

#include <gtest/gtest.h>

using namespace cbzxl;

TEST(ImageTypeTest, MapsMimeTypes) {
    EXPECT_EQ(kind_from_mime("image/jpeg"), ImageKind::Jpeg);
    EXPECT_EQ(kind_from_mime("image/png"), ImageKind::Png);
    EXPECT_EQ(kind_from_mime("image/jxl"), ImageKind::Jxl);
    EXPECT_EQ(kind_from_mime("image/webp"), ImageKind::Webp);
    EXPECT_EQ(kind_from_mime("text/plain"), ImageKind::Unknown);
    EXPECT_EQ(kind_from_mime(""), ImageKind::Unknown);
}

TEST(ImageTypeTest, EveryKindHasExactlyOneCategory) {
    EXPECT_EQ(category_of(ImageKind::Jpeg), ImageCategory::Convertible);
    EXPECT_EQ(category_of(ImageKind::Png), ImageCategory::Convertible);
    EXPECT_EQ(category_of(ImageKind::Jxl), ImageCategory::Target);
    for (const auto k : {ImageKind::Webp, ImageKind::Avif, ImageKind::Gif, ImageKind::Tiff, ImageKind::Bmp}) {
        EXPECT_EQ(category_of(k), ImageCategory::OtherKnown);
    }
    EXPECT_EQ(category_of(ImageKind::Unknown), ImageCategory::Unrecognized);
}

TEST(ImageTypeTest, ExtensionsAreCaseInsensitive) {
    EXPECT_EQ(kind_from_extension(".JPEG"), ImageKind::Jpeg);
    EXPECT_TRUE(extension_matches(ImageKind::Jpeg, ".JPG"));
    EXPECT_TRUE(extension_matches(ImageKind::Jpeg, ".jpeg"));
    EXPECT_FALSE(extension_matches(ImageKind::Png, ".jpg"));
    EXPECT_EQ(canonical_extension(ImageKind::Png), ".png");
    EXPECT_EQ(canonical_extension(ImageKind::Jxl), ".jxl");
}
