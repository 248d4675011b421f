#include "jxl_encoder.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace cbzxl;
using namespace cbzxl::test;

class JxlEncoderTest : public ::testing::Test {
protected:
    ImageMember member(const std::string& name, const std::string& body, const ImageKind kind) {
        const fs::path p = dir / name;
        write_file(p, body);
        ImageMember m;
        m.path = p;
        m.kind = kind;
        m.category = category_of(kind);
        m.size_before = body.size();
        return m;
    }

    TempDir dir;
    FakeMimeDetector detector;
    FakeImageTools tools;
};

TEST_F(JxlEncoderTest, ReplacesSourceAndReportsDelta) {
    tools.ratio = 0.4;
    const auto m = member("001.jpg", jpeg_bytes(1000), ImageKind::Jpeg);
    const JxlEncoder encoder(tools, detector, 7);

    const auto r = encoder.convert(m, dir / "001.jxl");

    EXPECT_TRUE(r.converted);
    EXPECT_EQ(r.original_size, 1000u);
    EXPECT_EQ(r.encoded_size, 400u);
    EXPECT_EQ(r.bytes_saved, 600);
    EXPECT_FALSE(fs::exists(dir / "001.jpg"));
    EXPECT_TRUE(fs::exists(dir / "001.jxl"));
    EXPECT_EQ(tools.efforts_seen(), std::vector<int>{7});
}

TEST_F(JxlEncoderTest, KeepsOriginalWhenNotSmaller) {
    tools.ratio = 1.2;
    const auto m = member("001.png", png_bytes(1000), ImageKind::Png);
    const JxlEncoder encoder(tools, detector, 8);

    const auto r = encoder.convert(m, dir / "001.jxl");

    EXPECT_FALSE(r.converted);
    EXPECT_EQ(r.bytes_saved, 0);
    EXPECT_TRUE(r.error.empty());
    EXPECT_TRUE(fs::exists(dir / "001.png"));
    EXPECT_FALSE(fs::exists(dir / "001.jxl"));
}

TEST_F(JxlEncoderTest, RetriesOnceWithoutReconstructionData) {
    tools.reconstruction_error_names = {"001.jpg"};
    const auto m = member("001.jpg", jpeg_bytes(1000), ImageKind::Jpeg);
    const JxlEncoder encoder(tools, detector, 8);

    const auto r = encoder.convert(m, dir / "001.jxl");

    EXPECT_TRUE(r.converted);
    EXPECT_EQ(tools.encode_calls.load(), 2);
    EXPECT_EQ(tools.retry_calls.load(), 1);
}

TEST_F(JxlEncoderTest, TimeoutLeavesNoArtifact) {
    tools.timeout_names = {"001.jpg"};
    const auto m = member("001.jpg", jpeg_bytes(1000), ImageKind::Jpeg);
    const JxlEncoder encoder(tools, detector, 8);

    const auto r = encoder.convert(m, dir / "001.jxl");

    EXPECT_FALSE(r.converted);
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.bytes_saved, 0);
    EXPECT_EQ(tools.encode_calls.load(), 1);
    EXPECT_FALSE(fs::exists(dir / "001.jxl"));
    EXPECT_TRUE(fs::exists(dir / "001.jpg"));
}

TEST_F(JxlEncoderTest, FailureKeepsSourceAndRecordsStderr) {
    tools.failing_names = {"001.png"};
    const auto m = member("001.png", png_bytes(1000), ImageKind::Png);
    const JxlEncoder encoder(tools, detector, 8);

    const auto r = encoder.convert(m, dir / "001.jxl");

    EXPECT_FALSE(r.converted);
    EXPECT_EQ(r.error, "JPEG XL encoding failed");
    EXPECT_FALSE(fs::exists(dir / "001.jxl"));
    EXPECT_TRUE(fs::exists(dir / "001.png"));
    EXPECT_EQ(tools.retry_calls.load(), 0);
}

TEST_F(JxlEncoderTest, EmptyOutputIsAFailure) {
    tools.empty_output_names = {"001.jpg"};
    const auto m = member("001.jpg", jpeg_bytes(1000), ImageKind::Jpeg);
    const JxlEncoder encoder(tools, detector, 8);

    const auto r = encoder.convert(m, dir / "001.jxl");

    EXPECT_FALSE(r.converted);
    EXPECT_FALSE(r.error.empty());
    EXPECT_FALSE(fs::exists(dir / "001.jxl"));
}

TEST_F(JxlEncoderTest, RechecksContentBeforeEncoding) {
    // classified as jpeg, but the bytes changed since
    const auto m = member("001.jpg", text_bytes(1000), ImageKind::Jpeg);
    const JxlEncoder encoder(tools, detector, 8);

    const auto r = encoder.convert(m, dir / "001.jxl");

    EXPECT_FALSE(r.converted);
    EXPECT_EQ(tools.encode_calls.load(), 0);
}

TEST_F(JxlEncoderTest, NormalizesColourBeforeEncoding) {
    tools.colorspace = "CMYK";
    const auto m = member("001.jpg", jpeg_bytes(1000), ImageKind::Jpeg);
    const JxlEncoder encoder(tools, detector, 8);

    const auto r = encoder.convert(m, dir / "001.jxl");

    EXPECT_TRUE(r.converted);
    EXPECT_EQ(tools.srgb_calls.load(), 1);
}

TEST(JxlEncoderEstimateTest, UsesFixedFractions) {
    ImageMember jpeg;
    jpeg.path = "a.jpg";
    jpeg.kind = ImageKind::Jpeg;
    jpeg.size_before = 1000;
    ImageMember png;
    png.path = "b.png";
    png.kind = ImageKind::Png;
    png.size_before = 1000;

    EXPECT_EQ(JxlEncoder::estimate(jpeg, "a.jxl").bytes_saved, 200);
    EXPECT_EQ(JxlEncoder::estimate(png, "b.jxl").bytes_saved, 350);
    EXPECT_FALSE(fs::exists("a.jxl"));
}
