#include <gtest/gtest.h>

#include "io/image_loader.hpp"
#include "io/image_saver.hpp"
#include "util/errors.hpp"
#include "scratch_dir.hpp"

#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace satish;
using satish_test::bytes_of;

TEST(PnmTest, DecodesBinaryPpm) {
    std::string data = "P6\n# comment\n2 1\n255\n";
    data += std::string("\x01\x02\x03\xFA\xFB\xFC", 6);
    const RgbImage im = decode_pnm(bytes_of(data));
    EXPECT_EQ(im.width, 2);
    EXPECT_EQ(im.height, 1);
    EXPECT_EQ(im.pixels, (std::vector<uint8_t>{0x01, 0x02, 0x03, 0xFA, 0xFB, 0xFC}));
}

TEST(PnmTest, GreyIsReplicatedToRgb) {
    std::string data = "P5 2 1 255\n";
    data += std::string("\x10\x80", 2);
    const RgbImage im = decode_pnm(bytes_of(data));
    EXPECT_EQ(im.pixels, (std::vector<uint8_t>{0x10, 0x10, 0x10, 0x80, 0x80, 0x80}));
}

TEST(PnmTest, SixteenBitIsScaledToEightBit) {
    std::string data = "P5\n2 1\n65535\n";
    data += std::string("\xFF\xFF\x00\x00", 4);
    const RgbImage im = decode_pnm(bytes_of(data));
    EXPECT_EQ(im.pixels, (std::vector<uint8_t>{255, 255, 255, 0, 0, 0}));
}

TEST(PnmTest, RejectsMalformedInput) {
    EXPECT_THROW(decode_pnm(bytes_of("P3\n1 1\n255\n1 2 3")), SatishError);
    EXPECT_THROW(decode_pnm(bytes_of("P6\n0 1\n255\n")), SatishError);
    EXPECT_THROW(decode_pnm(bytes_of("P6\n2 2\n255\nabc")), SatishError);
    EXPECT_THROW(decode_pnm(bytes_of("P6\n1 1\n")), SatishError);
}

TEST(DicomPixelDataTest, TruncatedPixelDataIsRejected) {
    // 1000x1000 grey image declared, 16 samples present
    try {
        check_pixel_data_length(16, 1000 * 1000, 1, "load_dicom (scan.dcm)");
        FAIL() << "expected SatishError";
    } catch (const SatishError& e) {
        EXPECT_NE(std::string(e.what()).find("PixelData shorter than Rows*Columns*SamplesPerPixel"),
                  std::string::npos);
    }
    EXPECT_THROW(check_pixel_data_length(11, 4, 3, "rgb"), SatishError);
    EXPECT_NO_THROW(check_pixel_data_length(12, 4, 3, "rgb"));
    EXPECT_NO_THROW(check_pixel_data_length(17, 16, 1, "grey"));
}

TEST(PpmWriterTest, EncodesHeaderAndPixels) {
    RgbImage im;
    im.width = 1;
    im.height = 1;
    im.pixels = {1, 2, 3};
    std::string expected = "P6\n1 1\n255\n";
    expected += std::string("\x01\x02\x03", 3);
    EXPECT_EQ(encode_ppm(im), bytes_of(expected));

    im.pixels.push_back(4);
    EXPECT_THROW(encode_ppm(im), SatishError);
}

class ImageFileTest : public satish_test::ScratchDirTest {};

TEST_F(ImageFileTest, SaveThenLoadPpm) {
    RgbImage im;
    im.width = 3;
    im.height = 2;
    for (int i = 0; i < 18; ++i) im.pixels.push_back(static_cast<uint8_t>(i * 14));
    const fs::path p = path("nested/img.ppm");
    save_ppm(p, im);
    const RgbImage back = load_source_image(p);
    EXPECT_EQ(back.width, 3);
    EXPECT_EQ(back.height, 2);
    EXPECT_EQ(back.pixels, im.pixels);
}

TEST_F(ImageFileTest, MissingSourceIsAFileError) {
    EXPECT_THROW(load_source_image(path("none.ppm")), FileOperationError);
    EXPECT_THROW(load_source_image(path("none.dcm")), FileOperationError);
}

TEST_F(ImageFileTest, UnknownContentIsRejected) {
    EXPECT_THROW(load_source_image(touch("junk.bin", "definitely not an image")), SatishError);
}
