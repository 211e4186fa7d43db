#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "codec/encoder.hpp"
#include "codec/validator.hpp"
#include "format/header_codec.hpp"
#include "io/file_manager.hpp"
#include "util/errors.hpp"
#include "scratch_dir.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace satish;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

namespace {

std::vector<uint8_t> container(int w, int h, int version = 1) {
    std::vector<uint8_t> bytes = pack_header(create_header(w, h, 3, version));
    bytes.resize(bytes.size() + static_cast<size_t>(calculate_pixel_data_size(w, h, 3)), 'a');
    return bytes;
}

} // namespace

class ValidatorTest : public satish_test::ScratchDirTest {};

TEST_F(ValidatorTest, WellFormedFileIsValid) {
    const fs::path p = path("ok.satish");
    write_file_safely(p, container(3, 2));
    const ValidationReport r = validate_satish_file(p);
    EXPECT_TRUE(r.valid);
    EXPECT_THAT(r.errors, IsEmpty());
    EXPECT_THAT(r.warnings, IsEmpty());
    ASSERT_TRUE(r.header.has_value());
    EXPECT_EQ(*r.header, create_header(3, 2));
    EXPECT_EQ(r.file_size, 10u + 36u);
    EXPECT_EQ(r.expected_file_size, r.file_size);
    EXPECT_TRUE(quick_validate(p));
}

TEST_F(ValidatorTest, MissingAndTinyFiles) {
    ValidationReport r = validate_satish_file(path("none.satish"));
    EXPECT_FALSE(r.valid);
    EXPECT_THAT(r.errors, ElementsAre(HasSubstr("does not exist")));

    r = validate_satish_file(root_);
    EXPECT_THAT(r.errors, ElementsAre(HasSubstr("not a file")));

    const fs::path tiny = touch("tiny.satish", "SATI");
    r = validate_satish_file(tiny);
    EXPECT_THAT(r.errors, ElementsAre("file too small: 4 bytes (minimum: 10)"));
    EXPECT_FALSE(quick_validate(tiny));
    EXPECT_FALSE(quick_validate(path("none.satish")));
}

TEST_F(ValidatorTest, WrongExtensionIsOnlyAWarning) {
    const fs::path p = path("ok.bin");
    write_file_safely(p, container(1, 1));
    const ValidationReport r = validate_satish_file(p);
    EXPECT_TRUE(r.valid);
    EXPECT_THAT(r.warnings, ElementsAre(HasSubstr("unexpected file extension")));
}

TEST_F(ValidatorTest, BadHeaderStopsValidation) {
    std::vector<uint8_t> bytes = container(2, 2);
    bytes[8] = 4;   // channels
    const fs::path p = path("bad.satish");
    write_file_safely(p, bytes);
    const ValidationReport r = validate_satish_file(p);
    EXPECT_FALSE(r.valid);
    EXPECT_FALSE(r.header.has_value());
    EXPECT_THAT(r.errors, ElementsAre(HasSubstr("unsupported channels: 4")));
    EXPECT_FALSE(quick_validate(p));
}

TEST_F(ValidatorTest, BadMagicStillProducesAReport) {
    std::vector<uint8_t> bytes = container(2, 2);
    bytes[0] = 'X';
    bytes[1] = 'X';
    bytes[2] = 'X';
    bytes[3] = 'X';
    const fs::path p = path("bad_magic.satish");
    write_file_safely(p, bytes);

    EXPECT_THROW(inspect_satish_file(p), InvalidFormat);
    const ValidationReport r = validate_satish_file(p);
    EXPECT_FALSE(r.header.has_value());

    std::ostringstream out;
    print_validation_report(out, r);
    EXPECT_THAT(out.str(), HasSubstr("[ERROR] invalid header: invalid magic bytes: expected 'SATI', got 'XXXX'"));
    EXPECT_THAT(out.str(), HasSubstr("INVALID\n"));
}

TEST_F(ValidatorTest, ShortFileStillProducesAReport) {
    const fs::path p = path("short.satish");
    write_file_safely(p, std::vector<uint8_t>{'S', 'A', 'T'});
    std::ostringstream out;
    print_validation_report(out, validate_satish_file(p));
    EXPECT_THAT(out.str(), HasSubstr("[ERROR] file too small: 3 bytes (minimum: 10)"));
    EXPECT_THAT(out.str(), HasSubstr("INVALID\n"));
}

TEST_F(ValidatorTest, ValidReportEndsWithValid) {
    const fs::path p = path("ok.satish");
    write_file_safely(p, container(1, 1));
    std::ostringstream out;
    print_validation_report(out, validate_satish_file(p));
    EXPECT_EQ(out.str(), "VALID\n");
}

TEST_F(ValidatorTest, TruncatedPayload) {
    std::vector<uint8_t> bytes = container(2, 2);
    bytes.resize(bytes.size() - 4);
    const fs::path p = path("cut.satish");
    write_file_safely(p, bytes);
    const ValidationReport r = validate_satish_file(p);
    EXPECT_FALSE(r.valid);
    EXPECT_THAT(r.errors, ElementsAre("pixel data size mismatch: expected 24, got 20"));
    EXPECT_THAT(r.warnings, ElementsAre(HasSubstr("not aligned")));
    // header alone is fine
    EXPECT_TRUE(quick_validate(p));
}

TEST_F(ValidatorTest, NonHexPayload) {
    std::vector<uint8_t> bytes = container(2, 1);
    bytes[10 + 7] = 'z';
    const fs::path p = path("nonhex.satish");
    write_file_safely(p, bytes);
    const ValidationReport r = validate_satish_file(p);
    EXPECT_THAT(r.errors, ElementsAre("pixel 1: invalid hex character at payload offset 7"));
}

TEST_F(ValidatorTest, NewerVersionIsReported) {
    const fs::path p = path("v2.satish");
    write_file_safely(p, container(1, 1, 2));
    const ValidationReport r = validate_satish_file(p);
    EXPECT_FALSE(r.valid);
    EXPECT_THAT(r.errors, ElementsAre("unsupported version: 2 (current: 1)"));
}

TEST_F(ValidatorTest, InspectReadsHeaderAndSizes) {
    const fs::path p = path("i.satish");
    std::vector<uint8_t> bytes = container(4, 2);
    bytes.resize(bytes.size() - 6);
    write_file_safely(p, bytes);

    const SatishFileInfo info = inspect_satish_file(p);
    EXPECT_EQ(info.header, create_header(4, 2));
    EXPECT_EQ(info.file_size, 10u + 42u);
    EXPECT_EQ(info.pixel_count, 8u);
    EXPECT_EQ(info.expected_pixel_bytes, 48u);
    EXPECT_EQ(info.actual_pixel_bytes, 42u);
    EXPECT_FALSE(info.size_matches());
    EXPECT_EQ(info.channel_format, "RGB");

    EXPECT_THROW(inspect_satish_file(path("none.satish")), FileOperationError);
    EXPECT_THROW(inspect_satish_file(touch("bad.satish", "NOTSATISH!")), InvalidFormat);
}

TEST(HexStringTest, ChecksLengthAndAlphabet) {
    EXPECT_THAT(validate_hex_string("a0B1c2"), IsEmpty());
    EXPECT_THAT(validate_hex_string("a0B1c"), ElementsAre("invalid hex string length: expected 6, got 5"));
    EXPECT_THAT(validate_hex_string("a0B1cg"), ElementsAre("invalid hex characters in: a0B1cg"));
    EXPECT_THAT(validate_hex_string("ff", 2), IsEmpty());
}
