#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "format/header_codec.hpp"
#include "util/errors.hpp"

#include <string>
#include <vector>

using namespace satish;
using ::testing::HasSubstr;

TEST(HeaderCodecTest, PackIsBitExactBigEndian) {
    const std::vector<uint8_t> bytes = pack_header(create_header(0x0102, 0xA0B0, 3, 1));
    const std::vector<uint8_t> expected = {'S', 'A', 'T', 'I', 0x01, 0x02, 0xA0, 0xB0, 0x03, 0x01};
    EXPECT_EQ(bytes, expected);
}

TEST(HeaderCodecTest, RoundTripOverRepresentativeHeaders) {
    const int dims[] = {1, 2, 255, 256, 1000, 65534, 65535};
    for (int w : dims) {
        for (int h : dims) {
            for (int v : {1, 2, 255}) {
                const SatishHeader hdr = create_header(w, h, 3, v);
                EXPECT_EQ(unpack_header(pack_header(hdr)), hdr) << w << "x" << h << " v" << v;
            }
        }
    }
}

TEST(HeaderCodecTest, UnpackIgnoresTrailingPayload) {
    std::vector<uint8_t> bytes = pack_header(create_header(1, 1));
    const std::string payload = "ff00ff";
    bytes.insert(bytes.end(), payload.begin(), payload.end());
    EXPECT_EQ(unpack_header(bytes), create_header(1, 1));
}

TEST(HeaderCodecTest, ShortInputReportsExpectedAndActualLength) {
    const std::vector<uint8_t> full = pack_header(create_header(4, 4));
    for (size_t n = 0; n < kHeaderBytes; ++n) {
        const std::vector<uint8_t> truncated(full.begin(), full.begin() + static_cast<long>(n));
        try {
            unpack_header(truncated);
            FAIL() << "expected InvalidFormat for " << n << " bytes";
        } catch (const InvalidFormat& e) {
            EXPECT_EQ(std::string(e.what()),
                      "header too short: expected 10 bytes, got " + std::to_string(n));
            EXPECT_EQ(e.field(), "header");
        }
    }
}

TEST(HeaderCodecTest, WrongMagicIsNamed) {
    std::vector<uint8_t> bytes = pack_header(create_header(4, 4));
    bytes[0] = 'P';
    bytes[1] = 'N';
    bytes[2] = 'G';
    bytes[3] = 0x00;
    try {
        unpack_header(bytes);
        FAIL() << "expected InvalidFormat";
    } catch (const InvalidFormat& e) {
        EXPECT_EQ(e.field(), "magic");
        EXPECT_THAT(e.what(), HasSubstr("expected 'SATI'"));
        EXPECT_THAT(e.what(), HasSubstr("got 'PNG\\x00'"));
    }
}

TEST(HeaderCodecTest, SemanticallyInvalidFieldsFailAtUnpack) {
    // zero width
    std::vector<uint8_t> bytes = {'S', 'A', 'T', 'I', 0x00, 0x00, 0x00, 0x10, 0x03, 0x01};
    EXPECT_THROW(unpack_header(bytes), InvalidFormat);

    // four channels
    bytes = {'S', 'A', 'T', 'I', 0x00, 0x10, 0x00, 0x10, 0x04, 0x01};
    try {
        unpack_header(bytes);
        FAIL() << "expected InvalidFormat";
    } catch (const InvalidFormat& e) {
        EXPECT_EQ(e.field(), "channels");
        EXPECT_THAT(e.what(), HasSubstr("unsupported channels: 4"));
    }

    // version 0
    bytes = {'S', 'A', 'T', 'I', 0x00, 0x10, 0x00, 0x10, 0x03, 0x00};
    EXPECT_THROW(unpack_header(bytes), InvalidFormat);
}

TEST(ByteStreamTest, ReaderStopsAtEnd) {
    const std::vector<uint8_t> data = {0x12, 0x34, 0x56};
    ByteReader r(data);
    EXPECT_EQ(r.read_u16_be(), 0x1234);
    EXPECT_EQ(r.remaining(), 1u);
    EXPECT_THROW(r.read_u16_be(), InvalidFormat);
}
