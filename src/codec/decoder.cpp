#include "codec/decoder.hpp"

#include "format/header_codec.hpp"
#include "format/satish_format.hpp"
#include "io/file_manager.hpp"
#include "io/image_saver.hpp"
#include "util/errors.hpp"

#include <cstdio>
#include <string>

namespace satish {
namespace {

int hex_value(uint8_t c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

RgbImage decode_from_satish(const std::vector<uint8_t>& bytes) {
    const SatishHeader hdr = unpack_header(bytes);

    const uint64_t expected = calculate_pixel_data_size(hdr.width, hdr.height, hdr.channels);
    const uint64_t actual = bytes.size() - kHeaderBytes;
    if (actual != expected) {
        throw InvalidFormat("payload", "pixel data size mismatch: expected " + std::to_string(expected) +
                                       ", got " + std::to_string(actual));
    }
#ifndef NDEBUG
    std::fprintf(stderr, "decode: %ux%u ch=%u v=%u\n", static_cast<unsigned>(hdr.width), static_cast<unsigned>(hdr.height),
                 static_cast<unsigned>(hdr.channels), static_cast<unsigned>(hdr.version));
#endif

    RgbImage im;
    im.width = hdr.width;
    im.height = hdr.height;
    im.pixels.resize(im.expected_bytes());

    const uint8_t* payload = bytes.data() + kHeaderBytes;
    for (size_t i = 0; i < im.pixels.size(); ++i) {
        const int hi = hex_value(payload[2 * i]);
        const int lo = hex_value(payload[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            const size_t pixel = i / RgbImage::kChannels;
            const size_t start = pixel * kHexCharsPerPixel;
            throw InvalidFormat("payload", "invalid hex color at pixel " + std::to_string(pixel) + ": '" +
                                           std::string(payload + start, payload + start + kHexCharsPerPixel) + "'");
        }
        im.pixels[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return im;
}

RgbImage decode_satish_file(const std::filesystem::path& input) {
    return decode_from_satish(read_file_safely(input));
}

void decode_file(const std::filesystem::path& input, const std::filesystem::path& output) {
    save_ppm(output, decode_satish_file(input));
}

} // namespace satish
