#include "codec/encoder.hpp"

#include "format/byte_stream.hpp"
#include "format/header_codec.hpp"
#include "format/satish_format.hpp"
#include "io/file_manager.hpp"
#include "io/image_loader.hpp"
#include "util/errors.hpp"

#include <cstdio>
#include <string>

namespace satish {

std::vector<uint8_t> encode_to_satish(const RgbImage& im) {
    const SatishHeader hdr = create_header(im.width, im.height, RgbImage::kChannels);
    if (im.pixels.size() != im.expected_bytes()) {
        throw InvalidFormat("payload", "encode: buffer size mismatch: expected " +
                                       std::to_string(im.expected_bytes()) + " bytes, got " +
                                       std::to_string(im.pixels.size()));
    }

    static constexpr char kHexDigits[] = "0123456789abcdef";
    const uint64_t payload_bytes = calculate_pixel_data_size(hdr.width, hdr.height, hdr.channels);

    ByteWriter w;
    w.reserve(kHeaderBytes + static_cast<size_t>(payload_bytes));
    write_header(w, hdr);
    for (uint8_t v : im.pixels) {
        w.write_u8(static_cast<uint8_t>(kHexDigits[v >> 4]));
        w.write_u8(static_cast<uint8_t>(kHexDigits[v & 0x0F]));
    }

    if (w.size() != kHeaderBytes + payload_bytes) {
        throw InvalidFormat("payload", "encode: output size mismatch");
    }
#ifndef NDEBUG
    std::fprintf(stderr, "encode: %ux%u ch=%u v=%u payload=%llu bytes\n",
                 static_cast<unsigned>(hdr.width), static_cast<unsigned>(hdr.height),
                 static_cast<unsigned>(hdr.channels), static_cast<unsigned>(hdr.version),
                 static_cast<unsigned long long>(payload_bytes));
#endif
    return w.take();
}

uint64_t encode_file(const std::filesystem::path& input, const std::filesystem::path& output) {
    const RgbImage im = load_source_image(input);
    const std::vector<uint8_t> bytes = encode_to_satish(im);
    write_file_safely(output, bytes);
    return bytes.size();
}

} // namespace satish
