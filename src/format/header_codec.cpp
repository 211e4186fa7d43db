#include "format/header_codec.hpp"

#include "util/errors.hpp"

#include <string>

namespace satish {

void write_header(ByteWriter& w, const SatishHeader& hdr) {
    w.write_bytes(hdr.magic.data(), hdr.magic.size());
    w.write_u16_be(hdr.width);
    w.write_u16_be(hdr.height);
    w.write_u8(hdr.channels);
    w.write_u8(hdr.version);
}

std::vector<uint8_t> pack_header(const SatishHeader& hdr) {
    ByteWriter w;
    w.reserve(kHeaderBytes);
    write_header(w, hdr);
    return w.take();
}

SatishHeader unpack_header(const uint8_t* data, size_t size) {
    if (size < kHeaderBytes) {
        throw InvalidFormat("header", "header too short: expected " + std::to_string(kHeaderBytes) +
                                      " bytes, got " + std::to_string(size));
    }

    ByteReader r(data, kHeaderBytes);
    SatishHeader hdr;
    r.read_bytes(hdr.magic.data(), hdr.magic.size());
    if (hdr.magic != kMagic) {
        throw InvalidFormat("magic", "invalid magic bytes: expected '" + magic_to_string(kMagic) +
                                     "', got '" + magic_to_string(hdr.magic) + "'");
    }
    hdr.width = r.read_u16_be();
    hdr.height = r.read_u16_be();
    hdr.channels = r.read_u8();
    hdr.version = r.read_u8();

    validate_header(hdr);
    return hdr;
}

SatishHeader unpack_header(const std::vector<uint8_t>& bytes) {
    return unpack_header(bytes.data(), bytes.size());
}

} // namespace satish
