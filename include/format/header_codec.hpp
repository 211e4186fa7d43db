#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "format/byte_stream.hpp"
#include "format/satish_format.hpp"

namespace satish {

// Exactly kHeaderBytes bytes. The header must already be valid
// (create_header / unpack_header); no re-validation here.
std::vector<uint8_t> pack_header(const SatishHeader& hdr);
void write_header(ByteWriter& w, const SatishHeader& hdr);

// Decode the first kHeaderBytes bytes and validate them.
// Throws InvalidFormat on short input, bad magic or any invalid field.
SatishHeader unpack_header(const uint8_t* data, size_t size);
SatishHeader unpack_header(const std::vector<uint8_t>& bytes);

} // namespace satish
