#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include "io/image_types.hpp"

namespace satish {

// Parse a whole .satish file image. The payload must be exactly
// calculate_pixel_data_size() bytes of hex digits (either case).
RgbImage decode_from_satish(const std::vector<uint8_t>& bytes);

RgbImage decode_satish_file(const std::filesystem::path& input);

// .satish -> binary PPM.
void decode_file(const std::filesystem::path& input, const std::filesystem::path& output);

} // namespace satish
