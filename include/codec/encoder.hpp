#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include "io/image_types.hpp"

namespace satish {

// Header + lowercase "rrggbb" payload. Throws InvalidFormat if the image
// does not fit the format or its buffer disagrees with its dimensions.
std::vector<uint8_t> encode_to_satish(const RgbImage& im);

// load_source_image -> encode_to_satish -> write_file_safely. Returns bytes written.
uint64_t encode_file(const std::filesystem::path& input, const std::filesystem::path& output);

} // namespace satish
