#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>
#include "io/image_types.hpp"

namespace satish {

// Binary PPM (P6, maxval 255).
std::vector<uint8_t> encode_ppm(const RgbImage& im);
void save_ppm(const std::filesystem::path& path, const RgbImage& im);

} // namespace satish
