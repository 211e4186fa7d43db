#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include "io/image_types.hpp"

namespace satish {

// Source image loader:
// - PNM: P6 (RGB) and P5 (grey), 8/16-bit; grey is replicated to RGB
// - DICOM (DCMTK): uncompressed single-frame MONOCHROME1/2 or 8-bit RGB
// Anything else throws SatishError; unreadable files throw FileOperationError.
RgbImage load_source_image(const std::filesystem::path& path);

// PNM decoding from memory (used by load_source_image and tests).
RgbImage decode_pnm(const std::vector<uint8_t>& bytes);

// Throws SatishError unless a PixelData element of `available` samples covers
// pixels * samples_per_pixel.
void check_pixel_data_length(size_t available, size_t pixels, size_t samples_per_pixel,
                             const std::string& where);

} // namespace satish
