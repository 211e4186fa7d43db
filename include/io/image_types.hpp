#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace satish {

// 8-bit RGB raster, row-major, channels interleaved (r,g,b,r,g,b,...).
struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels;

    static constexpr int kChannels = 3;

    size_t pixel_count() const { return static_cast<size_t>(width) * static_cast<size_t>(height); }
    size_t expected_bytes() const { return pixel_count() * kChannels; }
};

} // namespace satish
