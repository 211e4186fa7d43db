#include "io/image_saver.hpp"

#include "io/file_manager.hpp"
#include "util/errors.hpp"

#include <string>

namespace satish {

std::vector<uint8_t> encode_ppm(const RgbImage& im) {
    if (im.width <= 0 || im.height <= 0) throw SatishError("save_ppm: invalid image size");
    if (im.pixels.size() != im.expected_bytes()) throw SatishError("save_ppm: pixel buffer size mismatch");

    const std::string head = "P6\n" + std::to_string(im.width) + " " + std::to_string(im.height) + "\n255\n";
    std::vector<uint8_t> out;
    out.reserve(head.size() + im.pixels.size());
    out.insert(out.end(), head.begin(), head.end());
    out.insert(out.end(), im.pixels.begin(), im.pixels.end());
    return out;
}

void save_ppm(const std::filesystem::path& path, const RgbImage& im) {
    write_file_safely(path, encode_ppm(im));
}

} // namespace satish
