#include "format/satish_format.hpp"

#include "util/errors.hpp"

#include <cstdio>
#include <sstream>

namespace satish {
namespace {

std::string supported_list() {
    std::ostringstream os;
    os << "[";
    bool first = true;
    for (const auto& [ch, name] : supported_channels()) {
        if (!first) os << ", ";
        os << ch;
        first = false;
    }
    os << "]";
    return os.str();
}

void check_width(int width) {
    if (width < 1 || width > kMaxWidth) {
        throw InvalidFormat("width", "width must be between 1 and " + std::to_string(kMaxWidth) +
                                     ", got " + std::to_string(width));
    }
}

void check_height(int height) {
    if (height < 1 || height > kMaxHeight) {
        throw InvalidFormat("height", "height must be between 1 and " + std::to_string(kMaxHeight) +
                                      ", got " + std::to_string(height));
    }
}

void check_channels(int channels) {
    if (!is_supported_channel_count(channels)) {
        throw InvalidFormat("channels", "unsupported channels: " + std::to_string(channels) +
                                        ". Supported: " + supported_list());
    }
}

void check_version(int version) {
    if (version < kMinVersion || version > kMaxVersion) {
        throw InvalidFormat("version", "version must be between " + std::to_string(kMinVersion) +
                                       " and " + std::to_string(kMaxVersion) +
                                       ", got " + std::to_string(version));
    }
}

} // namespace

const std::map<int, std::string>& supported_channels() {
    static const std::map<int, std::string> channels = {
        {kRgbChannels, "RGB"},
    };
    return channels;
}

bool is_supported_channel_count(int channels) {
    return supported_channels().count(channels) != 0;
}

bool operator==(const SatishHeader& a, const SatishHeader& b) {
    return a.magic == b.magic && a.width == b.width && a.height == b.height &&
           a.channels == b.channels && a.version == b.version;
}

bool operator!=(const SatishHeader& a, const SatishHeader& b) {
    return !(a == b);
}

SatishHeader create_header(int width, int height, int channels, int version) {
    check_width(width);
    check_height(height);
    check_channels(channels);
    check_version(version);

    SatishHeader hdr;
    hdr.magic = kMagic;
    hdr.width = static_cast<uint16_t>(width);
    hdr.height = static_cast<uint16_t>(height);
    hdr.channels = static_cast<uint8_t>(channels);
    hdr.version = static_cast<uint8_t>(version);
    return hdr;
}

void validate_header(const SatishHeader& hdr) {
    if (hdr.magic != kMagic) {
        throw InvalidFormat("magic", "invalid magic bytes: expected '" + magic_to_string(kMagic) +
                                     "', got '" + magic_to_string(hdr.magic) + "'");
    }
    check_width(hdr.width);
    check_height(hdr.height);
    check_channels(hdr.channels);
    check_version(hdr.version);
}

uint64_t calculate_pixel_data_size(int width, int height, int /*channels*/) {
    // TODO: scale by channel count once a non-RGB layout is added to supported_channels().
    const uint64_t num_pixels = static_cast<uint64_t>(width) * static_cast<uint64_t>(height);
    return num_pixels * kHexCharsPerPixel;
}

uint64_t expected_file_size(const SatishHeader& hdr) {
    return kHeaderBytes + calculate_pixel_data_size(hdr.width, hdr.height, hdr.channels);
}

FormatInfo format_info() {
    FormatInfo info;
    info.name = kFormatName;
    info.magic = magic_to_string(kMagic);
    info.version = kCurrentVersion;
    info.extension = kSatishExtension;
    info.supported_channels = supported_channels();
    info.max_width = kMaxWidth;
    info.max_height = kMaxHeight;
    info.pixel_encoding = kPixelEncoding;
    info.header_size = kHeaderBytes;
    return info;
}

std::string magic_to_string(const std::array<uint8_t, 4>& magic) {
    std::string out;
    for (uint8_t b : magic) {
        if (b >= 0x20 && b < 0x7F) {
            out.push_back(static_cast<char>(b));
        } else {
            char buf[5];
            std::snprintf(buf, sizeof(buf), "\\x%02X", b);
            out += buf;
        }
    }
    return out;
}

} // namespace satish
