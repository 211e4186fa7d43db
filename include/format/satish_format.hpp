#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace satish {

// .satish file layout:
// [Header (10 bytes)][payload: width * height * 6 ASCII hex chars]
//
// Header numeric fields are big-endian. Payload is "rrggbb" per pixel,
// row-major, no separators.
inline constexpr std::array<uint8_t, 4> kMagic = {'S', 'A', 'T', 'I'};
inline constexpr uint8_t kCurrentVersion = 1;

inline constexpr size_t kMagicBytes = 4;
inline constexpr size_t kWidthBytes = 2;
inline constexpr size_t kHeightBytes = 2;
inline constexpr size_t kChannelsBytes = 1;
inline constexpr size_t kVersionBytes = 1;
inline constexpr size_t kHeaderBytes =
    kMagicBytes + kWidthBytes + kHeightBytes + kChannelsBytes + kVersionBytes;

inline constexpr int kMaxWidth = 65535;
inline constexpr int kMaxHeight = 65535;
inline constexpr int kMinVersion = 1;
inline constexpr int kMaxVersion = 255;   // u8 on disk

inline constexpr int kRgbChannels = 3;
inline constexpr size_t kHexCharsPerChannel = 2;
inline constexpr size_t kHexCharsPerPixel = kHexCharsPerChannel * kRgbChannels; // rrggbb

inline constexpr const char* kFormatName = "SATISH Image Format";
inline constexpr const char* kSatishExtension = ".satish";
inline constexpr const char* kPixelEncoding = "Hexadecimal RGB";

static_assert(kHeaderBytes == 10, "on-disk header layout changed");

// Channel counts the format accepts, with their layout name.
const std::map<int, std::string>& supported_channels();
bool is_supported_channel_count(int channels);

// IMPORTANT:
// Never write/read this struct by dumping raw memory; use pack_header/unpack_header.
struct SatishHeader {
    std::array<uint8_t, 4> magic = kMagic;
    uint16_t width = 0;
    uint16_t height = 0;
    uint8_t  channels = 0;
    uint8_t  version = 0;
};

bool operator==(const SatishHeader& a, const SatishHeader& b);
bool operator!=(const SatishHeader& a, const SatishHeader& b);

// Build a header and validate every field; throws InvalidFormat on the first
// bad field (order: width, height, channels, version).
SatishHeader create_header(int width, int height,
                           int channels = kRgbChannels,
                           int version = kCurrentVersion);

// Re-check an existing header (order: magic, width, height, channels, version).
void validate_header(const SatishHeader& hdr);

// Expected payload bytes. `channels` is accepted but does not enter the
// formula: kHexCharsPerPixel already assumes 3 channels.
uint64_t calculate_pixel_data_size(int width, int height, int channels = kRgbChannels);

// kHeaderBytes + payload bytes for a validated header.
uint64_t expected_file_size(const SatishHeader& hdr);

struct FormatInfo {
    std::string name;
    std::string magic;
    int version = 0;
    std::string extension;
    std::map<int, std::string> supported_channels;
    int max_width = 0;
    int max_height = 0;
    std::string pixel_encoding;
    size_t header_size = 0;
};

FormatInfo format_info();

// Printable rendering of magic bytes; non-printable bytes become \xNN.
std::string magic_to_string(const std::array<uint8_t, 4>& magic);

} // namespace satish
