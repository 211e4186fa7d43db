#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "format/satish_format.hpp"

namespace satish {

// Header-only view of a .satish file.
struct SatishFileInfo {
    std::filesystem::path path;
    uint64_t file_size = 0;
    SatishHeader header;
    uint64_t pixel_count = 0;
    uint64_t expected_pixel_bytes = 0;
    uint64_t actual_pixel_bytes = 0;
    std::string channel_format;

    bool size_matches() const { return expected_pixel_bytes == actual_pixel_bytes; }
};

// Reads only the header and the file size. Throws FileOperationError /
// InvalidFormat like unpack_header.
SatishFileInfo inspect_satish_file(const std::filesystem::path& path);

struct ValidationReport {
    std::filesystem::path path;
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    uint64_t file_size = 0;
    std::optional<SatishHeader> header;
    uint64_t expected_file_size = 0;
};

// Full check of a file on disk. A bad or unreadable file is reported
// through errors/warnings, never thrown.
ValidationReport validate_satish_file(const std::filesystem::path& path);

// Writes warnings, errors and a final VALID/INVALID line, one per line.
void print_validation_report(std::ostream& os, const ValidationReport& report);

// Header-only yes/no.
bool quick_validate(const std::filesystem::path& path);

// Errors for one pixel's hex text; empty means valid.
std::vector<std::string> validate_hex_string(const std::string& hex,
                                             size_t expected_length = kHexCharsPerPixel);

} // namespace satish
