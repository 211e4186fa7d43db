#include "codec/validator.hpp"

#include "format/header_codec.hpp"
#include "io/file_manager.hpp"
#include "util/errors.hpp"

#include <cctype>

namespace fs = std::filesystem;

namespace satish {
namespace {

bool is_hex(uint8_t c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

SatishFileInfo inspect_satish_file(const fs::path& path) {
    SatishFileInfo info;
    info.path = validate_path(path);
    info.file_size = get_file_size(info.path);
    info.header = unpack_header(read_file_prefix(info.path, kHeaderBytes));

    const SatishHeader& hdr = info.header;
    info.pixel_count = static_cast<uint64_t>(hdr.width) * hdr.height;
    info.expected_pixel_bytes = calculate_pixel_data_size(hdr.width, hdr.height, hdr.channels);
    info.actual_pixel_bytes = info.file_size - kHeaderBytes;

    const auto& channels = supported_channels();
    const auto it = channels.find(hdr.channels);
    info.channel_format = (it != channels.end()) ? it->second : "Unknown";
    return info;
}

ValidationReport validate_satish_file(const fs::path& path) {
    ValidationReport r;
    r.path = path;

    //===Access===//
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        r.errors.push_back("file does not exist: " + path.string());
        return r;
    }
    if (!fs::is_regular_file(path, ec)) {
        r.errors.push_back("path is not a file: " + path.string());
        return r;
    }

    std::vector<uint8_t> bytes;
    try {
        bytes = read_file_safely(path);
    } catch (const FileOperationError& e) {
        r.errors.push_back(e.what());
        return r;
    }
    r.file_size = bytes.size();
    if (r.file_size < kHeaderBytes) {
        r.errors.push_back("file too small: " + std::to_string(r.file_size) +
                           " bytes (minimum: " + std::to_string(kHeaderBytes) + ")");
        return r;
    }

    //===Structure===//
    if (!is_satish_file(path)) {
        r.warnings.push_back("unexpected file extension: '" + path.extension().string() +
                             "' (expected: " + kSatishExtension + ")");
    }
    const uint64_t payload_bytes = r.file_size - kHeaderBytes;
    if (payload_bytes % kHexCharsPerPixel != 0) {
        r.warnings.push_back("pixel data size not aligned to pixel boundaries");
    }

    //===Header===//
    SatishHeader hdr;
    try {
        hdr = unpack_header(bytes);
    } catch (const InvalidFormat& e) {
        r.errors.push_back(std::string("invalid header: ") + e.what());
        return r;
    }
    r.header = hdr;
    if (hdr.version > kCurrentVersion) {
        r.errors.push_back("unsupported version: " + std::to_string(hdr.version) +
                           " (current: " + std::to_string(kCurrentVersion) + ")");
    }

    //===Payload===//
    r.expected_file_size = expected_file_size(hdr);
    const uint64_t expected_payload = r.expected_file_size - kHeaderBytes;
    if (payload_bytes != expected_payload) {
        r.errors.push_back("pixel data size mismatch: expected " + std::to_string(expected_payload) +
                           ", got " + std::to_string(payload_bytes));
    }
    for (size_t i = kHeaderBytes; i < bytes.size(); ++i) {
        if (!is_hex(bytes[i])) {
            const size_t offset = i - kHeaderBytes;
            r.errors.push_back("pixel " + std::to_string(offset / kHexCharsPerPixel) +
                               ": invalid hex character at payload offset " + std::to_string(offset));
            break;
        }
    }

    r.valid = r.errors.empty();
    return r;
}

void print_validation_report(std::ostream& os, const ValidationReport& report) {
    for (const auto& w : report.warnings) os << "[WARN] " << w << "\n";
    for (const auto& e : report.errors) os << "[ERROR] " << e << "\n";
    os << (report.valid ? "VALID" : "INVALID") << "\n";
}

bool quick_validate(const fs::path& path) {
    if (!file_exists(path)) return false;
    try {
        const std::vector<uint8_t> head = read_file_prefix(path, kHeaderBytes);
        unpack_header(head);
        return true;
    } catch (const InvalidFormat&) {
        return false;
    } catch (const FileOperationError&) {
        return false;
    }
}

std::vector<std::string> validate_hex_string(const std::string& hex, size_t expected_length) {
    std::vector<std::string> errors;
    if (hex.size() != expected_length) {
        errors.push_back("invalid hex string length: expected " + std::to_string(expected_length) +
                         ", got " + std::to_string(hex.size()));
    }
    for (char c : hex) {
        if (!is_hex(static_cast<uint8_t>(c))) {
            errors.push_back("invalid hex characters in: " + hex);
            break;
        }
    }
    return errors;
}

} // namespace satish
