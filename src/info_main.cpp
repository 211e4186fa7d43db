#include "cli/cli_parser.hpp"
#include "codec/validator.hpp"
#include "format/satish_format.hpp"
#include "io/file_manager.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static const char* kUsage =
    "Usage: satish_info --in <file.satish> [--validate]\n"
    "       satish_info --list <dir> [--recursive]\n"
    "       satish_info --format\n";

static void print_format_info() {
    const satish::FormatInfo info = satish::format_info();
    std::cout << info.name << "\n"
              << "  magic:          " << info.magic << "\n"
              << "  version:        " << info.version << "\n"
              << "  extension:      " << info.extension << "\n"
              << "  channels:      ";
    for (const auto& [ch, name] : info.supported_channels) std::cout << " " << ch << " (" << name << ")";
    std::cout << "\n"
              << "  max dimensions: " << info.max_width << "x" << info.max_height << "\n"
              << "  pixel encoding: " << info.pixel_encoding << "\n"
              << "  header size:    " << info.header_size << " bytes\n";
}

static void print_listing(const std::string& title, const std::vector<fs::path>& files) {
    std::cout << title << " (" << files.size() << "):\n";
    for (const auto& p : files) {
        const satish::FileDescriptor fd = satish::get_file_info(p);
        std::cout << "  " << fd.path.string() << "  " << satish::format_file_size(fd.size) << "\n";
    }
}

static int print_file(const fs::path& path, bool validate) {
    // The report has to come out even when the header does not parse.
    satish::ValidationReport report;
    if (validate) {
        report = satish::validate_satish_file(path);
        if (!report.header) {
            satish::print_validation_report(std::cout, report);
            return 2;
        }
    }

    const satish::SatishFileInfo info = satish::inspect_satish_file(path);
    std::cout << "File: " << info.path.string() << " (" << satish::format_file_size(info.file_size) << ")\n"
              << "  dimensions: " << info.header.width << "x" << info.header.height << "\n"
              << "  channels:   " << static_cast<int>(info.header.channels) << " (" << info.channel_format << ")\n"
              << "  version:    " << static_cast<int>(info.header.version) << "\n"
              << "  pixels:     " << info.pixel_count << "\n"
              << "  pixel data: " << info.actual_pixel_bytes << " / " << info.expected_pixel_bytes << " bytes"
              << (info.size_matches() ? "" : " (MISMATCH)") << "\n";
    if (!validate) return info.size_matches() ? 0 : 2;

    satish::print_validation_report(std::cout, report);
    return report.valid ? 0 : 2;
}

int main(int argc, char** argv) {
    try {
        satish::CliParser cli;
        cli.parse(argc, argv);
        if (cli.flag("format")) {
            print_format_info();
            return 0;
        }
        if (cli.has("list")) {
            const std::string dir = cli.get("list");
            const bool recursive = cli.flag("recursive");
            print_listing("Images", satish::find_images(dir, recursive));
            print_listing("SATISH files", satish::find_satish_files(dir, recursive));
            return 0;
        }
        const std::string in = cli.get("in");
        if (in.empty()) {
            std::cerr << kUsage;
            return 1;
        }
        return print_file(in, cli.flag("validate"));
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
