#include "cli/cli_parser.hpp"
#include "codec/encoder.hpp"
#include "io/file_manager.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

static const char* kUsage =
    "Usage: satish_encode --in <image|dir> [--out <output.satish|dir>] [--recursive] [--overwrite] [--backup]\n";

struct Options {
    bool overwrite = false;
    bool backup = false;
};

// Never clobber an existing output unless asked to; --backup keeps a copy first.
static fs::path prepare_output(fs::path out, const Options& opt) {
    if (!satish::file_exists(out)) return out;
    if (!opt.overwrite) return satish::get_available_filename(out);
    if (opt.backup) {
        const fs::path saved = satish::backup_file(out);
        std::cout << "Backed up: " << saved.string() << "\n";
    }
    return out;
}

int main(int argc, char** argv) {
    try {
        satish::CliParser cli;
        cli.parse(argc, argv);
        const std::string in = cli.get("in");
        const std::string out = cli.get("out");
        if (in.empty()) {
            std::cerr << kUsage;
            return 1;
        }
        Options opt;
        opt.overwrite = cli.flag("overwrite");
        opt.backup = cli.flag("backup");

        std::error_code ec;
        if (!fs::is_directory(in, ec)) {
            const fs::path target = prepare_output(out.empty() ? satish::generate_output_path(in) : fs::path(out), opt);
            const uint64_t n = satish::encode_file(in, target);
            std::cout << "Wrote: " << target.string() << " (" << n << " bytes)\n";
            return 0;
        }

        //===Batch===//
        const auto images = satish::find_images(in, cli.flag("recursive"));
        if (images.empty()) {
            std::cerr << "[WARN] no supported images found in " << in << "\n";
            return 0;
        }
        const auto result = satish::batch_operation(images, [&](const fs::path& p) {
            const fs::path target = prepare_output(satish::generate_output_path(p, out), opt);
            const uint64_t n = satish::encode_file(p, target);
            std::cout << "Wrote: " << target.string() << " (" << n << " bytes)\n";
            return target;
        });
        for (const auto& err : result.errors) std::cerr << "[ERROR] " << err << "\n";
        std::cout << "Encoded " << result.successes.size() << " of " << images.size() << " files\n";
        return result.all_succeeded() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
