#include "cli/cli_parser.hpp"
#include "codec/decoder.hpp"
#include "io/file_manager.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

static const char* kUsage =
    "Usage: satish_decode --in <input.satish|dir> [--out <output.ppm|dir>] [--recursive] [--overwrite]\n";

static fs::path prepare_output(fs::path out, bool overwrite) {
    if (overwrite || !satish::file_exists(out)) return out;
    return satish::get_available_filename(out);
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
        const bool overwrite = cli.flag("overwrite");

        std::error_code ec;
        if (!fs::is_directory(in, ec)) {
            const fs::path target = prepare_output(
                out.empty() ? satish::generate_output_path(in, {}, ".ppm") : fs::path(out), overwrite);
            satish::decode_file(in, target);
            std::cout << "Wrote: " << target.string() << "\n";
            return 0;
        }

        //===Batch===//
        const auto files = satish::find_satish_files(in, cli.flag("recursive"));
        if (files.empty()) {
            std::cerr << "[WARN] no .satish files found in " << in << "\n";
            return 0;
        }
        const auto result = satish::batch_operation(files, [&](const fs::path& p) {
            const fs::path target = prepare_output(satish::generate_output_path(p, out, ".ppm"), overwrite);
            satish::decode_file(p, target);
            std::cout << "Wrote: " << target.string() << "\n";
            return target;
        });
        for (const auto& err : result.errors) std::cerr << "[ERROR] " << err << "\n";
        std::cout << "Decoded " << result.successes.size() << " of " << files.size() << " files\n";
        return result.all_succeeded() ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
