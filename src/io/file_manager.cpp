#include "io/file_manager.hpp"

#include "util/errors.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

namespace satish {
namespace {

constexpr const char* kInvalidFilenameChars = "<>:\"/\\|?*";
constexpr const char* kFallbackFilename = "untitled";

std::string lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

std::string lower_extension(const fs::path& p) {
    return lower(p.extension().string());
}

// errno from a failed stream call, or a generic I/O error when the library left it unset.
std::error_code stream_error() {
    const int err = errno;
    return err != 0 ? std::error_code(err, std::generic_category())
                    : std::make_error_code(std::errc::io_error);
}

std::error_code not_found() {
    return std::make_error_code(std::errc::no_such_file_or_directory);
}

// Sibling of `target` nobody else will pick: ".<name>.tmp<random>".
fs::path temp_sibling(const fs::path& target) {
    static std::atomic<unsigned> counter{0};
    std::random_device rd;
    char tag[32];
    std::snprintf(tag, sizeof(tag), ".tmp%08x%04x", rd(), counter.fetch_add(1) & 0xFFFFu);
    return target.parent_path() / ("." + target.filename().string() + tag);
}

void remove_quietly(const fs::path& p) {
    std::error_code ignore;
    fs::remove(p, ignore);
}

std::ios::openmode open_flags(std::ios::openmode base, FileMode mode) {
    return mode == FileMode::Binary ? (base | std::ios::binary) : base;
}

void write_bytes_safely(const fs::path& path, const char* data, size_t size, FileMode mode) {
    const fs::path target = validate_path(path);
    if (target.has_parent_path()) ensure_directory_exists(target.parent_path());

    const fs::path tmp = temp_sibling(target);
    {
        errno = 0;
        std::ofstream ofs(tmp, open_flags(std::ios::out | std::ios::trunc, mode));
        if (!ofs.is_open()) {
            throw FileOperationError("cannot write file " + target.string(), target, stream_error());
        }
        ofs.write(data, static_cast<std::streamsize>(size));
        ofs.flush();
        ofs.close();
        if (ofs.fail()) {
            const std::error_code ec = stream_error();
            remove_quietly(tmp);
            throw FileOperationError("cannot write file " + target.string(), target, ec);
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        remove_quietly(tmp);
        throw FileOperationError("cannot write file " + target.string(), target, ec);
    }
}

} // namespace

const std::set<std::string>& supported_source_extensions() {
    static const std::set<std::string> exts = {".ppm", ".pgm", ".pnm", ".dcm", ".dicom"};
    return exts;
}

fs::path validate_path(const fs::path& input) {
    const std::string& native = input.native();
    if (native.empty()) {
        throw FileOperationError("invalid path: empty", input);
    }
    if (native.find('\0') != std::string::npos) {
        throw FileOperationError("invalid path: embedded NUL character", input);
    }
    return input;
}

void ensure_directory_exists(const fs::path& path) {
    fs::path dir = validate_path(path);
    std::error_code ec;
    if (fs::is_regular_file(dir, ec)) {
        dir = dir.parent_path();
        if (dir.empty()) return;
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw FileOperationError("cannot create directory " + dir.string(), dir, ec);
    }
}

bool is_supported_source_image(const fs::path& path) {
    return supported_source_extensions().count(lower_extension(path)) != 0;
}

bool is_satish_file(const fs::path& path) {
    return lower_extension(path) == kSatishExtension;
}

bool file_exists(const fs::path& path) {
    try {
        const fs::path p = validate_path(path);
        std::error_code ec;
        return fs::is_regular_file(p, ec);
    } catch (const FileOperationError&) {
        return false;
    }
}

uint64_t get_file_size(const fs::path& path) {
    const fs::path p = validate_path(path);
    std::error_code ec;
    if (!fs::exists(p, ec)) {
        throw FileOperationError("file does not exist: " + p.string(), p, ec ? ec : not_found());
    }
    const uintmax_t size = fs::file_size(p, ec);
    if (ec) {
        throw FileOperationError("cannot get file size for " + p.string(), p, ec);
    }
    return static_cast<uint64_t>(size);
}

FileDescriptor get_file_info(const fs::path& path) {
    FileDescriptor fd;
    fd.path = validate_path(path);
    fd.size = get_file_size(fd.path);

    std::error_code ec;
    fd.modified = fs::last_write_time(fd.path, ec);
    if (ec) {
        throw FileOperationError("cannot stat " + fd.path.string(), fd.path, ec);
    }
    fd.name = fd.path.filename().string();
    fd.stem = fd.path.stem().string();
    fd.extension = fd.path.extension().string();
    fd.is_source_image = is_supported_source_image(fd.path);
    fd.is_satish_file = is_satish_file(fd.path);
    return fd;
}

std::string format_file_size(uint64_t size_bytes) {
    if (size_bytes == 0) return "0 B";

    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t kNumUnits = sizeof(kUnits) / sizeof(kUnits[0]);
    double size = static_cast<double>(size_bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < kNumUnits) {
        size /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", size, kUnits[unit]);
    return buf;
}

std::string get_safe_filename(const std::string& filename) {
    std::string safe = filename;
    for (auto& ch : safe) {
        if (std::strchr(kInvalidFilenameChars, ch) != nullptr && ch != '\0') ch = '_';
    }

    const auto is_trimmed = [](char c) { return c == '.' || c == ' '; };
    const auto first = std::find_if_not(safe.begin(), safe.end(), is_trimmed);
    const auto last = std::find_if_not(safe.rbegin(), safe.rend(), is_trimmed).base();
    safe = (first < last) ? std::string(first, last) : std::string();

    if (safe.empty()) safe = kFallbackFilename;
    return safe;
}

fs::path generate_output_path(const fs::path& input,
                              const fs::path& output_dir,
                              const std::string& new_extension) {
    const fs::path in = validate_path(input);
    const std::string safe_name = get_safe_filename(in.stem().string());

    fs::path dir;
    if (!output_dir.empty()) {
        dir = validate_path(output_dir);
        ensure_directory_exists(dir);
    } else {
        dir = in.parent_path();
    }
    return dir / (safe_name + new_extension);
}

fs::path backup_file(const fs::path& path, const std::string& suffix) {
    const fs::path src = validate_path(path);
    std::error_code ec;
    if (!fs::exists(src, ec)) {
        throw FileOperationError("cannot backup non-existent file: " + src.string(), src,
                                 ec ? ec : not_found());
    }

    fs::path backup = src;
    backup += suffix;

    // A previous backup at `backup` survives until the new copy is complete.
    const fs::path tmp = temp_sibling(backup);
    fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
        const auto mtime = fs::last_write_time(src, ec);
        if (!ec) fs::last_write_time(tmp, mtime, ec);
    }
    if (!ec) fs::rename(tmp, backup, ec);
    if (ec) {
        remove_quietly(tmp);
        throw FileOperationError("cannot create backup of " + src.string(), src, ec);
    }
    return backup;
}

std::vector<fs::path> find_files(const fs::path& directory, const std::string& pattern, bool recursive) {
    std::vector<fs::path> out;
    if (directory.empty() || directory.native().find('\0') != std::string::npos) return out;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) return out;

    const auto matches = [&pattern](const fs::path& p) {
        return ::fnmatch(pattern.c_str(), p.filename().c_str(), 0) == 0;
    };

    if (recursive) {
        fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        if (ec) return {};
        const fs::recursive_directory_iterator end;
        while (it != end) {
            if (matches(it->path())) out.push_back(it->path());
            it.increment(ec);
            if (ec) return {};
        }
    } else {
        fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        if (ec) return {};
        const fs::directory_iterator end;
        while (it != end) {
            if (matches(it->path())) out.push_back(it->path());
            it.increment(ec);
            if (ec) return {};
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<fs::path> find_images(const fs::path& directory, bool recursive) {
    std::vector<fs::path> out;
    for (auto& p : find_files(directory, "*", recursive)) {
        if (is_supported_source_image(p) && file_exists(p)) out.push_back(std::move(p));
    }
    return out;
}

std::vector<fs::path> find_satish_files(const fs::path& directory, bool recursive) {
    std::vector<fs::path> out;
    for (auto& p : find_files(directory, "*", recursive)) {
        if (is_satish_file(p) && file_exists(p)) out.push_back(std::move(p));
    }
    return out;
}

fs::path get_available_filename(const fs::path& path) {
    const fs::path p = validate_path(path);
    std::error_code ec;
    if (!fs::exists(p, ec)) return p;

    const std::string stem = p.stem().string();
    const std::string ext = p.extension().string();
    const fs::path parent = p.parent_path();
    for (unsigned long n = 1;; ++n) {
        fs::path candidate = parent / (stem + "_" + std::to_string(n) + ext);
        if (!fs::exists(candidate, ec)) return candidate;
    }
}

std::vector<uint8_t> read_file_safely(const fs::path& path, FileMode mode) {
    const fs::path p = validate_path(path);
    std::error_code ec;
    if (!fs::exists(p, ec)) {
        throw FileOperationError("file does not exist: " + p.string(), p, ec ? ec : not_found());
    }
    if (!fs::is_regular_file(p, ec)) {
        throw FileOperationError("cannot read file " + p.string() + " (not a regular file)", p,
                                 ec ? ec : std::make_error_code(std::errc::is_a_directory));
    }

    errno = 0;
    std::ifstream ifs(p, open_flags(std::ios::in, mode));
    if (!ifs.is_open()) {
        throw FileOperationError("cannot open file " + p.string(), p, stream_error());
    }
    ifs.seekg(0, std::ios::end);
    const std::streamoff n = ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    if (n < 0 || !ifs.good()) {
        throw FileOperationError("cannot read file " + p.string(), p, stream_error());
    }

    std::vector<uint8_t> buf(static_cast<size_t>(n));
    ifs.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (ifs.bad()) {
        throw FileOperationError("cannot read file " + p.string(), p, stream_error());
    }
    // text mode may translate line endings and come up short
    buf.resize(static_cast<size_t>(ifs.gcount()));
    return buf;
}

std::vector<uint8_t> read_file_prefix(const fs::path& path, size_t max_bytes) {
    const fs::path p = validate_path(path);
    if (!file_exists(p)) {
        throw FileOperationError("file does not exist: " + p.string(), p, not_found());
    }

    errno = 0;
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs.is_open()) {
        throw FileOperationError("cannot open file " + p.string(), p, stream_error());
    }
    std::vector<uint8_t> buf(max_bytes);
    ifs.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (ifs.bad()) {
        throw FileOperationError("cannot read file " + p.string(), p, stream_error());
    }
    buf.resize(static_cast<size_t>(ifs.gcount()));
    return buf;
}

void write_file_safely(const fs::path& path, const std::vector<uint8_t>& data, FileMode mode) {
    write_bytes_safely(path, reinterpret_cast<const char*>(data.data()), data.size(), mode);
}

void write_file_safely(const fs::path& path, const std::string& data, FileMode mode) {
    write_bytes_safely(path, data.data(), data.size(), mode);
}

} // namespace satish
