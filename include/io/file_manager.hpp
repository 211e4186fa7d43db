#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <type_traits>
#include <vector>

#include "format/satish_format.hpp"

namespace satish {

enum class FileMode {
    Binary,
    Text,
};

// Source formats load_source_image() can decode (lowercase, with dot).
const std::set<std::string>& supported_source_extensions();

// Snapshot of one file, computed on every get_file_info() call.
struct FileDescriptor {
    std::filesystem::path path;
    std::string name;
    std::string stem;
    std::string extension;
    uint64_t size = 0;
    std::filesystem::file_time_type modified{};
    bool is_source_image = false;
    bool is_satish_file = false;
};

// Throws FileOperationError if `input` cannot name a path (empty or embedded NUL).
// Existence is not checked.
std::filesystem::path validate_path(const std::filesystem::path& input);

// Creates `path` and its parents. An existing regular file means "create its parent".
void ensure_directory_exists(const std::filesystem::path& path);

// Case-insensitive extension checks, no IO.
bool is_supported_source_image(const std::filesystem::path& path);
bool is_satish_file(const std::filesystem::path& path);

// True only for an existing regular file. Never throws.
bool file_exists(const std::filesystem::path& path);

uint64_t get_file_size(const std::filesystem::path& path);
FileDescriptor get_file_info(const std::filesystem::path& path);

// "1.5 KB" style rendering.
std::string format_file_size(uint64_t size_bytes);

// Replaces <>:"/\|?* with '_', trims leading/trailing dots and spaces.
// Never returns an empty string ("untitled" fallback).
std::string get_safe_filename(const std::string& filename);

// <output_dir or input's dir>/<safe stem of input><new_extension>.
// A non-empty output_dir is created.
std::filesystem::path generate_output_path(const std::filesystem::path& input,
                                           const std::filesystem::path& output_dir = {},
                                           const std::string& new_extension = kSatishExtension);

// Copies `path` to "<path><suffix>", overwriting an older backup.
std::filesystem::path backup_file(const std::filesystem::path& path,
                                  const std::string& suffix = ".backup");

// Glob `pattern` against entry names under `directory`. Sorted.
// Returns an empty list for a missing/non-directory root or any walk error.
std::vector<std::filesystem::path> find_files(const std::filesystem::path& directory,
                                              const std::string& pattern = "*",
                                              bool recursive = true);
std::vector<std::filesystem::path> find_images(const std::filesystem::path& directory,
                                               bool recursive = true);
std::vector<std::filesystem::path> find_satish_files(const std::filesystem::path& directory,
                                                     bool recursive = true);

// `path` if unused, else the first free "<stem>_N<ext>" (N = 1, 2, ...).
std::filesystem::path get_available_filename(const std::filesystem::path& path);

std::vector<uint8_t> read_file_safely(const std::filesystem::path& path,
                                      FileMode mode = FileMode::Binary);

// First min(max_bytes, file size) bytes, binary.
std::vector<uint8_t> read_file_prefix(const std::filesystem::path& path, size_t max_bytes);

// Writes to a sibling temp file, then renames it over `path`.
// On failure `path` is left as it was.
void write_file_safely(const std::filesystem::path& path,
                       const std::vector<uint8_t>& data,
                       FileMode mode = FileMode::Binary);
void write_file_safely(const std::filesystem::path& path,
                       const std::string& data,
                       FileMode mode = FileMode::Text);

// Per-file outcome of batch_operation(). errors hold "<path>: <what>".
template <typename T>
struct BatchResult {
    std::vector<T> successes;
    std::vector<std::string> errors;

    bool all_succeeded() const { return errors.empty(); }
};

namespace detail {
template <typename Op, typename... Args>
using batch_return_t = std::invoke_result_t<Op&, const std::filesystem::path&, Args&...>;

// void operations report the path they processed.
template <typename Op, typename... Args>
using batch_value_t = std::conditional_t<std::is_void_v<batch_return_t<Op, Args...>>,
                                         std::filesystem::path,
                                         std::decay_t<batch_return_t<Op, Args...>>>;
} // namespace detail

// Runs `op(file, args...)` on every file in order. A throwing file is
// recorded in errors and the loop moves on; nothing escapes.
template <typename Op, typename... Args>
BatchResult<detail::batch_value_t<Op, Args...>> batch_operation(const std::vector<std::filesystem::path>& files,
                                                                Op&& op, Args&&... args) {
    BatchResult<detail::batch_value_t<Op, Args...>> result;
    for (const auto& file : files) {
        try {
            const std::filesystem::path p = validate_path(file);
            if constexpr (std::is_void_v<detail::batch_return_t<Op, Args...>>) {
                std::invoke(op, p, args...);
                result.successes.push_back(p);
            } else {
                result.successes.push_back(std::invoke(op, p, args...));
            }
        } catch (const std::exception& e) {
            result.errors.push_back(file.string() + ": " + e.what());
        }
    }
    return result;
}

} // namespace satish
