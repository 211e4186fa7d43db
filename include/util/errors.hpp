#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace satish {

// Base of every error thrown by the library.
class SatishError : public std::runtime_error {
public:
    explicit SatishError(const std::string& what) : std::runtime_error(what) {}
};

// Header or payload violates the container format.
// field() names the offending header field ("magic", "width", ...) or
// "header"/"payload" for structural problems.
class InvalidFormat : public SatishError {
public:
    InvalidFormat(std::string field, const std::string& what)
        : SatishError(what), field_(std::move(field)) {}

    const std::string& field() const { return field_; }
private:
    std::string field_;
};

// Filesystem-facing failure. code() is empty when the cause was not an OS error.
class FileOperationError : public SatishError {
public:
    FileOperationError(const std::string& what,
                       std::filesystem::path path,
                       std::error_code code = {});

    const std::filesystem::path& path() const { return path_; }
    const std::error_code& code() const { return code_; }
private:
    std::filesystem::path path_;
    std::error_code code_;
};

} // namespace satish
