#include "util/errors.hpp"

namespace satish {
namespace {

std::string with_cause(const std::string& what, const std::error_code& code) {
    if (!code) return what;
    return what + ": " + code.message();
}

} // namespace

FileOperationError::FileOperationError(const std::string& what,
                                       std::filesystem::path path,
                                       std::error_code code)
    : SatishError(with_cause(what, code)), path_(std::move(path)), code_(code) {}

} // namespace satish
