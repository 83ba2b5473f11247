#ifndef IFREADER_UTILS_FILESYSTEM_H
#define IFREADER_UTILS_FILESYSTEM_H

#include <filesystem>
namespace fs = std::filesystem;

#include <cstdint>
#include <string>

namespace ifreader::utils {

/**
 * Get the size of a regular file in bytes
 * @param path Path to the file
 * @return file size in bytes
 * @throws fs::filesystem_error if the file cannot be inspected
 */
inline std::uint64_t file_size(const std::string &path) {
    return static_cast<std::uint64_t>(fs::file_size(fs::path(path)));
}

}  // namespace ifreader::utils

#endif  // IFREADER_UTILS_FILESYSTEM_H
