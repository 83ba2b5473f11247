#ifndef IFREADER_COMMON_CONSTANTS_H
#define IFREADER_COMMON_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace ifreader::constants {
namespace indexer {
// Smallest byte range that is split further when indexing in parallel
static constexpr std::uint64_t MIN_FORK_THRESHOLD = 1000000;  // ~1MB
static constexpr std::size_t DEFAULT_SPLIT_COUNT = 1;
}  // namespace indexer

namespace reader {
static constexpr std::size_t DEFAULT_BUFFER_SIZE = 8192;  // 8KB
static constexpr std::size_t LINE_RESERVE_SIZE = 256;
static constexpr const char *DEFAULT_ENCODING = "UTF-8";
}  // namespace reader
}  // namespace ifreader::constants

#endif  // IFREADER_COMMON_CONSTANTS_H
