#ifndef BACKSCAN_COMMON_CONSTANTS_H
#define BACKSCAN_COMMON_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace backscan::constants {
namespace reader {
static constexpr std::size_t DEFAULT_CHUNK_SIZE = 1024;  // 1KB
static constexpr std::size_t DEFAULT_MAX_BUFFER_SIZE =
    1 * 1024 * 1024;  // 1MB
}  // namespace reader
}  // namespace backscan::constants

#endif  // BACKSCAN_COMMON_CONSTANTS_H
