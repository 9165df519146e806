#pragma once

#include <cstdint>
#include <string_view>

namespace dupidx {

inline namespace detail_v1_0_0 {

/**
 * @brief parse a size threshold into a byte count, ex. 1500, 4KB, 16MiB,
 * 8Kb (bits). plain numbers are bytes.
 *
 * @throws std::invalid_argument if not a valid size string
 * @throws std::out_of_range if the size does not fit into 64 bits
 */
uint64_t parse_size(std::string_view size_str);

}  // namespace detail_v1_0_0

}  // namespace dupidx
