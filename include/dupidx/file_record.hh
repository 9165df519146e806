#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace dupidx {

inline namespace detail_v1_0_0 {

// one row of the index, keyed by path
struct file_record_t {
  std::string path;
  std::string digest;
  std::string kind;
  uint64_t size = 0;
  // seconds since epoch
  int64_t modified_at = 0;

  bool operator==(const file_record_t &rhs) const = default;
};

// digest -> paths sharing it, ordered by digest then path
using dupe_map_t = std::map<std::string, std::vector<std::string>>;

/**
 * @brief lowercase extension of the file name without the dot,
 * "unknown" if the name has none
 */
std::string kind_of(const std::filesystem::path &path);

/**
 * @brief size and modification time (epoch seconds) of a regular file,
 * digest is left empty
 *
 * @throws io_error if the status cannot be read
 */
file_record_t stat_record(const std::filesystem::path &path);

/**
 * @brief convert a file time to seconds since epoch
 */
int64_t to_epoch(const std::filesystem::file_time_type ftime) noexcept;

}  // namespace detail_v1_0_0

}  // namespace dupidx
