#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dupidx/index_store.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

// large_file_t with modified_at rendered for display
struct large_file_info_t {
  std::string path;
  uint64_t size = 0;
  std::string modified;
};

/**
 * @brief local calendar time of an epoch timestamp, "YYYY-MM-DD HH:MM:SS"
 */
std::string format_timestamp(const int64_t epoch_sec);

/**
 * @brief indexed paths modified within [start, end], end is open if empty.
 * paths are not checked against the disk.
 */
std::vector<std::string> find_by_date(
    index_store_t &store, const int64_t start,
    const std::optional<int64_t> end = std::nullopt);

// indexed paths larger than threshold bytes
std::vector<std::string> find_large_files(index_store_t &store,
                                          const uint64_t threshold);
std::vector<large_file_info_t> find_large_files_detailed(
    index_store_t &store, const uint64_t threshold);

/**
 * @brief delete every indexed file modified before threshold from disk and
 * index. Paths already missing on disk are dropped from the index, a file
 * that cannot be removed keeps its record.
 *
 * @param threshold epoch seconds
 * @return paths removed from the index
 * @throws storage_error
 */
std::vector<std::string> clean_old_files(index_store_t &store,
                                         const int64_t threshold);

index_stats_t stats(index_store_t &store);

}  // namespace detail_v1_0_0

}  // namespace dupidx
