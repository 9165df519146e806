#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dupidx/index_store.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

struct resolution_t {
  std::string digest;
  // group not resolved, rows of the group left as they were
  bool skipped = true;
  // removed from disk by this resolution
  std::vector<std::string> deleted;
  // set if the files were handled but the index update failed, the rows
  // stay until the group is resolved again
  std::string index_error;
};

/**
 * @brief pick a survivor for one duplicate group
 *
 * @return 1-based position into paths, std::nullopt to skip the group
 * @throws invalid_selection to skip the group
 */
using chooser_t = std::function<std::optional<std::size_t>(
    const std::string &digest, const std::vector<std::string> &paths)>;

/**
 * @brief parse a survivor choice typed by the user
 *
 * @param input decimal number, surrounding blanks are ignored
 * @param group_sz number of paths in the group
 * @return 1-based survivor position
 * @throws invalid_selection if not a number or outside [1, group_sz]
 */
std::size_t parse_selection(std::string_view input, const std::size_t group_sz);

/**
 * @brief keep paths[survivor - 1] and delete every other file of the group
 * from disk and index.
 *
 * The group is skipped without any change if survivor is empty, out of
 * range or its file is missing on disk. Files already missing count as
 * deleted. Index rows of the group are removed in one atomic step after
 * the files. A failing index update is reported in index_error, deleted
 * still lists the files gone from disk.
 */
resolution_t resolve_group(index_store_t &store, const std::string &digest,
                           const std::vector<std::string> &paths,
                           const std::optional<std::size_t> survivor);

/**
 * @brief resolve every duplicate group of the index with the survivors
 * returned by chooser. A failing group is skipped and the remaining groups
 * are still processed.
 *
 * @throws storage_error if the duplicate groups cannot be listed
 */
std::vector<resolution_t> resolve_all(index_store_t &store,
                                      const chooser_t &chooser);

}  // namespace detail_v1_0_0

}  // namespace dupidx
