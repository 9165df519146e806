#pragma once

#include <filesystem>
#include <functional>
#include <vector>

namespace dupidx {

inline namespace detail_v1_0_0 {

using file_filter_t = std::function<bool(const std::filesystem::path &)>;

/**
 * @brief list regular files under a directory recursively, symlinks and
 * unreadable directories are skipped with a warning
 *
 * @param dir directory path
 * @param[out] file_list files accepted by filter, in walk order
 * @param filter predicate on the file path, empty accepts every file
 */
void ls_dir_rec(const std::filesystem::path &dir,
                std::vector<std::filesystem::path> &file_list,
                const file_filter_t &filter = {});

}  // namespace detail_v1_0_0

}  // namespace dupidx
