#pragma once

#include <filesystem>

namespace dupidx {

inline namespace detail_v1_0_0 {

enum class rm_t {
  removed,  // file removed from disk
  missing,  // nothing to remove
  failed    // file still on disk, error logged
};

/**
 * @brief remove a file if it exists, failures are logged not thrown
 */
rm_t rm_file(const std::filesystem::path &path) noexcept;

}  // namespace detail_v1_0_0

}  // namespace dupidx
