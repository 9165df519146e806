#include "dupidx/ls_dir_rec.hh"

#include <system_error>

#include "dupidx/log.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

void ls_dir_rec(const std::filesystem::path &dir,
                std::vector<std::filesystem::path> &file_list,
                const file_filter_t &filter) {
  std::vector<std::filesystem::path> sub_dirs;
  try {
    for (const auto &dir_entry : std::filesystem::directory_iterator(dir)) {
      std::error_code ec;
      if (dir_entry.is_symlink(ec)) {
        // symlink, skip
        oss(log_stream()) << "[warn] skip symlink: " << dir_entry.path()
                          << '\n';

      } else if (dir_entry.is_directory(ec)) {
        // directory, visit after this one
        sub_dirs.emplace_back(dir_entry.path());

      } else if (dir_entry.is_regular_file(ec)) {
        // regular file, add to list
        if (!filter || filter(dir_entry.path())) {
          file_list.emplace_back(dir_entry.path());
        }

      } else if (ec) {
        // error reading file status, skip
        oss(log_stream()) << "[warn] skip file: " << dir_entry.path() << " - "
                          << ec.message() << '\n';

      } else {
        // other file type, skip
        oss(log_stream()) << "[warn] skip unsupported file: "
                          << dir_entry.path() << '\n';
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    // error iterating directory, skip
    oss(log_stream()) << "[warn] skip directory: " << dir << " - "
                      << e.code().message() << '\n';
  }

  for (const auto &sub_dir : sub_dirs) {
    ls_dir_rec(sub_dir, file_list, filter);
  }
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
