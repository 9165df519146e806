#include "dupidx/rm_file.hh"

#include <system_error>

#include "dupidx/log.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

rm_t rm_file(const std::filesystem::path &path) noexcept {
  std::error_code ec;
  const auto status = std::filesystem::symlink_status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return rm_t::missing;
  }
  if (!std::filesystem::status_known(status)) {
    oss(log_stream()) << "[err] failed to remove: " << path << " - "
                      << ec.message() << '\n';
    return rm_t::failed;
  }
  if (std::filesystem::is_directory(status)) {
    oss(log_stream()) << "[err] failed to remove: " << path
                      << " - is a directory" << '\n';
    return rm_t::failed;
  }
  if (!std::filesystem::remove(path, ec) || ec) {
    if (!ec) {
      // vanished between the checks
      return rm_t::missing;
    }
    oss(log_stream()) << "[err] failed to remove: " << path << " - "
                      << ec.message() << '\n';
    return rm_t::failed;
  }
  return rm_t::removed;
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
