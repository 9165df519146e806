#include "dupidx/file_record.hh"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>

#include "dupidx/config.hh"
#include "dupidx/error.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

std::string kind_of(const std::filesystem::path &path) {
  auto ext = path.filename().extension().string();
  // ".bashrc" or "name." have no usable extension
  if (ext.size() <= 1) {
    return unknown_kind;
  }
  ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return ext;
}

int64_t to_epoch(const std::filesystem::file_time_type ftime) noexcept {
  const auto sys_time = std::chrono::file_clock::to_sys(ftime);
  return std::chrono::floor<std::chrono::seconds>(sys_time.time_since_epoch())
      .count();
}

file_record_t stat_record(const std::filesystem::path &path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw io_error(path, "cannot read file size (" + ec.message() + ")");
  }
  const auto ftime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    throw io_error(path, "cannot read modification time (" + ec.message() + ")");
  }
  file_record_t record;
  record.path = path.string();
  record.kind = kind_of(path);
  record.size = size;
  record.modified_at = to_epoch(ftime);
  return record;
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
