#include "dupidx/maintenance.hh"

#include <ctime>
#include <string>
#include <utility>

#include "dupidx/log.hh"
#include "dupidx/rm_file.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

std::string format_timestamp(const int64_t epoch_sec) {
  const auto time = (std::time_t)epoch_sec;
  std::tm tm{};
  if (localtime_r(&time, &tm) == nullptr) {
    return std::to_string(epoch_sec);
  }
  char buf[32];
  const auto len = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf, len);
}

std::vector<std::string> find_by_date(index_store_t &store, const int64_t start,
                                      const std::optional<int64_t> end) {
  return store.query_by_modified_range(start, end);
}

std::vector<std::string> find_large_files(index_store_t &store,
                                          const uint64_t threshold) {
  return store.query_by_size_greater_than(threshold);
}

std::vector<large_file_info_t> find_large_files_detailed(
    index_store_t &store, const uint64_t threshold) {
  std::vector<large_file_info_t> infos;
  for (auto &file : store.query_by_size_greater_than_detailed(threshold)) {
    auto &info = infos.emplace_back();
    info.path = std::move(file.path);
    info.size = file.size;
    info.modified = format_timestamp(file.modified_at);
  }
  return infos;
}

std::vector<std::string> clean_old_files(index_store_t &store,
                                         const int64_t threshold) {
  std::vector<std::string> cleaned;
  for (auto &path : store.query_modified_before(threshold)) {
    switch (rm_file(path)) {
      case rm_t::removed:
        oss(log_stream()) << "[log] deleted file: " << path << '\n';
        cleaned.emplace_back(std::move(path));
        break;
      case rm_t::missing:
        cleaned.emplace_back(std::move(path));
        break;
      case rm_t::failed:
        break;
    }
  }
  store.delete_by_paths(cleaned);
  return cleaned;
}

index_stats_t stats(index_store_t &store) { return store.aggregate_stats(); }

}  // namespace detail_v1_0_0

}  // namespace dupidx
