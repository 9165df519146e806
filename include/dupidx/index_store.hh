#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "dupidx/file_record.hh"

struct sqlite3;

namespace dupidx {

inline namespace detail_v1_0_0 {

// row of query_by_size_greater_than_detailed
struct large_file_t {
  std::string path;
  uint64_t size = 0;
  int64_t modified_at = 0;
};

struct index_stats_t {
  uint64_t total_files = 0;
  uint64_t unique_kinds = 0;
  // kind -> record count
  std::map<std::string, uint64_t> kind_distribution;
  // empty if the index is empty
  std::optional<uint64_t> total_size;
};

/**
 * @brief persistent path -> metadata map stored in a SQLite database.
 *
 * Every operation either applies fully or not at all, failures throw
 * storage_error tagged with the operation name. One connection per
 * instance, not safe for concurrent use.
 */
class index_store_t {
  sqlite3 *_db = nullptr;

  void exec(const char *op, const char *sql);

 public:
  /**
   * @brief open or create the index database and its schema
   *
   * @param db_path database file, ":memory:" for a private in-memory index
   * @throws storage_error if the database cannot be opened or initialised
   */
  explicit index_store_t(const std::filesystem::path &db_path);
  ~index_store_t() noexcept;

  index_store_t(const index_store_t &) = delete;
  index_store_t(index_store_t &&) = delete;
  index_store_t &operator=(const index_store_t &) = delete;
  index_store_t &operator=(index_store_t &&) = delete;

  // insert or replace by path
  void upsert(const file_record_t &record);
  // insert or replace a batch in one transaction
  void upsert(const std::vector<file_record_t> &records);

  std::optional<file_record_t> find(const std::string &path);
  uint64_t record_count();

  void delete_by_path(const std::string &path);
  // all or none of the paths are removed
  void delete_by_paths(const std::vector<std::string> &paths);
  /**
   * @brief remove every record with digest except keep_path, atomically
   * @return number of removed records
   */
  uint64_t delete_by_digest_except(const std::string &digest,
                                   const std::string &keep_path);

  /**
   * @brief paths with modified_at >= start and, if end is given,
   * modified_at <= end
   */
  std::vector<std::string> query_by_modified_range(
      const int64_t start, const std::optional<int64_t> end = std::nullopt);
  // paths with modified_at < threshold
  std::vector<std::string> query_modified_before(const int64_t threshold);

  // paths with size > threshold
  std::vector<std::string> query_by_size_greater_than(const uint64_t threshold);
  std::vector<large_file_t> query_by_size_greater_than_detailed(
      const uint64_t threshold);

  /**
   * @brief every digest shared by two or more records with its paths
   */
  dupe_map_t query_grouped_duplicates();

  index_stats_t aggregate_stats();
};

}  // namespace detail_v1_0_0

}  // namespace dupidx
