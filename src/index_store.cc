#include "dupidx/index_store.hh"

#include <sqlite3.h>

#include <limits>
#include <string_view>
#include <utility>

#include "dupidx/error.hh"
#include "dupidx/log.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

namespace {

constexpr auto schema_sql =
    "CREATE TABLE IF NOT EXISTS file_info ("
    "path TEXT PRIMARY KEY,"
    "hash TEXT,"
    "file_type TEXT,"
    "size INTEGER,"
    "last_modified INTEGER);"
    "CREATE INDEX IF NOT EXISTS ix_file_info_hash ON file_info (hash);"
    "CREATE INDEX IF NOT EXISTS ix_file_info_last_modified "
    "ON file_info (last_modified);";

// RAII wrapper for prepared statements.
class stmt_t {
  sqlite3 *_db;
  sqlite3_stmt *_stmt = nullptr;
  const char *_op;

  [[noreturn]] void fail() const {
    throw storage_error(_op, sqlite3_errmsg(_db));
  }

 public:
  stmt_t(sqlite3 *db, const char *op, std::string_view sql)
      : _db(db), _op(op) {
    if (sqlite3_prepare_v2(_db, sql.data(), (int)sql.size(), &_stmt,
                           nullptr) != SQLITE_OK) {
      fail();
    }
  }
  ~stmt_t() noexcept { sqlite3_finalize(_stmt); }

  stmt_t(const stmt_t &) = delete;
  stmt_t(stmt_t &&) = delete;
  stmt_t &operator=(const stmt_t &) = delete;
  stmt_t &operator=(stmt_t &&) = delete;

  // 1-based parameter index
  void bind(const int idx, const std::string &val) {
    if (sqlite3_bind_text(_stmt, idx, val.data(), (int)val.size(),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
      fail();
    }
  }
  void bind(const int idx, const int64_t val) {
    if (sqlite3_bind_int64(_stmt, idx, (sqlite3_int64)val) != SQLITE_OK) {
      fail();
    }
  }

  /**
   * @return true if a row is available, false when done
   */
  bool step() {
    const auto rc = sqlite3_step(_stmt);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc != SQLITE_DONE) {
      fail();
    }
    return false;
  }

  // run a statement that yields no rows, ready for the next binding after
  void run() {
    step();
    reset();
  }

  void reset() {
    sqlite3_reset(_stmt);
    sqlite3_clear_bindings(_stmt);
  }

  std::string text(const int col) const {
    const auto *val = sqlite3_column_text(_stmt, col);
    if (val == nullptr) {
      return {};
    }
    return std::string(reinterpret_cast<const char *>(val),
                       (std::size_t)sqlite3_column_bytes(_stmt, col));
  }
  int64_t int64(const int col) const {
    return (int64_t)sqlite3_column_int64(_stmt, col);
  }
  bool is_null(const int col) const {
    return sqlite3_column_type(_stmt, col) == SQLITE_NULL;
  }
};

// transaction scope, rolled back unless committed
class txn_t {
  sqlite3 *_db;
  const char *_op;
  bool _done = false;

 public:
  txn_t(sqlite3 *db, const char *op, const char *begin_sql = "BEGIN IMMEDIATE")
      : _db(db), _op(op) {
    if (sqlite3_exec(_db, begin_sql, nullptr, nullptr, nullptr) != SQLITE_OK) {
      throw storage_error(_op, sqlite3_errmsg(_db));
    }
  }
  ~txn_t() noexcept {
    if (!_done &&
        sqlite3_exec(_db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
      oss(log_stream()) << "[err] rollback failed: " << _op << " - "
                        << sqlite3_errmsg(_db) << '\n';
    }
  }

  txn_t(const txn_t &) = delete;
  txn_t(txn_t &&) = delete;
  txn_t &operator=(const txn_t &) = delete;
  txn_t &operator=(txn_t &&) = delete;

  void commit() {
    if (sqlite3_exec(_db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
      throw storage_error(_op, sqlite3_errmsg(_db));
    }
    _done = true;
  }
};

constexpr auto upsert_sql =
    "INSERT OR REPLACE INTO file_info "
    "(path, hash, file_type, size, last_modified) VALUES (?, ?, ?, ?, ?)";

void bind_record(stmt_t &stmt, const file_record_t &record) {
  stmt.bind(1, record.path);
  stmt.bind(2, record.digest);
  stmt.bind(3, record.kind);
  stmt.bind(4, (int64_t)record.size);
  stmt.bind(5, record.modified_at);
}

// sizes are stored as signed 64-bit, nothing is larger than this
constexpr auto max_stored_size =
    (uint64_t)std::numeric_limits<int64_t>::max();

std::vector<std::string> collect_paths(stmt_t &stmt) {
  std::vector<std::string> paths;
  while (stmt.step()) {
    paths.emplace_back(stmt.text(0));
  }
  return paths;
}

}  // namespace

index_store_t::index_store_t(const std::filesystem::path &db_path) {
  const auto rc =
      sqlite3_open_v2(db_path.c_str(), &_db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    // a handle is returned for most failures and must be closed
    std::string msg = _db != nullptr ? sqlite3_errmsg(_db) : sqlite3_errstr(rc);
    sqlite3_close(_db);
    _db = nullptr;
    throw storage_error("open", msg + " (" + db_path.string() + ")");
  }
  try {
    exec("create schema", schema_sql);
  } catch (const storage_error &) {
    sqlite3_close(_db);
    _db = nullptr;
    throw;
  }
}

index_store_t::~index_store_t() noexcept {
  if (_db != nullptr && sqlite3_close(_db) != SQLITE_OK) {
    oss(log_stream()) << "[err] failed to close index: " << sqlite3_errmsg(_db)
                      << '\n';
  }
}

void index_store_t::exec(const char *op, const char *sql) {
  char *errmsg = nullptr;
  if (sqlite3_exec(_db, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
    std::string msg = errmsg != nullptr ? errmsg : sqlite3_errmsg(_db);
    sqlite3_free(errmsg);
    throw storage_error(op, msg);
  }
}

void index_store_t::upsert(const file_record_t &record) {
  stmt_t stmt(_db, "upsert", upsert_sql);
  bind_record(stmt, record);
  stmt.run();
}

void index_store_t::upsert(const std::vector<file_record_t> &records) {
  txn_t txn(_db, "upsert batch");
  stmt_t stmt(_db, "upsert batch", upsert_sql);
  for (const auto &record : records) {
    bind_record(stmt, record);
    stmt.run();
  }
  txn.commit();
}

std::optional<file_record_t> index_store_t::find(const std::string &path) {
  stmt_t stmt(_db, "find",
              "SELECT path, hash, file_type, size, last_modified "
              "FROM file_info WHERE path = ?");
  stmt.bind(1, path);
  if (!stmt.step()) {
    return std::nullopt;
  }
  file_record_t record;
  record.path = stmt.text(0);
  record.digest = stmt.text(1);
  record.kind = stmt.text(2);
  record.size = (uint64_t)stmt.int64(3);
  record.modified_at = stmt.int64(4);
  return record;
}

uint64_t index_store_t::record_count() {
  stmt_t stmt(_db, "record count", "SELECT COUNT(*) FROM file_info");
  stmt.step();
  return (uint64_t)stmt.int64(0);
}

void index_store_t::delete_by_path(const std::string &path) {
  stmt_t stmt(_db, "delete by path", "DELETE FROM file_info WHERE path = ?");
  stmt.bind(1, path);
  stmt.run();
}

void index_store_t::delete_by_paths(const std::vector<std::string> &paths) {
  if (paths.empty()) {
    return;
  }
  txn_t txn(_db, "delete by paths");
  stmt_t stmt(_db, "delete by paths", "DELETE FROM file_info WHERE path = ?");
  for (const auto &path : paths) {
    stmt.bind(1, path);
    stmt.run();
  }
  txn.commit();
}

uint64_t index_store_t::delete_by_digest_except(const std::string &digest,
                                                const std::string &keep_path) {
  // single statement, atomic on its own
  stmt_t stmt(_db, "delete by digest except",
              "DELETE FROM file_info WHERE hash = ? AND path != ?");
  stmt.bind(1, digest);
  stmt.bind(2, keep_path);
  stmt.run();
  return (uint64_t)sqlite3_changes(_db);
}

std::vector<std::string> index_store_t::query_by_modified_range(
    const int64_t start, const std::optional<int64_t> end) {
  if (end) {
    stmt_t stmt(_db, "query by modified range",
                "SELECT path FROM file_info "
                "WHERE last_modified >= ? AND last_modified <= ? ORDER BY path");
    stmt.bind(1, start);
    stmt.bind(2, *end);
    return collect_paths(stmt);
  }
  stmt_t stmt(_db, "query by modified range",
              "SELECT path FROM file_info WHERE last_modified >= ? "
              "ORDER BY path");
  stmt.bind(1, start);
  return collect_paths(stmt);
}

std::vector<std::string> index_store_t::query_modified_before(
    const int64_t threshold) {
  stmt_t stmt(_db, "query modified before",
              "SELECT path FROM file_info WHERE last_modified < ? "
              "ORDER BY path");
  stmt.bind(1, threshold);
  return collect_paths(stmt);
}

std::vector<std::string> index_store_t::query_by_size_greater_than(
    const uint64_t threshold) {
  if (threshold >= max_stored_size) {
    return {};
  }
  stmt_t stmt(_db, "query by size",
              "SELECT path FROM file_info WHERE size > ? ORDER BY path");
  stmt.bind(1, (int64_t)threshold);
  return collect_paths(stmt);
}

std::vector<large_file_t> index_store_t::query_by_size_greater_than_detailed(
    const uint64_t threshold) {
  if (threshold >= max_stored_size) {
    return {};
  }
  stmt_t stmt(_db, "query by size detailed",
              "SELECT path, size, last_modified FROM file_info "
              "WHERE size > ? ORDER BY path");
  stmt.bind(1, (int64_t)threshold);
  std::vector<large_file_t> files;
  while (stmt.step()) {
    auto &file = files.emplace_back();
    file.path = stmt.text(0);
    file.size = (uint64_t)stmt.int64(1);
    file.modified_at = stmt.int64(2);
  }
  return files;
}

dupe_map_t index_store_t::query_grouped_duplicates() {
  stmt_t stmt(_db, "query grouped duplicates",
              "SELECT hash, path FROM file_info WHERE hash IN "
              "(SELECT hash FROM file_info GROUP BY hash HAVING COUNT(*) > 1) "
              "ORDER BY hash, path");
  dupe_map_t dupe_map;
  while (stmt.step()) {
    dupe_map[stmt.text(0)].emplace_back(stmt.text(1));
  }
  return dupe_map;
}

index_stats_t index_store_t::aggregate_stats() {
  // one read transaction so the numbers agree with each other
  txn_t txn(_db, "aggregate stats", "BEGIN");
  index_stats_t stats;
  {
    stmt_t stmt(_db, "aggregate stats",
                "SELECT COUNT(*), COUNT(DISTINCT file_type), SUM(size) "
                "FROM file_info");
    stmt.step();
    stats.total_files = (uint64_t)stmt.int64(0);
    stats.unique_kinds = (uint64_t)stmt.int64(1);
    if (!stmt.is_null(2)) {
      stats.total_size = (uint64_t)stmt.int64(2);
    }
  }
  {
    stmt_t stmt(_db, "aggregate stats",
                "SELECT file_type, COUNT(*) FROM file_info GROUP BY file_type "
                "ORDER BY file_type");
    while (stmt.step()) {
      stats.kind_distribution.emplace(stmt.text(0), (uint64_t)stmt.int64(1));
    }
  }
  txn.commit();
  return stats;
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
