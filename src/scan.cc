#include "dupidx/scan.hh"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <exception>
#include <system_error>
#include <utility>

#include "dupidx/config.hh"
#include "dupidx/error.hh"
#include "dupidx/log.hh"
#include "dupidx/ls_dir_rec.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace dupidx {

inline namespace detail_v1_0_0 {

namespace {

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return str;
}

file_record_t make_record(const std::filesystem::path &path,
                          const fingerprinter_t &fingerprinter,
                          hasher_t &hasher) {
  auto record = stat_record(path);
  record.digest = fingerprinter.fingerprint(path, hasher);
  return record;
}

// writes records in batches and remembers the duplicates seen
class collector_t {
  index_store_t &_store;
  std::vector<file_record_t> _pending;
  dupe_map_t _seen;

 public:
  explicit collector_t(index_store_t &store) : _store(store) {
    _pending.reserve(upsert_batch_sz);
  }

  void add(file_record_t record) {
    _seen[record.digest].emplace_back(record.path);
    _pending.emplace_back(std::move(record));
    if (_pending.size() >= upsert_batch_sz) {
      flush();
    }
  }

  void flush() {
    if (!_pending.empty()) {
      _store.upsert(_pending);
      _pending.clear();
    }
  }

  dupe_map_t dupes() {
    std::erase_if(_seen, [](const auto &kv) { return kv.second.size() < 2; });
    return std::move(_seen);
  }
};

void fingerprint_serial(const std::vector<std::filesystem::path> &file_list,
                        const fingerprinter_t &fingerprinter,
                        collector_t &collector) {
  auto hasher = make_hasher(fingerprinter.hash_algo());
  for (const auto &path : file_list) {
    file_record_t record;
    try {
      record = make_record(path, fingerprinter, *hasher);
    } catch (...) {
      // keep what was indexed before the failing file
      collector.flush();
      throw;
    }
    collector.add(std::move(record));
  }
}

void fingerprint_parallel(const std::vector<std::filesystem::path> &file_list,
                          const fingerprinter_t &fingerprinter,
                          collector_t &collector, const uint32_t max_thread) {
  const auto file_cnt = file_list.size();
  std::vector<file_record_t> records(file_cnt);
  std::vector<std::exception_ptr> errors(file_cnt);
  std::atomic<bool> abort(false);
  {
    boost::asio::thread_pool pool(max_thread);
    for (std::size_t i = 0; i < file_cnt; ++i) {
      boost::asio::post(pool, [&, i]() {
        if (abort.load(std::memory_order_relaxed)) {
          return;
        }
        try {
          auto hasher = make_hasher(fingerprinter.hash_algo());
          records[i] = make_record(file_list[i], fingerprinter, *hasher);
        } catch (...) {
          // rethrown on the calling thread below
          errors[i] = std::current_exception();
          abort.store(true, std::memory_order_relaxed);
        }
      });
    }
    pool.join();
  }

  // index in walk order, stop at the first file without a record
  for (std::size_t i = 0; i < file_cnt; ++i) {
    if (records[i].path.empty()) {
      collector.flush();
      auto first_error = std::find_if(errors.begin(), errors.end(),
                                      [](const auto &e) { return e != nullptr; });
      if (first_error == errors.end()) {
        throw io_error(file_list[i], "file not fingerprinted");
      }
      std::rethrow_exception(*first_error);
    }
    collector.add(std::move(records[i]));
  }
}

}  // namespace

bool match_ext(const std::filesystem::path &path,
               const std::vector<std::string> &ext_filters) {
  const auto name = to_lower(path.filename().string());
  return std::any_of(ext_filters.begin(), ext_filters.end(),
                     [&name](const std::string &ext) {
                       return name.ends_with(to_lower(ext));
                     });
}

dupe_map_t scan(index_store_t &store, const fingerprinter_t &fingerprinter,
                const std::filesystem::path &root_dir,
                const std::vector<std::string> &ext_filters,
                const uint32_t max_thread) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root_dir, ec)) {
    throw io_error(root_dir, "invalid target directory");
  }
  auto root = std::filesystem::absolute(root_dir, ec);
  if (ec) {
    throw io_error(root_dir, "cannot resolve directory (" + ec.message() + ")");
  }
  root = root.lexically_normal();

  // generate file list
  timer_t timer;
  std::vector<std::filesystem::path> file_list;
  oss(log_stream()) << "[log] list files..." << '\n';
  ls_dir_rec(root, file_list, [&ext_filters](const auto &path) {
    return match_ext(path, ext_filters);
  });
  oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n"
                    << "[log] file count: " << file_list.size() << '\n';

  // fingerprint and index
  oss(log_stream()) << "[log] fingerprint files (" << fingerprinter.hash_algo()
                    << ")..." << '\n';
  collector_t collector(store);
  if (max_thread <= 1 || file_list.size() < 2) {
    fingerprint_serial(file_list, fingerprinter, collector);
  } else {
    fingerprint_parallel(file_list, fingerprinter, collector, max_thread);
  }
  collector.flush();

  auto dupes = collector.dupes();
  oss(log_stream()) << "[log] elapsed: " << timer.time().count() << "ms\n"
                    << "[log] duplicate group count: " << dupes.size() << '\n';
  return dupes;
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
