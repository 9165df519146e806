#pragma once

#include <filesystem>
#include <ostream>
#include <version>

#if __cpp_lib_syncbuf >= 201803L
#include <syncstream>
#else
#include <mutex>
#endif

namespace dupidx {

inline namespace detail_v1_0_0 {

#if __cpp_lib_syncbuf >= 201803L

// osyncstream is provided
using oss = std::osyncstream;

#else

// self-implemented osyncstream
class oss {
 private:
  inline static std::mutex _mtx;
  std::ostream &_os;

 public:
  oss() = delete;
  inline oss(std::ostream &os) : _os(os) { _mtx.lock(); }
  inline ~oss() {
    _os.flush();
    _mtx.unlock();
  }

  oss(const oss &) = delete;
  oss(oss &&) = delete;
  oss &operator=(const oss &) = delete;
  oss &operator=(oss &&) = delete;

  template <typename Tp>
  inline oss &operator<<(const Tp &val) {
    _os << val;
    return *this;
  }
  inline operator std::ostream &() noexcept { return _os; }
};

#endif

/**
 * @brief stream for [log], [warn] and [err] lines, std::cerr unless a log
 * file was opened. Write through oss, e.g.
 * oss(log_stream()) << "[warn] ..." << '\n';
 */
std::ostream &log_stream() noexcept;

/**
 * @brief redirect log_stream() to a truncated file
 *
 * @throws io_error if the file cannot be opened
 */
void open_log(const std::filesystem::path &log_path);

/**
 * @brief flush and close the log file, log_stream() falls back to std::cerr
 */
void close_log() noexcept;

}  // namespace detail_v1_0_0

}  // namespace dupidx
