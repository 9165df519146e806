#include "dupidx/log.hh"

#include <fstream>
#include <iostream>

#include "dupidx/error.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

namespace {

std::ofstream log_file;

}  // namespace

std::ostream &log_stream() noexcept {
  if (log_file.is_open()) {
    return log_file;
  }
  return std::cerr;
}

void open_log(const std::filesystem::path &log_path) {
  close_log();
  log_file.open(log_path, std::ios::out | std::ios::trunc);
  if (!log_file.is_open() || !log_file.good()) {
    log_file.close();
    throw io_error(log_path, "error opening logfile");
  }
}

void close_log() noexcept {
  if (log_file.is_open()) {
    log_file.flush();
    log_file.close();
  }
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
