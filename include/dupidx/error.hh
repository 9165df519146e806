#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace dupidx {

inline namespace detail_v1_0_0 {

/**
 * @brief file unreadable, unwritable or missing in the middle of an
 * operation
 */
class io_error : public std::runtime_error {
  std::filesystem::path _path;

 public:
  io_error(const std::filesystem::path &path, const std::string &what)
      : std::runtime_error(what + ": " + path.string()), _path(path) {}

  const std::filesystem::path &path() const noexcept { return _path; }
};

/**
 * @brief failure reported by the index database, tagged with the
 * operation that failed
 */
class storage_error : public std::runtime_error {
  std::string _op;

 public:
  storage_error(const std::string &op, const std::string &what)
      : std::runtime_error(op + ": " + what), _op(op) {}

  const std::string &op() const noexcept { return _op; }
};

// survivor choice that is not a number or out of range
class invalid_selection : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace detail_v1_0_0

}  // namespace dupidx
