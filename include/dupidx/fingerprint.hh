#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace dupidx {

inline namespace detail_v1_0_0 {

// incremental hash accumulator, one per thread
class hasher_t {
 public:
  virtual ~hasher_t() = default;

  virtual void reset() = 0;
  virtual void update(const char *data, const uint64_t size) = 0;
  // lowercase hex of the final digest
  virtual std::string hex_digest() = 0;
};

/**
 * @brief create a hasher for a digest algorithm
 *
 * @param hash_algo "xxh128" or a digest name supported by libcrypto
 * (md5, sha1, sha256, ...)
 * @throws std::invalid_argument if the algorithm is unknown
 */
std::unique_ptr<hasher_t> make_hasher(const std::string &hash_algo);

/**
 * @brief content fingerprint of files, reads in chunk_sz blocks so memory
 * use does not depend on file size. fingerprint() is safe to call from
 * several threads at once.
 */
class fingerprinter_t {
  std::string _hash_algo;

 public:
  /**
   * @throws std::invalid_argument if the algorithm is unknown
   */
  explicit fingerprinter_t(std::string hash_algo);
  virtual ~fingerprinter_t() = default;

  fingerprinter_t(const fingerprinter_t &) = default;
  fingerprinter_t(fingerprinter_t &&) = default;
  fingerprinter_t &operator=(const fingerprinter_t &) = default;
  fingerprinter_t &operator=(fingerprinter_t &&) = default;

  /**
   * @brief digest of the file content as lowercase hex
   *
   * @throws io_error if the file cannot be opened or a read fails
   */
  std::string fingerprint(const std::filesystem::path &path) const;

  /**
   * @brief same as fingerprint(path) reusing a caller owned hasher, the
   * step scan() runs for every file
   */
  virtual std::string fingerprint(const std::filesystem::path &path,
                                  hasher_t &hasher) const;

  inline const std::string &hash_algo() const noexcept { return _hash_algo; }
};

}  // namespace detail_v1_0_0

}  // namespace dupidx
