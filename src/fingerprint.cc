#include "dupidx/fingerprint.hh"

#include <openssl/evp.h>
#include <xxhash.h>

#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "dupidx/config.hh"
#include "dupidx/error.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  constexpr char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    hex += digits[data[i] >> 4];
    hex += digits[data[i] & 0x0f];
  }
  return hex;
}

// RAII wrapper for xxhash library.
class xxh128_hasher_t : public hasher_t {
  XXH3_state_t *_state;

 public:
  xxh128_hasher_t() {
    _state = XXH3_createState();
    if (_state == nullptr) {
      throw std::runtime_error("XXH3_createState failed");
    }
    reset();
  }
  ~xxh128_hasher_t() noexcept override {
    if (_state != nullptr) {
      XXH3_freeState(_state);
    }
  }

  xxh128_hasher_t(const xxh128_hasher_t &rhs) = delete;
  xxh128_hasher_t(xxh128_hasher_t &&rhs) = delete;
  xxh128_hasher_t &operator=(const xxh128_hasher_t &rhs) = delete;
  xxh128_hasher_t &operator=(xxh128_hasher_t &&rhs) = delete;

  void reset() override {
    if (XXH3_128bits_reset_withSeed(_state, hash_seed) == XXH_ERROR) {
      throw std::runtime_error("XXH3_128bits_reset_withSeed failed");
    }
  }
  void update(const char *data, const uint64_t size) override {
    if (XXH3_128bits_update(_state, data, size) == XXH_ERROR) {
      throw std::runtime_error("XXH3_128bits_update failed");
    }
  }
  std::string hex_digest() override {
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, XXH3_128bits_digest(_state));
    return to_hex(canonical.digest, sizeof(canonical.digest));
  }
};

// RAII wrapper for libcrypto message digests.
class evp_hasher_t : public hasher_t {
  const EVP_MD *_md;
  EVP_MD_CTX *_ctx;

 public:
  explicit evp_hasher_t(const EVP_MD *md) : _md(md) {
    _ctx = EVP_MD_CTX_new();
    if (_ctx == nullptr) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    reset();
  }
  ~evp_hasher_t() noexcept override {
    if (_ctx != nullptr) {
      EVP_MD_CTX_free(_ctx);
    }
  }

  evp_hasher_t(const evp_hasher_t &rhs) = delete;
  evp_hasher_t(evp_hasher_t &&rhs) = delete;
  evp_hasher_t &operator=(const evp_hasher_t &rhs) = delete;
  evp_hasher_t &operator=(evp_hasher_t &&rhs) = delete;

  void reset() override {
    if (EVP_DigestInit_ex(_ctx, _md, nullptr) != 1) {
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }
  void update(const char *data, const uint64_t size) override {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  std::string hex_digest() override {
    unsigned char md_value[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(_ctx, md_value, &md_len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return to_hex(md_value, md_len);
  }
};

}  // namespace

std::unique_ptr<hasher_t> make_hasher(const std::string &hash_algo) {
  if (hash_algo == "xxh128") {
    return std::make_unique<xxh128_hasher_t>();
  }
  const EVP_MD *hash_type = EVP_get_digestbyname(hash_algo.c_str());
  if (hash_type == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + hash_algo);
  }
  return std::make_unique<evp_hasher_t>(hash_type);
}

fingerprinter_t::fingerprinter_t(std::string hash_algo)
    : _hash_algo(std::move(hash_algo)) {
  // fail early on unknown algorithm
  make_hasher(_hash_algo);
}

std::string fingerprinter_t::fingerprint(
    const std::filesystem::path &path) const {
  auto hasher = make_hasher(_hash_algo);
  return fingerprint(path, *hasher);
}

std::string fingerprinter_t::fingerprint(const std::filesystem::path &path,
                                         hasher_t &hasher) const {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw io_error(path, "cannot open file");
  }
  hasher.reset();
  std::vector<char> buf(chunk_sz);
  while (true) {
    ifs.read(buf.data(), (std::streamsize)buf.size());
    const auto read_len = ifs.gcount();
    if (read_len > 0) {
      hasher.update(buf.data(), (uint64_t)read_len);
    }
    if (ifs.bad()) {
      throw io_error(path, "read error");
    }
    if (!ifs) {
      // short read, end of file
      break;
    }
  }
  return hasher.hex_digest();
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
