#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace dupidx {

inline namespace detail_v1_0_0 {

// 4KiB, read size of the fingerprinter
constexpr auto chunk_sz = 4096UL;

// records written per index transaction during a scan
constexpr auto upsert_batch_sz = 256UL;

constexpr auto hash_seed = 0x178ee47c0190226cUL;

constexpr auto default_db_file = "dupidx.db";
constexpr auto default_hash_algo = "xxh128";

// kind of a file without extension
constexpr auto unknown_kind = "unknown";

constexpr uint32_t max_jobs = 256;

/**
 * @brief runtime settings of one invocation, filled by the command line
 * tool and handed down explicitly
 */
struct config_t {
  std::filesystem::path db_path = default_db_file;
  std::string hash_algo = default_hash_algo;
  uint32_t max_thread = 1;
  // empty logs to stderr
  std::filesystem::path log_path;
};

}  // namespace detail_v1_0_0

}  // namespace dupidx
