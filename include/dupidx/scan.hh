#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "dupidx/file_record.hh"
#include "dupidx/fingerprint.hh"
#include "dupidx/index_store.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

/**
 * @brief true if the file name ends with one of the filters, ignoring case
 *
 * @param ext_filters suffixes, ex. ".txt", "jpg"
 */
bool match_ext(const std::filesystem::path &path,
               const std::vector<std::string> &ext_filters);

/**
 * @brief index every regular file under root_dir whose name ends with one
 * of ext_filters and report the duplicates seen during this walk.
 *
 * Records are upserted in walk order. A file that cannot be fingerprinted
 * aborts the scan, records written before it stay in the index.
 *
 * @param store index receiving the records
 * @param fingerprinter content digest
 * @param root_dir directory to search
 * @param ext_filters file name suffixes, matched case-insensitively
 * @param max_thread threads used for fingerprinting
 * @return digest -> paths, only digests seen more than once
 * @throws io_error if root_dir is not a directory or a file is unreadable
 * @throws storage_error if the index cannot be written
 */
dupe_map_t scan(index_store_t &store, const fingerprinter_t &fingerprinter,
                const std::filesystem::path &root_dir,
                const std::vector<std::string> &ext_filters,
                const uint32_t max_thread = 1);

}  // namespace detail_v1_0_0

}  // namespace dupidx
