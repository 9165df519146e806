#pragma once

#include "dupidx/file_record.hh"
#include "dupidx/index_store.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

/**
 * @brief duplicate groups as currently persisted in the index, the file
 * system is not touched
 *
 * @return digest -> paths (two or more), ordered by digest then path
 * @throws storage_error
 */
dupe_map_t list_dupes(index_store_t &store);

}  // namespace detail_v1_0_0

}  // namespace dupidx
