#include "dupidx/list_dupes.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

dupe_map_t list_dupes(index_store_t &store) {
  return store.query_grouped_duplicates();
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
