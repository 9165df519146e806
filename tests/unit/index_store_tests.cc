#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "dupidx/error.hh"
#include "dupidx/index_store.hh"
#include "test_dir.hh"

namespace {

dupidx::file_record_t record(const std::string &path, const std::string &digest,
                             uint64_t size = 1, int64_t modified_at = 0,
                             const std::string &kind = "txt") {
  dupidx::file_record_t rec;
  rec.path = path;
  rec.digest = digest;
  rec.kind = kind;
  rec.size = size;
  rec.modified_at = modified_at;
  return rec;
}

}  // namespace

TEST(IndexStore, UpsertReplacesRecordOfSamePath) {
  dupidx::index_store_t store(":memory:");
  store.upsert(record("/data/a.txt", "aaaa", 10, 100));
  store.upsert(record("/data/a.txt", "bbbb", 20, 200));

  EXPECT_EQ(store.record_count(), 1U);
  const auto found = store.find("/data/a.txt");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, record("/data/a.txt", "bbbb", 20, 200));
  EXPECT_FALSE(store.find("/data/missing.txt").has_value());
}

TEST(IndexStore, BatchUpsertAndDeleteByPaths) {
  dupidx::index_store_t store(":memory:");
  store.upsert(std::vector<dupidx::file_record_t>{
      record("/a", "1"), record("/b", "2"), record("/c", "3")});
  EXPECT_EQ(store.record_count(), 3U);

  store.delete_by_paths({"/a", "/c", "/not-indexed"});
  EXPECT_EQ(store.record_count(), 1U);
  EXPECT_TRUE(store.find("/b").has_value());

  store.delete_by_path("/b");
  EXPECT_EQ(store.record_count(), 0U);
}

TEST(IndexStore, DeleteByDigestExceptKeepsOnlySurvivor) {
  dupidx::index_store_t store(":memory:");
  store.upsert(record("/a", "same"));
  store.upsert(record("/b", "same"));
  store.upsert(record("/c", "same"));
  store.upsert(record("/d", "other"));

  EXPECT_EQ(store.delete_by_digest_except("same", "/b"), 2U);
  EXPECT_FALSE(store.find("/a").has_value());
  EXPECT_TRUE(store.find("/b").has_value());
  EXPECT_FALSE(store.find("/c").has_value());
  EXPECT_TRUE(store.find("/d").has_value());
}

TEST(IndexStore, ModifiedRangeIsInclusive) {
  dupidx::index_store_t store(":memory:");
  store.upsert(record("/t100", "1", 1, 100));
  store.upsert(record("/t200", "2", 1, 200));
  store.upsert(record("/t300", "3", 1, 300));

  EXPECT_EQ(store.query_by_modified_range(100, 200),
            (std::vector<std::string>{"/t100", "/t200"}));
  EXPECT_EQ(store.query_by_modified_range(200),
            (std::vector<std::string>{"/t200", "/t300"}));
  EXPECT_TRUE(store.query_by_modified_range(301).empty());
  EXPECT_EQ(store.query_modified_before(200),
            (std::vector<std::string>{"/t100"}));
}

TEST(IndexStore, SizeGreaterThanThreshold) {
  dupidx::index_store_t store(":memory:");
  store.upsert(record("/small", "1", 500, 10));
  store.upsert(record("/medium", "2", 1500, 20));
  store.upsert(record("/large", "3", 2000, 30));
  store.upsert(record("/edge", "4", 1000, 40));

  EXPECT_EQ(store.query_by_size_greater_than(1000),
            (std::vector<std::string>{"/large", "/medium"}));

  const auto detailed = store.query_by_size_greater_than_detailed(1000);
  ASSERT_EQ(detailed.size(), 2U);
  EXPECT_EQ(detailed[0].path, "/large");
  EXPECT_EQ(detailed[0].size, 2000U);
  EXPECT_EQ(detailed[0].modified_at, 30);
  EXPECT_EQ(detailed[1].path, "/medium");
}

TEST(IndexStore, SizeThresholdBeyondSignedRangeMatchesNothing) {
  dupidx::index_store_t store(":memory:");
  const auto max_size = (uint64_t)std::numeric_limits<int64_t>::max();
  store.upsert(record("/small", "1", 500));
  store.upsert(record("/max", "2", max_size));

  EXPECT_EQ(store.query_by_size_greater_than(max_size - 1),
            (std::vector<std::string>{"/max"}));
  EXPECT_TRUE(store.query_by_size_greater_than(max_size).empty());
  const uint64_t huge = 10000000000000000000ULL;
  EXPECT_TRUE(store.query_by_size_greater_than(huge).empty());
  EXPECT_TRUE(store.query_by_size_greater_than_detailed(huge).empty());
  EXPECT_TRUE(
      store.query_by_size_greater_than(std::numeric_limits<uint64_t>::max())
          .empty());
}

TEST(IndexStore, GroupedDuplicatesOnlyListsSharedDigests) {
  dupidx::index_store_t store(":memory:");
  store.upsert(record("/z", "dup"));
  store.upsert(record("/x", "dup"));
  store.upsert(record("/y", "single"));
  store.upsert(record("/w, with comma", "dup2"));
  store.upsert(record("/v", "dup2"));

  const auto dupes = store.query_grouped_duplicates();
  ASSERT_EQ(dupes.size(), 2U);
  EXPECT_EQ(dupes.at("dup"), (std::vector<std::string>{"/x", "/z"}));
  EXPECT_EQ(dupes.at("dup2"), (std::vector<std::string>{"/v",
                                                        "/w, with comma"}));
}

TEST(IndexStore, StatsOfEmptyIndex) {
  dupidx::index_store_t store(":memory:");
  const auto stats = store.aggregate_stats();
  EXPECT_EQ(stats.total_files, 0U);
  EXPECT_EQ(stats.unique_kinds, 0U);
  EXPECT_TRUE(stats.kind_distribution.empty());
  EXPECT_FALSE(stats.total_size.has_value());
}

TEST(IndexStore, StatsCountKindsAndSizes) {
  dupidx::index_store_t store(":memory:");
  store.upsert(record("/a.txt", "1", 10, 0, "txt"));
  store.upsert(record("/b.txt", "2", 20, 0, "txt"));
  store.upsert(record("/c.jpg", "3", 30, 0, "jpg"));
  store.upsert(record("/README", "4", 0, 0, "unknown"));

  const auto stats = store.aggregate_stats();
  EXPECT_EQ(stats.total_files, 4U);
  EXPECT_EQ(stats.unique_kinds, 3U);
  EXPECT_EQ(stats.kind_distribution.at("txt"), 2U);
  EXPECT_EQ(stats.kind_distribution.at("jpg"), 1U);
  EXPECT_EQ(stats.kind_distribution.at("unknown"), 1U);
  ASSERT_TRUE(stats.total_size.has_value());
  EXPECT_EQ(*stats.total_size, 60U);
}

TEST(IndexStore, PersistsAcrossReopen) {
  dupidx_test::test_dir_t dir;
  const auto db_path = dir.path() / "index.db"; {
    dupidx::index_store_t store(db_path);
    store.upsert(record("/kept", "digest", 42, 7));
  }
  dupidx::index_store_t store(db_path);
  const auto found = store.find("/kept");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->size, 42U);
  EXPECT_EQ(found->modified_at, 7);
}

TEST(IndexStore, OpenFailureIsStorageError) {
  dupidx_test::test_dir_t dir;
  try {
    dupidx::index_store_t store(dir.path() / "no" / "such" / "dir" /
                                "index.db");
    FAIL() << "expected storage_error";
  } catch (const dupidx::storage_error &e) {
    EXPECT_EQ(e.op(), "open");
  }
}
