#include <gtest/gtest.h>

#include <ctime>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "dupidx/fingerprint.hh"
#include "dupidx/index_store.hh"
#include "dupidx/maintenance.hh"
#include "dupidx/parse_size.hh"
#include "dupidx/scan.hh"
#include "test_dir.hh"

namespace {

// three scanned files modified at 1000, 2000 and 3000
struct AgedTree {
  dupidx_test::test_dir_t dir;
  dupidx::index_store_t store{":memory:"};
  std::string old_file = dir.write("old.log", "old");
  std::string mid_file = dir.write("mid.log", "mid");
  std::string new_file = dir.write("new.log", "new");

  AgedTree() {
    dir.set_mtime("old.log", 1000);
    dir.set_mtime("mid.log", 2000);
    dir.set_mtime("new.log", 3000);
    dupidx::fingerprinter_t fingerprinter("xxh128");
    dupidx::scan(store, fingerprinter, dir.path(), {".log"});
  }
};

dupidx::file_record_t sized(const std::string &path, uint64_t size) {
  dupidx::file_record_t rec;
  rec.path = path;
  rec.digest = path;
  rec.kind = "bin";
  rec.size = size;
  rec.modified_at = 86400;
  return rec;
}

}  // namespace

TEST(Maintenance, FindByDateUsesInclusiveRange) {
  AgedTree tree;
  EXPECT_EQ(dupidx::find_by_date(tree.store, 1000, 2000),
            (std::vector<std::string>{tree.mid_file, tree.old_file}));
  EXPECT_EQ(dupidx::find_by_date(tree.store, 2000),
            (std::vector<std::string>{tree.mid_file, tree.new_file}));
  EXPECT_EQ(dupidx::find_by_date(tree.store, 1001, 1999),
            std::vector<std::string>{});
}

TEST(Maintenance, FindByDateDoesNotCheckTheDisk) {
  AgedTree tree;
  std::filesystem::remove(tree.old_file);
  EXPECT_EQ(dupidx::find_by_date(tree.store, 0, 1000),
            (std::vector<std::string>{tree.old_file}));
}

TEST(Maintenance, FindLargeFiles) {
  dupidx::index_store_t store(":memory:");
  store.upsert(sized("/500", 500));
  store.upsert(sized("/1500", 1500));
  store.upsert(sized("/2000", 2000));

  EXPECT_EQ(dupidx::find_large_files(store, 1000),
            (std::vector<std::string>{"/1500", "/2000"}));

  const auto detailed = dupidx::find_large_files_detailed(store, 1000);
  ASSERT_EQ(detailed.size(), 2U);
  EXPECT_EQ(detailed[0].path, "/1500");
  EXPECT_EQ(detailed[0].size, 1500U);
  EXPECT_EQ(detailed[0].modified, dupidx::format_timestamp(86400));
}

TEST(Maintenance, ThresholdAboveAnyStoredSizeFindsNothing) {
  dupidx::index_store_t store(":memory:");
  store.upsert(sized("/500", 500));
  store.upsert(sized("/2000", 2000));

  const auto huge = dupidx::parse_size("10000000000000000000");
  EXPECT_TRUE(dupidx::find_large_files(store, huge).empty());
  EXPECT_TRUE(dupidx::find_large_files_detailed(store, huge).empty());
  EXPECT_TRUE(dupidx::find_large_files(store,
                                       dupidx::parse_size("9EiB")).empty());
}

TEST(Maintenance, FormatsTimestampsAsLocalCalendarTime) {
  const auto formatted = dupidx::format_timestamp(1700000000);
  const std::regex calendar(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})");
  EXPECT_TRUE(std::regex_match(formatted, calendar)) << formatted;

  const std::time_t time = 1700000000;
  std::tm tm{};
  localtime_r(&time, &tm);
  EXPECT_EQ(formatted.substr(0, 4), std::to_string(tm.tm_year + 1900));
}

TEST(Maintenance, CleanOldFilesRemovesFilesBelowThreshold) {
  AgedTree tree;
  const auto cleaned = dupidx::clean_old_files(tree.store, 2000);

  EXPECT_EQ(cleaned, (std::vector<std::string>{tree.old_file}));
  EXPECT_FALSE(tree.dir.exists("old.log"));
  EXPECT_TRUE(tree.dir.exists("mid.log"));
  EXPECT_TRUE(tree.dir.exists("new.log"));
  EXPECT_FALSE(tree.store.find(tree.old_file).has_value());
  for (const auto &path : dupidx::find_by_date(tree.store, 0)) {
    EXPECT_GE(tree.store.find(path)->modified_at, 2000) << path;
  }
}

TEST(Maintenance, CleanOldFilesDropsRecordsOfMissingFiles) {
  AgedTree tree;
  std::filesystem::remove(tree.mid_file);

  const auto cleaned = dupidx::clean_old_files(tree.store, 3000);
  EXPECT_EQ(cleaned, (std::vector<std::string>{tree.mid_file, tree.old_file}));
  EXPECT_EQ(tree.store.record_count(), 1U);
  EXPECT_TRUE(tree.store.find(tree.new_file).has_value());
  EXPECT_TRUE(tree.dir.exists("new.log"));
}

TEST(Maintenance, CleanOldFilesKeepsRecordsOfFilesThatCannotBeRemoved) {
  AgedTree tree;
  // a non-empty directory indexed as an old file is not removable
  tree.dir.write("stuck.log/inner", "x");
  const auto stuck = tree.dir.file("stuck.log");
  tree.store.upsert(dupidx::file_record_t{stuck, "d", "log", 1, 500});

  const auto cleaned = dupidx::clean_old_files(tree.store, 2000);
  EXPECT_EQ(cleaned, (std::vector<std::string>{tree.old_file}));
  EXPECT_FALSE(tree.dir.exists("old.log"));
  EXPECT_FALSE(tree.store.find(tree.old_file).has_value());
  EXPECT_TRUE(tree.dir.exists("stuck.log/inner"));
  EXPECT_TRUE(tree.store.find(stuck).has_value());
  EXPECT_EQ(tree.store.record_count(), 3U);
}

TEST(Maintenance, StatsOfEmptyIndex) {
  dupidx::index_store_t store(":memory:");
  const auto stats = dupidx::stats(store);
  EXPECT_EQ(stats.total_files, 0U);
  EXPECT_EQ(stats.unique_kinds, 0U);
  EXPECT_TRUE(stats.kind_distribution.empty());
  EXPECT_FALSE(stats.total_size.has_value());
}

TEST(Maintenance, StatsAfterScan) {
  AgedTree tree;
  const auto stats = dupidx::stats(tree.store);
  EXPECT_EQ(stats.total_files, 3U);
  EXPECT_EQ(stats.unique_kinds, 1U);
  EXPECT_EQ(stats.kind_distribution.at("log"), 3U);
  EXPECT_EQ(stats.total_size, std::optional<uint64_t>{9});
}
