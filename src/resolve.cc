#include "dupidx/resolve.hh"

#include <charconv>
#include <filesystem>
#include <system_error>

#include "dupidx/error.hh"
#include "dupidx/list_dupes.hh"
#include "dupidx/log.hh"
#include "dupidx/rm_file.hh"

namespace dupidx {

inline namespace detail_v1_0_0 {

namespace {

// true if removing path would remove the survivor's content too
bool aliases_survivor(const std::filesystem::path &path,
                      const std::filesystem::path &keep) {
  std::error_code ec;
  if (!std::filesystem::equivalent(path, keep, ec) || ec) {
    return false;
  }
  const auto link_cnt = std::filesystem::hard_link_count(keep, ec);
  return ec || link_cnt < 2;
}

}  // namespace

std::size_t parse_selection(std::string_view input,
                            const std::size_t group_sz) {
  const auto first = input.find_first_not_of(" \t\r\n");
  const auto last = input.find_last_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    throw invalid_selection("empty selection");
  }
  input = input.substr(first, last - first + 1);

  std::size_t choice = 0;
  const auto [ptr, ec] =
      std::from_chars(input.data(), input.data() + input.size(), choice);
  if (ec != std::errc() || ptr != input.data() + input.size()) {
    throw invalid_selection("invalid input: " + std::string(input));
  }
  if (choice < 1 || choice > group_sz) {
    throw invalid_selection("invalid choice: " + std::string(input) +
                            " (1-" + std::to_string(group_sz) + ")");
  }
  return choice;
}

resolution_t resolve_group(index_store_t &store, const std::string &digest,
                           const std::vector<std::string> &paths,
                           const std::optional<std::size_t> survivor) {
  resolution_t result;
  result.digest = digest;
  if (!survivor) {
    oss(log_stream()) << "[log] skip group: " << digest << '\n';
    return result;
  }
  if (*survivor < 1 || *survivor > paths.size()) {
    oss(log_stream()) << "[warn] invalid choice " << *survivor
                      << ", skip group: " << digest << '\n';
    return result;
  }

  const auto &keep_path = paths[*survivor - 1];
  std::error_code ec;
  if (!std::filesystem::is_regular_file(keep_path, ec)) {
    oss(log_stream()) << "[warn] survivor missing, skip group: " << digest
                      << " - " << keep_path << '\n';
    return result;
  }

  // remove files first, the index follows in one step
  std::vector<std::string> handled;
  bool all_handled = true;
  for (std::size_t i = 0; i < paths.size(); ++i) {
    const auto &path = paths[i];
    if (i == *survivor - 1 || path == keep_path) {
      continue;
    }
    if (aliases_survivor(path, keep_path)) {
      oss(log_stream()) << "[warn] same file as survivor, keep: " << path
                        << '\n';
      handled.emplace_back(path);
      continue;
    }
    switch (rm_file(path)) {
      case rm_t::removed:
        oss(log_stream()) << "[log] deleted file: " << path << '\n';
        result.deleted.emplace_back(path);
        handled.emplace_back(path);
        break;
      case rm_t::missing:
        handled.emplace_back(path);
        break;
      case rm_t::failed:
        all_handled = false;
        break;
    }
  }
  result.skipped = false;

  try {
    if (all_handled) {
      store.delete_by_digest_except(digest, keep_path);
    } else {
      // files that failed to go stay indexed
      store.delete_by_paths(handled);
    }
  } catch (const storage_error &e) {
    oss(log_stream()) << "[err] " << e.what() << ", index not updated: "
                      << digest << '\n';
    result.index_error = e.what();
  }
  return result;
}

std::vector<resolution_t> resolve_all(index_store_t &store,
                                      const chooser_t &chooser) {
  std::vector<resolution_t> results;
  const auto dupes = list_dupes(store);
  results.reserve(dupes.size());
  for (const auto &[digest, paths] : dupes) {
    try {
      results.emplace_back(
          resolve_group(store, digest, paths, chooser(digest, paths)));
      continue;
    } catch (const invalid_selection &e) {
      oss(log_stream()) << "[warn] " << e.what() << ", skip group: " << digest
                        << '\n';
    } catch (const io_error &e) {
      oss(log_stream()) << "[err] " << e.what() << ", skip group: " << digest
                        << '\n';
    } catch (const storage_error &e) {
      oss(log_stream()) << "[err] " << e.what() << ", skip group: " << digest
                        << '\n';
    }
    auto &skipped = results.emplace_back();
    skipped.digest = digest;
  }
  return results;
}

}  // namespace detail_v1_0_0

}  // namespace dupidx
