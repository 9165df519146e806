#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "dupidx/config.hh"
#include "dupidx/error.hh"
#include "dupidx/fingerprint.hh"
#include "dupidx/index_store.hh"
#include "dupidx/list_dupes.hh"
#include "dupidx/log.hh"
#include "dupidx/maintenance.hh"
#include "dupidx/parse_size.hh"
#include "dupidx/resolve.hh"
#include "dupidx/scan.hh"

using namespace std::literals;

namespace {

constexpr auto usage =
    "usage: dupidx [-d/--db index] [-a/--algo digest] [-j jobs] "
    "[-l/--log log_file] [-h/--help] <command> [<args>]\n"
    "\n"
    "commands:\n"
    "  create-db                         create or initialize the index\n"
    "  find-duplicates <dir> <ext...>    index files and print duplicates\n"
    "  find-by-date <start> [--end_date end]\n"
    "                                    indexed files by modification time\n"
    "  find-large-files <size>           indexed files larger than size\n"
    "  clean-old-files <timestamp>       delete files modified before\n"
    "  delete-duplicates-interactive     keep one file per duplicate group\n"
    "  stats                             statistics of the index\n"
    "  show-duplicates                   duplicates stored in the index\n";

int64_t parse_int(std::string_view str, std::string_view what) {
  int64_t val = 0;
  const auto [ptr, ec] =
      std::from_chars(str.data(), str.data() + str.size(), val);
  if (ec != std::errc() || ptr != str.data() + str.size()) {
    throw std::invalid_argument("invalid " + std::string(what) + ": " +
                                std::string(str));
  }
  return val;
}

void print_dupes(const dupidx::dupe_map_t &dupes) {
  for (const auto &[digest, paths] : dupes) {
    std::cout << "Duplicate files for hash " << digest << ":\n";
    for (const auto &path : paths) {
      std::cout << " - " << path << '\n';
    }
  }
}

std::optional<std::size_t> choose_on_console(
    const std::string &digest, const std::vector<std::string> &paths) {
  std::cout << "\nDuplicate files for hash " << digest << ":\n";
  for (std::size_t i = 0; i < paths.size(); ++i) {
    std::cout << i + 1 << ". " << paths[i] << '\n';
  }
  std::cout << "Enter the number of the file you want to KEEP (others will be "
               "deleted) press [ENTER] to skip: "
            << std::flush;
  std::string line;
  if (!std::getline(std::cin, line) ||
      line.find_first_not_of(" \t\r") == std::string::npos) {
    return std::nullopt;
  }
  return dupidx::parse_selection(line, paths.size());
}

int run(const dupidx::config_t &config, const std::vector<std::string> &args,
        const std::optional<int64_t> end_date) {
  const auto &command = args[0];
  const auto arg_cnt = args.size() - 1;
  const auto require = [&](const bool ok) {
    if (!ok) {
      throw std::invalid_argument("wrong arguments for " + command);
    }
  };

  if (command == "create-db"sv) {
    require(arg_cnt == 0);
    dupidx::index_store_t store(config.db_path);
    std::cout << "Index ready: " << config.db_path.string() << '\n';

  } else if (command == "find-duplicates"sv) {
    require(arg_cnt >= 2);
    dupidx::fingerprinter_t fingerprinter(config.hash_algo);
    dupidx::index_store_t store(config.db_path);
    const std::vector<std::string> ext_filters(args.begin() + 2, args.end());
    print_dupes(dupidx::scan(store, fingerprinter, args[1], ext_filters,
                             config.max_thread));

  } else if (command == "find-by-date"sv) {
    require(arg_cnt == 1);
    const auto start = parse_int(args[1], "timestamp");
    dupidx::index_store_t store(config.db_path);
    for (const auto &path : dupidx::find_by_date(store, start, end_date)) {
      std::cout << path << '\n';
    }

  } else if (command == "find-large-files"sv) {
    require(arg_cnt == 1);
    const auto threshold = dupidx::parse_size(args[1]);
    dupidx::index_store_t store(config.db_path);
    for (const auto &file :
         dupidx::find_large_files_detailed(store, threshold)) {
      std::cout << "File: " << file.path << ", Size: " << file.size
                << " bytes, Last Modified: " << file.modified << '\n';
    }

  } else if (command == "clean-old-files"sv) {
    require(arg_cnt == 1);
    const auto threshold = parse_int(args[1], "timestamp");
    dupidx::index_store_t store(config.db_path);
    for (const auto &path : dupidx::clean_old_files(store, threshold)) {
      std::cout << "Cleaned (deleted) file: " << path << '\n';
    }

  } else if (command == "delete-duplicates-interactive"sv) {
    require(arg_cnt == 0);
    dupidx::index_store_t store(config.db_path);
    if (dupidx::list_dupes(store).empty()) {
      std::cout << "No duplicates found.\n";
      return 0;
    }
    std::size_t deleted_cnt = 0;
    std::size_t skipped_cnt = 0;
    std::size_t failed_cnt = 0;
    for (const auto &result : dupidx::resolve_all(store, choose_on_console)) {
      if (result.skipped) {
        std::cout << "Skipping these files.\n";
        ++skipped_cnt;
      }
      for (const auto &path : result.deleted) {
        std::cout << "Deleted file: " << path << '\n';
        ++deleted_cnt;
      }
      if (!result.index_error.empty()) {
        std::cout << "Index not updated for group " << result.digest << ": "
                  << result.index_error << '\n';
        ++failed_cnt;
      }
    }
    std::cout << "deleted: " << deleted_cnt
              << ", skipped groups: " << skipped_cnt << '\n';
    if (failed_cnt != 0) {
      std::cout << "index update failed for " << failed_cnt
                << " group(s), run delete-duplicates-interactive again\n";
      return 1;
    }

  } else if (command == "stats"sv) {
    require(arg_cnt == 0);
    dupidx::index_store_t store(config.db_path);
    const auto stats = dupidx::stats(store);
    std::cout << "total_files: " << stats.total_files << '\n'
              << "unique_file_types: " << stats.unique_kinds << '\n'
              << "file_type_distribution: {";
    auto sep = ""sv;
    for (const auto &[kind, count] : stats.kind_distribution) {
      std::cout << sep << kind << ": " << count;
      sep = ", "sv;
    }
    std::cout << "}\n"
              << "total_size: ";
    if (stats.total_size) {
      std::cout << *stats.total_size << '\n';
    } else {
      std::cout << "none\n";
    }

  } else if (command == "show-duplicates"sv) {
    require(arg_cnt == 0);
    dupidx::index_store_t store(config.db_path);
    print_dupes(dupidx::list_dupes(store));

  } else {
    std::cerr << "unknown command: " << command << '\n' << usage;
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
  dupidx::config_t config;
  std::vector<std::string> args;
  std::optional<int64_t> end_date;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string_view arg = argv[i];
      const auto next = [&]() -> std::string_view {
        ++i;
        if (i >= argc) {
          throw std::invalid_argument("missing value for " + std::string(arg));
        }
        return argv[i];
      };
      if (arg == "-d"sv || arg == "--db"sv) {
        config.db_path = next();
      } else if (arg == "-a"sv || arg == "--algo"sv) {
        config.hash_algo = next();
      } else if (arg == "-j"sv) {
        const auto jobs = parse_int(next(), "jobs");
        if (jobs <= 0 || jobs > dupidx::max_jobs) {
          std::cerr << "jobs must be > 0 and <= " << dupidx::max_jobs
                    << std::endl;
          return 1;
        }
        config.max_thread = (uint32_t)jobs;
      } else if (arg == "-l"sv || arg == "--log"sv) {
        config.log_path = next();
      } else if (arg == "--end_date"sv) {
        end_date = parse_int(next(), "timestamp");
      } else if (arg == "-h"sv || arg == "--help"sv) {
        std::cout << usage;
        return 0;
      } else {
        args.emplace_back(arg);
      }
    }
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << '\n' << usage;
    return 1;
  }

  if (args.empty()) {
    std::cout << usage;
    return 0;
  }

  try {
    if (!config.log_path.empty()) {
      dupidx::open_log(config.log_path);
    }
    const auto ret = run(config, args, end_date);
    dupidx::close_log();
    return ret;
  } catch (const dupidx::storage_error &e) {
    dupidx::oss(dupidx::log_stream()) << "[err] " << e.what() << '\n';
  } catch (const dupidx::io_error &e) {
    dupidx::oss(dupidx::log_stream()) << "[err] " << e.what() << '\n';
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << '\n' << usage;
  } catch (const std::out_of_range &e) {
    std::cerr << e.what() << '\n';
  }
  dupidx::close_log();
  return 1;
}
