#include "cli/options.hpp"

#include "treemirror/error.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using treemirror::cli::Field;

// argv-style view over a list of strings; argv[0] is the subcommand
struct Args {
  std::vector<std::string> store;
  std::vector<char *> ptrs;
  explicit Args(std::vector<std::string> xs) : store(std::move(xs)) {
    for (auto &s : store)
      ptrs.push_back(s.data());
  }
  int argc() const { return static_cast<int>(ptrs.size()); }
  char **argv() { return ptrs.data(); }
};

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("treemirror_cli_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  const std::vector<Field> sync_order = {Field::Source, Field::Replica, Field::LogFile,
                                         Field::Interval, Field::Algorithm};

  try {
    // Positional form of the periodic command
    {
      Args a{{"sync", "/src", "/dst", "/var/log/m.log", "30", "sha1"}};
      const auto s = treemirror::cli::resolve_settings(
          treemirror::cli::parse_command_line(a.argc(), a.argv()), sync_order);
      if (s.source != "/src" || s.replica != "/dst" || s.log_file != fs::path("/var/log/m.log") ||
          s.interval != 30 || s.algorithm != "sha1") {
        std::cerr << "positional sync arguments misread\n";
        return 1;
      }
    }

    // Settings file < positionals < flags
    {
      std::ofstream(root / "m.conf") << "source: /from-file\nreplica: /file-dst\ninterval: 7\n"
                                        "algorithm: md5\n";
      Args a{{"once", "--config", (root / "m.conf").string(), "/cli-src", "-a", "sha512",
              "--log-level", "debug"}};
      const auto s = treemirror::cli::resolve_settings(
          treemirror::cli::parse_command_line(a.argc(), a.argv()), {Field::Source, Field::Replica});
      if (s.source != "/cli-src" || s.replica != "/file-dst" || s.interval != 7 ||
          s.algorithm != "sha512" || s.log_level != "debug") {
        std::cerr << "precedence wrong\n";
        return 1;
      }
    }

    // Errors: unknown flag, dangling flag, too many positionals, bad interval
    auto throws = [](std::vector<std::string> xs, const std::vector<Field> &order) {
      Args a{std::move(xs)};
      try {
        (void)treemirror::cli::resolve_settings(
            treemirror::cli::parse_command_line(a.argc(), a.argv()), order);
      } catch (const treemirror::ConfigurationError &) {
        return true;
      }
      return false;
    };
    if (!throws({"once", "--frobnicate"}, {Field::Source}) ||
        !throws({"once", "/a", "--algorithm"}, {Field::Source}) ||
        !throws({"once", "/a", "/b", "/c"}, {Field::Source, Field::Replica}) ||
        !throws({"sync", "/a", "/b", "/l", "5m"}, sync_order)) {
      std::cerr << "bad command line accepted\n";
      return 1;
    }

    std::cout << "cli options OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
