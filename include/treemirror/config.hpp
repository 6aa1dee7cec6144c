#pragma once
#include "treemirror/consts.hpp"
#include "treemirror/fingerprint.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace treemirror {

// Raw options as gathered from a settings file and the command line
struct Settings {
  std::filesystem::path source;
  std::filesystem::path replica;
  std::optional<std::filesystem::path> log_file;
  long interval = consts::kDefaultIntervalSeconds; // seconds between passes
  std::string algorithm{consts::kDefaultAlgorithm};
  std::string log_level{consts::kDefaultLogLevel};
};

// Immutable per-run record the engine works from
struct Config {
  std::filesystem::path source;  // absolute, existing directory
  std::filesystem::path replica; // absolute; created on the first pass if missing
  FingerprintFunction fingerprint;
};

// Read `key: value` lines from a settings file over `base`.
// Keys: source, replica, log_file, interval, algorithm, log_level; '#' starts a comment.
// Throws ConfigurationError if the file is unreadable or a line is malformed.
Settings load_settings(const std::filesystem::path& file, Settings base = {});

// Check paths and algorithm and freeze them into a Config.
// Throws ConfigurationError; nothing may run when this fails.
Config validate(const Settings& settings);

// Additional checks for the periodic loop (0 < interval <= kMaxIntervalSeconds)
void validate_schedule(const Settings& settings);

} // namespace treemirror
