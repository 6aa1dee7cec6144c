#include "treemirror/config.hpp"

#include "treemirror/error.hpp"
#include "treemirror/util.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <string_view>

namespace {

namespace sfs = std::filesystem;

// Does `inner` lie at or below `outer`? Both must be normalised.
bool is_within(const sfs::path &inner, const sfs::path &outer) {
  return std::mismatch(outer.begin(), outer.end(), inner.begin(), inner.end()).first == outer.end();
}

sfs::path normalise(const sfs::path &p) {
  std::error_code ec;
  auto abs = sfs::weakly_canonical(sfs::absolute(p), ec);
  if (ec)
    throw treemirror::ConfigurationError("cannot resolve path: " + ec.message(), p);
  abs = abs.lexically_normal();
  // drop the trailing separator so "/a/b/" and "/a/b" compare equal
  if (!abs.has_filename() && abs.has_relative_path())
    abs = abs.parent_path();
  return abs;
}

long parse_interval(std::string_view sv) {
  long v = 0;
  const auto *first = sv.data();
  const auto *last = sv.data() + sv.size();
  auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc{} || ptr != last)
    throw treemirror::ConfigurationError("interval is not a whole number of seconds: " +
                                         std::string(sv));
  return v;
}

} // namespace

namespace treemirror {

auto load_settings(const std::filesystem::path &file, Settings base) -> Settings {
  std::ifstream in(file);
  if (!in)
    throw ConfigurationError("cannot open settings file", file);

  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const std::string trimmed = strutil::trim(line);
    std::string_view sv{trimmed};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments

    auto value = [&](std::string_view key) { return strutil::trim(sv.substr(key.size())); };
    if (strutil::starts_with_icase(sv, consts::kKeySource)) {
      base.source = value(consts::kKeySource);
    } else if (strutil::starts_with_icase(sv, consts::kKeyReplica)) {
      base.replica = value(consts::kKeyReplica);
    } else if (strutil::starts_with_icase(sv, consts::kKeyLogFile)) {
      const auto v = value(consts::kKeyLogFile);
      if (v.empty())
        base.log_file.reset();
      else
        base.log_file = v;
    } else if (strutil::starts_with_icase(sv, consts::kKeyInterval)) {
      base.interval = parse_interval(value(consts::kKeyInterval));
    } else if (strutil::starts_with_icase(sv, consts::kKeyAlgorithm)) {
      base.algorithm = value(consts::kKeyAlgorithm);
    } else if (strutil::starts_with_icase(sv, consts::kKeyLogLevel)) {
      base.log_level = value(consts::kKeyLogLevel);
    } else {
      throw ConfigurationError("line " + std::to_string(lineno) + ": unknown setting: " + trimmed,
                               file);
    }
  }
  if (in.bad())
    throw ConfigurationError("cannot read settings file", file);
  return base;
}

Config validate(const Settings &settings) {
  if (settings.source.empty())
    throw ConfigurationError("source path is required");
  if (settings.replica.empty())
    throw ConfigurationError("replica path is required");

  const auto source = normalise(settings.source);
  const auto replica = normalise(settings.replica);

  std::error_code ec;
  if (!sfs::is_directory(source, ec))
    throw ConfigurationError("source is not an existing directory", source);
  if (sfs::exists(replica, ec) && !sfs::is_directory(replica, ec))
    throw ConfigurationError("replica exists but is not a directory", replica);

  if (source == replica)
    throw ConfigurationError("source and replica are the same directory", source);
  if (is_within(replica, source))
    throw ConfigurationError("replica lies inside the source tree", replica);
  if (is_within(source, replica))
    throw ConfigurationError("source lies inside the replica tree", source);

  return Config{.source = source,
                .replica = replica,
                .fingerprint = FingerprintFunction::create(settings.algorithm)};
}

void validate_schedule(const Settings &settings) {
  if (settings.interval <= 0 || settings.interval > consts::kMaxIntervalSeconds)
    throw ConfigurationError("interval must be between 1 and " +
                             std::to_string(consts::kMaxIntervalSeconds) + " seconds, got " +
                             std::to_string(settings.interval));
}

} // namespace treemirror
