#include "cli/options.hpp"

#include "treemirror/error.hpp"

#include <charconv>
#include <string_view>

namespace treemirror::cli {

static long to_seconds(const std::string &s) {
  long v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    throw ConfigurationError("interval is not a whole number of seconds: " + s);
  return v;
}

CommandLine parse_command_line(int argc, char **argv) {
  CommandLine cl;
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc)
        throw ConfigurationError("missing value for " + std::string(a));
      return argv[++i];
    };
    if (a == "--config" || a == "-c") {
      cl.config = value();
    } else if (a == "--algorithm" || a == "-a") {
      cl.algorithm = value();
    } else if (a == "--interval" || a == "-i") {
      cl.interval = value();
    } else if (a == "--log" || a == "-l") {
      cl.log_file = value();
    } else if (a == "--log-level") {
      cl.log_level = value();
    } else if (a.size() > 1 && a[0] == '-') {
      throw ConfigurationError("unknown option: " + std::string(a));
    } else {
      cl.positionals.emplace_back(a);
    }
  }
  return cl;
}

Settings resolve_settings(const CommandLine &cl, const std::vector<Field> &order) {
  Settings s = cl.config ? load_settings(*cl.config) : Settings{};

  if (cl.positionals.size() > order.size())
    throw ConfigurationError("too many arguments (expected at most " +
                             std::to_string(order.size()) + ")");
  for (std::size_t i = 0; i < cl.positionals.size(); ++i) {
    const auto &v = cl.positionals[i];
    switch (order[i]) {
    case Field::Source:
      s.source = v;
      break;
    case Field::Replica:
      s.replica = v;
      break;
    case Field::LogFile:
      s.log_file = v;
      break;
    case Field::Interval:
      s.interval = to_seconds(v);
      break;
    case Field::Algorithm:
      s.algorithm = v;
      break;
    }
  }

  if (cl.algorithm)
    s.algorithm = *cl.algorithm;
  if (cl.interval)
    s.interval = to_seconds(*cl.interval);
  if (cl.log_file)
    s.log_file = *cl.log_file;
  if (cl.log_level)
    s.log_level = *cl.log_level;
  return s;
}

} // namespace treemirror::cli
