#include "treemirror/log.hpp"

#include "treemirror/consts.hpp"
#include "treemirror/error.hpp"
#include "treemirror/util.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <vector>

namespace treemirror::log {

std::shared_ptr<spdlog::logger> make_logger(const LogOptions &options) {
  std::vector<spdlog::sink_ptr> sinks;

  if (options.console) {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(options.level);
    sinks.push_back(consoleSink);
  }

  if (options.file) {
    const auto &path = *options.file;
    if (path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec)
        throw ConfigurationError("cannot create log directory: " + ec.message(), path);
    }
    try {
      auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
      fileSink->set_level(options.level);
      sinks.push_back(fileSink);
    } catch (const spdlog::spdlog_ex &e) {
      throw ConfigurationError(e.what(), path);
    }
  }

  auto logger = std::make_shared<spdlog::logger>(std::string(consts::kLoggerName), sinks.begin(),
                                                 sinks.end());
  logger->set_pattern(std::string(consts::kLogPattern));
  logger->set_level(options.level);
  logger->flush_on(spdlog::level::info);
  return logger;
}

spdlog::level::level_enum parse_level(std::string_view name) {
  const std::string lower = strutil::to_lower(strutil::trim(name));
  if (lower == "warning")
    return spdlog::level::warn;
  const auto lvl = spdlog::level::from_str(lower);
  // from_str maps unknown names to off; only accept off when asked for
  if (lvl == spdlog::level::off && lower != "off")
    throw ConfigurationError("unknown log level: " + std::string(name));
  return lvl;
}

} // namespace treemirror::log
