#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace treemirror::log {

struct LogOptions {
  std::optional<std::filesystem::path> file; // appended to, created if missing
  spdlog::level::level_enum level = spdlog::level::info;
  bool console = true;
};

// Build the sink the engine and scheduler write to. The logger is returned,
// not registered: whoever owns it passes it on explicitly.
std::shared_ptr<spdlog::logger> make_logger(const LogOptions &options);

// "trace", "debug", "info", "warn", "error", "critical", "off"
// Throws ConfigurationError for anything else.
spdlog::level::level_enum parse_level(std::string_view name);

} // namespace treemirror::log
