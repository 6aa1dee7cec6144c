#pragma once
#include "treemirror/config.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace treemirror::cli {

// Settings a positional argument may fill, in command-specific order
enum class Field : std::uint8_t { Source, Replica, LogFile, Interval, Algorithm };

struct CommandLine {
  std::optional<std::filesystem::path> config;
  std::optional<std::string> algorithm;
  std::optional<std::string> interval;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::vector<std::string> positionals;
};

// Split argv (argv[0] = subcommand) into flags and positionals.
// Throws ConfigurationError on an unknown flag or a flag without its value.
CommandLine parse_command_line(int argc, char **argv);

// Settings file first, then positionals in `order`, then flags.
// Throws ConfigurationError if there are more positionals than `order` names.
Settings resolve_settings(const CommandLine &cl, const std::vector<Field> &order);

} // namespace treemirror::cli
