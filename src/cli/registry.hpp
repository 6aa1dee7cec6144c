#pragma once
#include <iosfwd>
#include <string>
#include "cli/command.hpp"

namespace treemirror::cli {

struct CommandInfo {
  command_fn fn;
  std::string args;    // argument synopsis, e.g. "<source> <replica>"
  std::string summary; // one line for the command list
};

void register_command(const std::string& name, CommandInfo info);
// nullptr for unknown names
const CommandInfo* find_command(const std::string& name);

void print_usage(std::ostream& os);
void print_command_usage(const std::string& name, std::ostream& os);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace treemirror::cli
