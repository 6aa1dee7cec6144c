#include "cli/registry.hpp"

#include <iostream>
#include <string>

namespace cli = treemirror::cli;

int main(int argc, char **argv) {
  cli::register_all_commands();

  if (argc < 2) {
    cli::print_usage(std::cerr);
    return 2;
  }
  const std::string cmd = argv[1];

  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    if (argc > 2)
      cli::print_command_usage(argv[2], std::cout);
    else
      cli::print_usage(std::cout);
    return 0;
  }

  const auto *info = cli::find_command(cmd);
  if (info == nullptr) {
    std::cerr << "unknown command: " << cmd << "\n";
    cli::print_usage(std::cerr);
    return 2;
  }
  // argv[0] of the handler is the command name
  return info->fn(argc - 1, argv + 1);
}
