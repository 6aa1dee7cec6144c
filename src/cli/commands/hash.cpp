#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "treemirror/error.hpp"
#include "treemirror/fingerprint.hpp"

#include <iostream>

int cmd_hash(int argc, char **argv) {
  try {
    const auto cl = treemirror::cli::parse_command_line(argc, argv);
    if (cl.positionals.empty()) {
      treemirror::cli::print_command_usage("hash", std::cerr);
      return 2;
    }
    const auto settings = cl.config ? treemirror::load_settings(*cl.config) : treemirror::Settings{};
    const auto fn =
        treemirror::FingerprintFunction::create(cl.algorithm ? *cl.algorithm : settings.algorithm);
    for (const auto &p : cl.positionals)
      std::cout << treemirror::to_hex(fn.file(p)) << "  " << p << "\n";
    return 0;
  } catch (const treemirror::ConfigurationError &e) {
    std::cerr << "hash: " << e.what() << "\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "hash: " << e.what() << "\n";
    return 1;
  }
}
