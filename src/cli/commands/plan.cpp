#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "treemirror/engine.hpp"
#include "treemirror/error.hpp"
#include "treemirror/log.hpp"

#include <iostream>

using treemirror::cli::Field;

int cmd_plan(int argc, char **argv) {
  try {
    const auto cl = treemirror::cli::parse_command_line(argc, argv);
    const auto settings = treemirror::cli::resolve_settings(cl, {Field::Source, Field::Replica});

    // dry run: nothing to log, the listing is the output
    const treemirror::Engine engine{treemirror::validate(settings),
                                    treemirror::log::make_logger({.console = false})};
    const auto changes = engine.plan();

    std::cout << "Changes to apply to " << engine.config().replica.string() << ":\n";
    for (const auto &[decision, kind, path] : changes) {
      const bool dir = kind == treemirror::EntryKind::Directory;
      std::cout << "  " << treemirror::status_code(decision) << "  " << path << (dir ? "/" : "")
                << "\n";
    }
    if (changes.empty())
      std::cout << "  (none)\n";
    return 0;
  } catch (const treemirror::ConfigurationError &e) {
    std::cerr << "plan: " << e.what() << "\n";
    treemirror::cli::print_command_usage("plan", std::cerr);
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "plan: " << e.what() << "\n";
    return 1;
  }
}
