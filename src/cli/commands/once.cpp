#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "treemirror/engine.hpp"
#include "treemirror/error.hpp"
#include "treemirror/log.hpp"

#include <iostream>

using treemirror::cli::Field;

int cmd_once(int argc, char **argv) {
  try {
    const auto cl = treemirror::cli::parse_command_line(argc, argv);
    const auto settings = treemirror::cli::resolve_settings(cl, {Field::Source, Field::Replica});
    auto logger = treemirror::log::make_logger(
        {.file = settings.log_file, .level = treemirror::log::parse_level(settings.log_level)});

    treemirror::Engine engine{treemirror::validate(settings), logger};
    const auto report = engine.run_one_pass();
    return report.complete() ? 0 : 1;
  } catch (const treemirror::ConfigurationError &e) {
    std::cerr << "once: " << e.what() << "\n";
    treemirror::cli::print_command_usage("once", std::cerr);
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "once: " << e.what() << "\n";
    return 1;
  }
}
