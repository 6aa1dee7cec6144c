#include "cli/options.hpp"
#include "cli/registry.hpp"

#include "treemirror/engine.hpp"
#include "treemirror/error.hpp"
#include "treemirror/log.hpp"
#include "treemirror/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <iostream>

using treemirror::cli::Field;

int cmd_sync(int argc, char **argv) {
  static std::atomic<bool> stop{false};

  std::shared_ptr<spdlog::logger> logger;
  try {
    const auto cl = treemirror::cli::parse_command_line(argc, argv);
    const auto settings = treemirror::cli::resolve_settings(
        cl, {Field::Source, Field::Replica, Field::LogFile, Field::Interval, Field::Algorithm});
    treemirror::validate_schedule(settings);
    logger = treemirror::log::make_logger(
        {.file = settings.log_file, .level = treemirror::log::parse_level(settings.log_level)});

    auto config = treemirror::validate(settings);
    logger->info("Mirroring {} -> {} every {}s using {}", config.source.string(),
                 config.replica.string(), settings.interval, config.fingerprint.name());

    treemirror::Engine engine{std::move(config), logger, &stop};
    treemirror::install_stop_signals(stop);
    treemirror::Scheduler scheduler{engine, std::chrono::seconds(settings.interval), logger, stop};
    scheduler.run();
    return 0;
  } catch (const treemirror::ConfigurationError &e) {
    if (logger)
      logger->error("{}", e.what());
    std::cerr << "sync: " << e.what() << "\n";
    treemirror::cli::print_command_usage("sync", std::cerr);
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "sync: " << e.what() << "\n";
    return 1;
  }
}
