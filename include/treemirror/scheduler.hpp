#pragma once
#include "treemirror/engine.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

#include <spdlog/logger.h>

namespace treemirror {

/**
 * Drives Engine::run_one_pass() forever, waiting `interval` after each pass.
 * An aborted pass is logged by the engine and simply retried next time
 * round; the loop only ends when `stop` is raised (or max_passes is hit).
 */
class Scheduler {
public:
  Scheduler(Engine &engine, std::chrono::milliseconds interval,
            std::shared_ptr<spdlog::logger> logger, const std::atomic<bool> &stop);

  // Run until stopped; max_passes == 0 means no limit. Returns passes run.
  std::size_t run(std::size_t max_passes = 0);

  // Outcome of the most recent pass
  [[nodiscard]] const PassReport &last_report() const { return last_; }

private:
  // Sleep in short slices so a stop request is seen promptly
  void wait_interval() const;

  Engine &engine_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<spdlog::logger> log_;
  const std::atomic<bool> &stop_;
  PassReport last_;
};

// Route SIGINT and SIGTERM to `flag` (set to true). One flag per process.
void install_stop_signals(std::atomic<bool> &flag);

} // namespace treemirror
