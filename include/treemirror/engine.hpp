#pragma once
#include "treemirror/config.hpp"
#include "treemirror/decision.hpp"
#include "treemirror/walker.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace treemirror {

enum class PassOutcome : std::uint8_t { Complete, Aborted };

struct PassReport {
  PassOutcome outcome = PassOutcome::Complete;
  std::size_t directories_created = 0;
  std::size_t files_created = 0;
  std::size_t files_updated = 0;
  std::size_t entries_deleted = 0;
  std::size_t files_unchanged = 0;
  std::uintmax_t bytes_copied = 0;
  std::string error; // set when Aborted
  std::chrono::steady_clock::duration elapsed{};

  [[nodiscard]] bool complete() const { return outcome == PassOutcome::Complete; }

  // Filesystem changes made by the pass; 0 means the replica was already converged
  [[nodiscard]] auto mutations() const -> std::size_t {
    return directories_created + files_created + files_updated + entries_deleted;
  }
};

/**
 * One-way mirror of config.source onto config.replica.
 *
 * Each pass is a fresh full comparison: the source is walked top-down and,
 * per directory, the replica directory is ensured, stale replica children
 * are removed, then every source file is created/updated/left alone based
 * on its fingerprint. Nothing is remembered between passes.
 */
class Engine {
public:
  // `stop` is polled between directories; when it reads true the pass ends as Aborted.
  Engine(Config config, std::shared_ptr<spdlog::logger> logger,
         const std::atomic<bool> *stop = nullptr);

  // Never throws for filesystem trouble: the first error aborts the pass,
  // is logged, and comes back in the report.
  PassReport run_one_pass();

  // What run_one_pass would change right now, in the order it would do it.
  // Unchanged files are left out. Throws treemirror::Error.
  [[nodiscard]] auto plan() const -> std::vector<PlannedChange>;

  [[nodiscard]] const Config &config() const { return config_; }

private:
  void process(const DirectoryVisit &visit, PassReport &report);
  void abort_pass(PassReport &report, std::string reason) const;
  [[nodiscard]] bool stop_requested() const;

  Config config_;
  std::shared_ptr<spdlog::logger> log_;
  const std::atomic<bool> *stop_;
};

} // namespace treemirror
