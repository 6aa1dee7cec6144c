#include "treemirror/engine.hpp"

#include "treemirror/error.hpp"
#include "treemirror/fs.hpp"
#include "treemirror/mirror.hpp"
#include "treemirror/reconcile.hpp"
#include "treemirror/remover.hpp"

#include <unordered_set>

namespace treemirror {

using Clock = std::chrono::steady_clock;

namespace {

std::filesystem::path under(const std::filesystem::path &root, const std::filesystem::path &rel) {
  return rel.empty() ? root : root / rel;
}

std::string join_rel(const std::filesystem::path &dir, const std::string &name) {
  return dir.empty() ? name : (dir / name).generic_string();
}

} // namespace

Engine::Engine(Config config, std::shared_ptr<spdlog::logger> logger,
               const std::atomic<bool> *stop)
    : config_(std::move(config)), log_(std::move(logger)), stop_(stop) {
  if (!log_)
    throw ConfigurationError("engine needs a logger");
}

bool Engine::stop_requested() const {
  return stop_ != nullptr && stop_->load(std::memory_order_relaxed);
}

void Engine::abort_pass(PassReport &report, std::string reason) const {
  report.outcome = PassOutcome::Aborted;
  report.error = std::move(reason);
}

PassReport Engine::run_one_pass() {
  PassReport report;
  const auto started = Clock::now();
  log_->info("Synchronization started");

  try {
    TreeWalker walker{config_.source};
    while (auto visit = walker.next()) {
      if (stop_requested()) {
        abort_pass(report, "cancelled");
        log_->warn("Synchronization cancelled");
        break;
      }
      process(*visit, report);
    }
  } catch (const Error &e) {
    abort_pass(report, e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    abort_pass(report, e.what());
  } catch (const std::exception &e) {
    // digest backend or allocation failure
    abort_pass(report, e.what());
  }

  report.elapsed = Clock::now() - started;
  if (report.complete()) {
    log_->info("Synchronization complete: {} created, {} updated, {} deleted, {} unchanged",
               report.directories_created + report.files_created, report.files_updated,
               report.entries_deleted, report.files_unchanged);
  } else if (report.error != "cancelled") {
    log_->error("Synchronization failed: {}", report.error);
  }
  log_->debug("Pass took {} ms, {} bytes copied",
              std::chrono::duration_cast<std::chrono::milliseconds>(report.elapsed).count(),
              report.bytes_copied);
  return report;
}

void Engine::process(const DirectoryVisit &visit, PassReport &report) {
  const auto source_dir = under(config_.source, visit.relative);
  const auto replica_dir = under(config_.replica, visit.relative);

  // 1) mirror: the directory must exist before anything happens inside it
  if (ensure_directory(config_.replica, visit.relative)) {
    ++report.directories_created;
    log_->info("Created directory: {}", replica_dir.string());
  }
  for (const auto &name : visit.skipped)
    log_->debug("Skipped (not a regular file or directory): {}", (source_dir / name).string());

  // 2) remove stale children before files are written next to them
  const SourceNames names{visit};
  for (const auto &stale : find_stale(replica_dir, names)) {
    remove_stale(replica_dir, stale);
    ++report.entries_deleted;
    log_->info("Deleted: {}", (replica_dir / stale.name).string());
  }

  // 3) reconcile file content
  for (const auto &name : visit.files) {
    const auto src = source_dir / name;
    const auto dst = replica_dir / name;
    const auto result = reconcile_file(src, dst, config_.fingerprint);
    report.bytes_copied += result.bytes;
    switch (result.decision) {
    case Decision::Create:
      ++report.files_created;
      log_->info("Created: {}", dst.string());
      break;
    case Decision::Update:
      ++report.files_updated;
      log_->info("Updated: {} -> {}", src.string(), dst.string());
      break;
    case Decision::Unchanged:
      ++report.files_unchanged;
      log_->debug("Unchanged: {}", dst.string());
      break;
    case Decision::Delete:
      break;
    }
  }
}

std::vector<PlannedChange> Engine::plan() const {
  std::vector<PlannedChange> out;
  TreeWalker walker{config_.source};
  while (auto visit = walker.next()) {
    const auto source_dir = under(config_.source, visit->relative);
    const auto replica_dir = under(config_.replica, visit->relative);

    if (const auto type = fs::entry_type(replica_dir); type != fs::EntryType::Directory) {
      // non-directories below the root were already planned as Delete by the parent
      if (visit->relative.empty() && type != fs::EntryType::Missing)
        throw StructureError("ensure directory", replica_dir, "exists but is not a directory");
      out.push_back({.decision = Decision::Create,
                     .kind = EntryKind::Directory,
                     .path = visit->relative.empty() ? "." : visit->relative.generic_string()});
      for (const auto &name : visit->files)
        out.push_back({.decision = Decision::Create,
                       .kind = EntryKind::File,
                       .path = join_rel(visit->relative, name)});
      continue;
    }

    std::unordered_set<std::string> doomed;
    for (const auto &stale : find_stale(replica_dir, SourceNames{*visit})) {
      out.push_back({.decision = Decision::Delete,
                     .kind = stale.type == fs::EntryType::Directory ? EntryKind::Directory
                                                                     : EntryKind::File,
                     .path = join_rel(visit->relative, stale.name)});
      doomed.insert(stale.name);
    }

    for (const auto &name : visit->files) {
      const auto d = doomed.contains(name)
                         ? Decision::Create
                         : classify_file(source_dir / name, replica_dir / name, config_.fingerprint);
      if (d != Decision::Unchanged)
        out.push_back({.decision = d, .kind = EntryKind::File, .path = join_rel(visit->relative, name)});
    }
  }
  return out;
}

} // namespace treemirror
